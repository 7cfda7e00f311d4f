#pragma once

#include <string>
#include <chrono>
#include <set>

namespace seo_audit::crawler {

struct AuditConfig {
    // === CRAWL SCOPE ===

    // Maximum number of pages to fetch (page budget)
    size_t maxPages = 500;

    // Maximum link depth from the seeds, seeds are depth 0
    size_t maxDepth = 5;

    // Wall-clock budget for the whole run, resolve phase included
    std::chrono::milliseconds wallClockBudget{300000};

    // Whether to respect robots.txt
    bool respectRobotsTxt = true;

    // Upper bound on sitemap documents fetched (index files included)
    size_t maxSitemaps = 10;

    // Upper bound on URLs collected from all sitemaps
    size_t maxSitemapUrls = 5000;

    // === FETCHING ===

    // User agent string to use in requests
    std::string userAgent = "SeoAuditBot/1.0";

    // Width of the fetch worker pool
    size_t maxConcurrentConnections = 5;

    // Minimum delay between two dispatches to the same host.
    // robots.txt Crawl-delay raises it, never lowers it.
    std::chrono::milliseconds politenessDelay{1000};

    std::chrono::milliseconds connectTimeout{10000};

    // Timeout of the first attempt
    std::chrono::milliseconds requestTimeout{10000};

    // Timeout of the escalated retry attempt
    std::chrono::milliseconds retryTimeout{30000};

    // Timeout used for robots.txt and sitemap documents
    std::chrono::milliseconds robotsTimeout{10000};

    // Maximum number of redirects to follow
    size_t maxRedirects = 5;

    bool verifySSL = true;

    // === RETRY CONFIGURATION ===

    // Retries after the first attempt
    int maxRetries = 1;

    std::chrono::milliseconds baseRetryDelay{500};

    float backoffMultiplier = 2.0f;

    std::chrono::milliseconds maxRetryDelay{5000};

    // HTTP status codes that should trigger a retry
    std::set<int> retryableHttpCodes = {
        408, // Request Timeout
        429, // Too Many Requests
        500, // Internal Server Error
        502, // Bad Gateway
        503, // Service Unavailable
        504  // Gateway Timeout
    };

    // === INSIGHT THRESHOLDS ===

    // Pages whose body is smaller than this are thin
    size_t thinContentBytes = 1500;

    // Visible text below this is treated as an empty shell
    size_t minTextLength = 200;

    // More scripts than this on a near-empty page suggests client-side rendering
    size_t csrScriptThreshold = 20;

    size_t maxUrlLength = 100;

    // Path segments
    size_t maxUrlPathDepth = 5;

    // Clicks from the root page
    size_t maxClickDepth = 4;

    // Internal edges per fetched page
    double minInternalLinksPerPage = 2.0;
};

} // namespace seo_audit::crawler
