#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "PageFetcher.h"
#include "models/AuditConfig.h"
#include "../../include/seo_audit/crawler/models/CrawlPolicy.h"
#include "../../include/seo_audit/crawler/models/PageRecord.h"

namespace seo_audit::crawler {

struct SeedUrl {
    std::string url;  // normalized
    DiscoverySource source = DiscoverySource::SEED;
};

struct PolicyResolution {
    CrawlPolicy policy;
    // Root first, then sitemap URLs in document order
    std::vector<SeedUrl> seeds;
    // Normalized same-site URLs declared by any sitemap (root included if listed)
    std::set<std::string> sitemapUrls;
    // Sitemap documents that were fetched and parsed
    std::vector<std::string> sitemapDocuments;
    std::vector<std::string> warnings;
    std::chrono::milliseconds crawlDelay{0};
};

// Loads robots.txt and sitemaps for the root URL and turns them into a crawl
// policy plus seeds. Every failure here is recovered with a warning.
class PolicyResolver {
public:
    using TimePoint = std::chrono::steady_clock::time_point;
    using Clock = std::function<TimePoint()>;

    PolicyResolver(PageFetcher& fetcher, const AuditConfig& config, Clock clock = {});

    // rootUrl must be normalized. No document is requested once the deadline
    // has passed, and each one gets at most the time left before it.
    PolicyResolution resolve(const std::string& rootUrl, TimePoint deadline = TimePoint::max());

private:
    struct SitemapTask {
        std::string url;
        bool probing = false;
    };

    CrawlPolicy loadPolicy(const std::string& origin, PolicyResolution& resolution);
    void collectSitemaps(const std::string& origin,
                         const std::string& targetHost,
                         const std::vector<std::string>& declared,
                         PolicyResolution& resolution);
    bool processSitemap(const SitemapTask& task,
                        const std::string& targetHost,
                        std::vector<SitemapTask>& queue,
                        PolicyResolution& resolution);
    // Timeout for the next document, nullopt when the deadline has passed
    std::optional<std::chrono::milliseconds> documentTimeout() const;
    void warn(PolicyResolution& resolution, const std::string& message);

    PageFetcher& fetcher;
    AuditConfig config;
    Clock clock;
    TimePoint deadline = TimePoint::max();
};

} // namespace seo_audit::crawler
