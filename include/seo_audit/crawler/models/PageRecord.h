#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include "FetchFailure.h"

namespace seo_audit::crawler {

enum class DiscoverySource {
    SEED,
    SITEMAP,
    LINK
};

std::string toString(DiscoverySource source);

// Everything learned about one normalized URL. Built once by the worker that
// fetched it and never modified afterwards.
struct PageRecord {
    // Normalized absolute URL, the record identity
    std::string url;

    // HTTP status of the final response, 0 when no response was received
    int statusCode = 0;

    // Set when the fetch did not yield a usable page
    std::optional<FetchFailure> failure;

    // URL that produced the final response
    std::string finalUrl;

    // Requested URL followed by every redirect target, in order.
    // Size 1 means no redirect happened.
    std::vector<std::string> redirectChain;

    std::string contentType;

    // Absent sentinels: nullopt means the tag was not present at all
    std::optional<std::string> title;
    std::optional<std::string> metaDescription;
    std::optional<std::string> canonical;
    std::optional<std::string> metaRobots;
    std::vector<std::string> h1s;
    size_t h2Count = 0;

    // Absolute link targets in document order, before normalization
    std::vector<std::string> outboundLinks;

    // Subset of outboundLinks that leave the target site
    std::vector<std::string> externalLinks;

    size_t contentLength = 0;
    size_t textLength = 0;
    size_t scriptCount = 0;
    bool hasNoscript = false;
    size_t imagesWithoutAlt = 0;
    std::vector<std::string> structuredDataTypes;

    std::chrono::milliseconds fetchDuration{0};
    size_t attempts = 0;
    size_t depth = 0;
    DiscoverySource source = DiscoverySource::LINK;

    bool succeeded() const { return !failure.has_value(); }
    bool isHtml() const;
    bool wasRedirected() const { return redirectChain.size() > 1; }
};

} // namespace seo_audit::crawler
