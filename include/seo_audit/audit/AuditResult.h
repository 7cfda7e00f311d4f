#pragma once

#include <chrono>
#include <set>
#include <string>
#include <vector>
#include "../crawler/models/PageRecord.h"
#include "../graph/LinkGraph.h"
#include "../insights/AuditSummary.h"
#include "../insights/Finding.h"

namespace seo_audit::audit {

enum class RunStatus {
    COMPLETE,   // frontier exhausted
    PARTIAL     // a page or wall-clock budget ended the crawl early
};

std::string toString(RunStatus status);

struct RunMetadata {
    RunStatus status = RunStatus::COMPLETE;
    std::string rootUrl;
    std::chrono::system_clock::time_point startTime;
    std::chrono::milliseconds elapsed{0};

    size_t pagesAttempted = 0;
    size_t pagesSucceeded = 0;
    size_t pagesFailed = 0;
    size_t retries = 0;
    size_t robotsSkipped = 0;
    size_t discardedUrls = 0;

    std::string stopReason;
    std::chrono::milliseconds crawlDelay{0};

    // Recovered policy failures
    std::vector<std::string> warnings;
};

// Everything one audit run produced. Handed to the report renderer as a
// whole and never modified after the pipeline returns it.
struct AuditResult {
    RunMetadata metadata;
    std::vector<crawler::PageRecord> pages;
    graph::LinkGraph graph;
    std::vector<insights::Finding> findings;
    insights::AuditSummary summary;
    std::set<std::string> sitemapUrls;
    std::vector<std::string> sitemapDocuments;
};

} // namespace seo_audit::audit
