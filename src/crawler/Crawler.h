#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <vector>
#include "ContentParser.h"
#include "CrawlMetrics.h"
#include "PageFetcher.h"
#include "URLFrontier.h"
#include "models/AuditConfig.h"
#include "../../include/seo_audit/crawler/models/PageRecord.h"
#include "../../include/seo_audit/graph/LinkGraph.h"

namespace seo_audit::crawler {

struct CrawlOutcome {
    std::vector<PageRecord> pages;
    bool partial = false;
    std::string stopReason;
    size_t pagesAttempted = 0;
    size_t discardedUrls = 0;
};

// Crawl coordinator. Owns the dispatch loop: pulls URLs from the frontier
// under its politeness and concurrency limits, hands them to the worker pool
// and feeds every finished record back into the frontier and the graph.
class Crawler {
public:
    using TimePoint = std::chrono::steady_clock::time_point;
    using Clock = std::function<TimePoint()>;

    Crawler(const AuditConfig& config, PageFetcher& fetcher, CrawlMetrics& metrics, Clock clock = {});

    // Run until the frontier is exhausted or a budget runs out. Budget
    // exhaustion stops dispatching, lets in-flight fetches finish and marks
    // the outcome partial.
    CrawlOutcome run(URLFrontier& frontier, graph::LinkGraphBuilder& graph, TimePoint deadline);

    // Fetch and parse one URL. Runs on worker threads.
    PageRecord processURL(const FrontierEntry& entry, const std::string& targetHost) const;

private:
    void handleResult(PageRecord record,
                      URLFrontier& frontier,
                      graph::LinkGraphBuilder& graph,
                      CrawlOutcome& outcome);

    AuditConfig config;
    PageFetcher& fetcher;
    ContentParser contentParser;
    CrawlMetrics& metrics;
    Clock clock;
};

} // namespace seo_audit::crawler
