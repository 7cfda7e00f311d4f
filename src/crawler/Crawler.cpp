#include "Crawler.h"
#include "FailureClassifier.h"
#include "FetchWorkerPool.h"
#include "../../include/Logger.h"
#include "../../include/seo_audit/common/UrlUtils.h"
#include <algorithm>

namespace seo_audit::crawler {

namespace {

// Upper bound on one idle wait so budgets are re-checked regularly
constexpr std::chrono::milliseconds kMaxIdleWait{100};

} // namespace

Crawler::Crawler(const AuditConfig& auditConfig, PageFetcher& pageFetcher, CrawlMetrics& crawlMetrics, Clock clockFn)
    : config(auditConfig)
    , fetcher(pageFetcher)
    , metrics(crawlMetrics)
    , clock(clockFn ? std::move(clockFn) : Clock([] { return std::chrono::steady_clock::now(); })) {
}

CrawlOutcome Crawler::run(URLFrontier& frontier, graph::LinkGraphBuilder& graph, TimePoint deadline) {
    CrawlOutcome outcome;
    const std::string targetHost = frontier.getTargetHost();

    LOG_INFO("Crawl started for " + targetHost + " with " + std::to_string(frontier.pendingCount()) +
             " seeds, " + std::to_string(config.maxConcurrentConnections) + " workers, page budget " +
             std::to_string(config.maxPages));

    fetcher.setThrottle(frontier.getThrottle(), clock);
    FetchWorkerPool pool(config.maxConcurrentConnections,
                         [this, targetHost](const FrontierEntry& entry) {
                             return processURL(entry, targetHost);
                         });

    while (true) {
        while (auto record = pool.tryPopResult()) {
            handleResult(std::move(*record), frontier, graph, outcome);
        }

        TimePoint now = clock();
        const bool workRemaining = frontier.pendingCount() > 0 || frontier.inFlightCount() > 0;

        if (outcome.stopReason.empty() && workRemaining) {
            if (now >= deadline) {
                outcome.stopReason = "wall-clock budget";
            } else if (outcome.pagesAttempted >= config.maxPages && frontier.pendingCount() > 0) {
                outcome.stopReason = "page budget";
            }
            if (!outcome.stopReason.empty()) {
                outcome.partial = true;
                LOG_WARNING("Stopping crawl: " + outcome.stopReason + " exhausted after " +
                            std::to_string(outcome.pagesAttempted) + " pages");
                frontier.closeAdmission();
                outcome.discardedUrls += frontier.discardPending();
            }
        }

        if (outcome.stopReason.empty()) {
            while (outcome.pagesAttempted < config.maxPages) {
                // Stamp the host timer as close to the send as the coordinator can
                auto entry = frontier.next(clock());
                if (!entry) {
                    break;
                }
                outcome.pagesAttempted++;
                metrics.recordRequest();
                pool.submit(std::move(*entry));
            }
        } else {
            // Links from fetches that were in flight at the stop are dropped too
            outcome.discardedUrls += frontier.discardPending();
        }

        if (frontier.inFlightCount() == 0 && frontier.pendingCount() == 0) {
            break;
        }

        std::chrono::milliseconds wait = kMaxIdleWait;
        if (frontier.inFlightCount() == 0) {
            // Only politeness is holding us back
            auto ready = frontier.nextDispatchTime();
            TimePoint idleFrom = clock();
            if (ready && *ready <= idleFrom) {
                wait = std::chrono::milliseconds(1);
            } else if (ready) {
                auto untilReady = std::chrono::duration_cast<std::chrono::milliseconds>(*ready - idleFrom);
                wait = std::clamp(untilReady + std::chrono::milliseconds(1),
                                  std::chrono::milliseconds(1), kMaxIdleWait);
            }
        }

        if (auto record = pool.waitForResult(wait)) {
            handleResult(std::move(*record), frontier, graph, outcome);
        }
    }

    pool.shutdown();
    fetcher.setThrottle(nullptr);

    if (outcome.stopReason.empty()) {
        outcome.stopReason = "frontier exhausted";
    }
    metrics.recordRobotsSkips(frontier.getDisallowedCount());

    LOG_INFO("Crawl finished (" + outcome.stopReason + "): " + std::to_string(outcome.pages.size()) +
             " pages, " + std::to_string(outcome.discardedUrls) + " URLs left unvisited");
    return outcome;
}

void Crawler::handleResult(PageRecord record,
                           URLFrontier& frontier,
                           graph::LinkGraphBuilder& graph,
                           CrawlOutcome& outcome) {
    frontier.onResult(record);

    if (record.wasRedirected()) {
        metrics.recordRedirect();
    }

    if (record.succeeded()) {
        metrics.recordSuccess();
        graph.addPage(record);
    } else {
        metrics.recordFailure(record.failure->kind);
    }

    outcome.pages.push_back(std::move(record));
}

PageRecord Crawler::processURL(const FrontierEntry& entry, const std::string& targetHost) const {
    PageFetchResult fetched = fetcher.fetch(entry.url);

    PageRecord record;
    record.url = entry.url;
    record.depth = entry.depth;
    record.source = entry.source;
    record.statusCode = fetched.statusCode;
    record.failure = fetched.failure;
    record.finalUrl = fetched.finalUrl.empty() ? entry.url : fetched.finalUrl;
    record.redirectChain = std::move(fetched.redirectChain);
    record.contentType = fetched.contentType;
    record.contentLength = fetched.content.size();
    record.fetchDuration = fetched.duration;
    record.attempts = fetched.attempts;

    if (!fetched.success || !record.isHtml()) {
        return record;
    }

    ParsedContent parsed = contentParser.parse(fetched.content, record.finalUrl);
    record.title = std::move(parsed.title);
    record.metaDescription = std::move(parsed.metaDescription);
    record.metaRobots = std::move(parsed.metaRobots);
    record.canonical = std::move(parsed.canonical);
    record.h1s = std::move(parsed.h1s);
    record.h2Count = parsed.h2Count;
    record.textLength = parsed.textLength;
    record.scriptCount = parsed.scriptCount;
    record.hasNoscript = parsed.hasNoscript;
    record.imagesWithoutAlt = parsed.imagesWithoutAlt;
    record.structuredDataTypes = std::move(parsed.structuredDataTypes);
    record.outboundLinks = std::move(parsed.links);

    for (const auto& link : record.outboundLinks) {
        if (!common::isSameSite(common::extractHost(link), targetHost)) {
            record.externalLinks.push_back(link);
        }
    }

    return record;
}

} // namespace seo_audit::crawler
