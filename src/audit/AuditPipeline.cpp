#include "AuditPipeline.h"
#include "../crawler/CrawlMetrics.h"
#include "../crawler/PageFetcher.h"
#include "../crawler/PolicyResolver.h"
#include "../crawler/URLFrontier.h"
#include "../insights/InsightAggregator.h"
#include "../../include/Logger.h"
#include "../../include/seo_audit/common/UrlUtils.h"
#include <stdexcept>

namespace seo_audit::audit {

std::string toString(RunStatus status) {
    switch (status) {
        case RunStatus::COMPLETE: return "COMPLETE";
        case RunStatus::PARTIAL: return "PARTIAL";
    }
    return "UNKNOWN";
}

AuditPipeline::AuditPipeline(crawler::AuditConfig auditConfig,
                             std::shared_ptr<crawler::HttpTransport> httpTransport,
                             crawler::Crawler::Clock clockFn)
    : config(std::move(auditConfig))
    , transport(std::move(httpTransport))
    , clock(clockFn ? std::move(clockFn) : crawler::Crawler::Clock([] { return std::chrono::steady_clock::now(); })) {
    if (!transport) {
        throw std::invalid_argument("AuditPipeline requires an HttpTransport");
    }
}

AuditResult AuditPipeline::run(const std::string& rootUrl) {
    if (!common::hasHttpScheme(common::sanitizeUrl(rootUrl))) {
        throw std::invalid_argument("Root URL must be an absolute http(s) URL: " + rootUrl);
    }
    auto normalizedRoot = common::normalizeUrl(rootUrl);
    if (!normalizedRoot) {
        throw std::invalid_argument("Root URL is malformed: " + rootUrl);
    }

    AuditResult result;
    result.metadata.rootUrl = *normalizedRoot;
    result.metadata.startTime = std::chrono::system_clock::now();
    const auto wallStart = std::chrono::steady_clock::now();
    const auto deadline = clock() + config.wallClockBudget;

    LOG_INFO("Starting audit of " + *normalizedRoot);

    crawler::CrawlMetrics metrics;
    crawler::PageFetcher fetcher(transport, config);
    fetcher.setMetrics(&metrics);

    crawler::PolicyResolver resolver(fetcher, config, clock);
    crawler::PolicyResolution resolution = resolver.resolve(*normalizedRoot, deadline);

    const std::string targetHost = common::extractHost(*normalizedRoot);
    crawler::URLFrontier frontier(targetHost, resolution.policy, config.maxDepth,
                                  config.maxConcurrentConnections, resolution.crawlDelay);
    graph::LinkGraphBuilder graphBuilder(targetHost);

    graphBuilder.addSeed(*normalizedRoot, true, resolution.sitemapUrls.count(*normalizedRoot) > 0);
    for (const auto& seed : resolution.seeds) {
        crawler::EnqueueResult admitted = frontier.enqueue(seed.url, 0, seed.source);
        if (admitted != crawler::EnqueueResult::ACCEPTED) {
            LOG_DEBUG("Seed " + seed.url + " not admitted: " + crawler::toString(admitted));
            continue;
        }
        if (seed.source == crawler::DiscoverySource::SITEMAP) {
            graphBuilder.addSeed(seed.url, false, true);
        }
    }

    crawler::Crawler coordinator(config, fetcher, metrics, clock);
    crawler::CrawlOutcome outcome = coordinator.run(frontier, graphBuilder, deadline);

    result.graph = graphBuilder.finalize();
    result.pages = std::move(outcome.pages);

    insights::InsightAggregator aggregator(insights::InsightOptions::fromConfig(config));
    result.findings = aggregator.analyze(result.pages, result.graph);
    result.summary = aggregator.summarize(result.pages, result.graph, result.findings);

    RunMetadata& metadata = result.metadata;
    metadata.status = outcome.partial ? RunStatus::PARTIAL : RunStatus::COMPLETE;
    metadata.stopReason = outcome.stopReason;
    metadata.pagesAttempted = outcome.pagesAttempted;
    for (const auto& page : result.pages) {
        if (page.succeeded()) {
            metadata.pagesSucceeded++;
        } else {
            metadata.pagesFailed++;
        }
    }
    metadata.retries = metrics.getRetriedRequests();
    metadata.robotsSkipped = metrics.getRobotsSkipped();
    metadata.discardedUrls = outcome.discardedUrls;
    metadata.crawlDelay = resolution.crawlDelay;
    metadata.warnings = std::move(resolution.warnings);
    metadata.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - wallStart);

    result.sitemapUrls = std::move(resolution.sitemapUrls);
    result.sitemapDocuments = std::move(resolution.sitemapDocuments);

    metrics.logSummary();
    LOG_INFO("Audit of " + metadata.rootUrl + " finished " + toString(metadata.status) + " in " +
             std::to_string(metadata.elapsed.count()) + "ms: " + std::to_string(metadata.pagesSucceeded) +
             " succeeded, " + std::to_string(metadata.pagesFailed) + " failed, " +
             std::to_string(result.findings.size()) + " findings");
    return result;
}

} // namespace seo_audit::audit
