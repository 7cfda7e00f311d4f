#include "AuditJson.h"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace seo_audit::audit {

namespace {

std::string formatUtc(std::chrono::system_clock::time_point time) {
    std::time_t seconds = std::chrono::system_clock::to_time_t(time);
    std::tm utc{};
    gmtime_r(&seconds, &utc);
    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

template <typename T>
json optionalToJson(const std::optional<T>& value) {
    return value ? json(*value) : json(nullptr);
}

} // namespace

json toJson(const RunMetadata& metadata) {
    return json{
        {"status", toString(metadata.status)},
        {"rootUrl", metadata.rootUrl},
        {"startTime", formatUtc(metadata.startTime)},
        {"elapsedMs", metadata.elapsed.count()},
        {"pagesAttempted", metadata.pagesAttempted},
        {"pagesSucceeded", metadata.pagesSucceeded},
        {"pagesFailed", metadata.pagesFailed},
        {"retries", metadata.retries},
        {"robotsSkipped", metadata.robotsSkipped},
        {"discardedUrls", metadata.discardedUrls},
        {"stopReason", metadata.stopReason},
        {"crawlDelayMs", metadata.crawlDelay.count()},
        {"warnings", metadata.warnings}
    };
}

json toJson(const insights::AuditSummary& summary) {
    return json{
        {"pagesCrawled", summary.pagesCrawled},
        {"pagesSucceeded", summary.pagesSucceeded},
        {"sitemapUrls", summary.sitemapUrls},
        {"missingTitles", summary.missingTitles},
        {"missingDescriptions", summary.missingDescriptions},
        {"missingH1", summary.missingH1},
        {"multipleH1", summary.multipleH1},
        {"missingCanonicals", summary.missingCanonicals},
        {"orphanPages", summary.orphanPages},
        {"uncataloguedPages", summary.uncataloguedPages},
        {"brokenLinks", summary.brokenLinks},
        {"redirects", summary.redirects},
        {"averageResponseTimeMs", summary.averageResponseTimeMs},
        {"averageClickDepth", summary.averageClickDepth},
        {"internalLinksPerPage", summary.internalLinksPerPage},
        {"rootStructuredDataTypes", summary.rootStructuredDataTypes},
        {"renderingMode", summary.renderingMode}
    };
}

json toJson(const crawler::PageRecord& page) {
    json j = {
        {"url", page.url},
        {"statusCode", page.statusCode},
        {"finalUrl", page.finalUrl},
        {"redirectChain", page.redirectChain},
        {"contentType", page.contentType},
        {"title", optionalToJson(page.title)},
        {"metaDescription", optionalToJson(page.metaDescription)},
        {"canonical", optionalToJson(page.canonical)},
        {"metaRobots", optionalToJson(page.metaRobots)},
        {"h1", page.h1s},
        {"h2Count", page.h2Count},
        {"outboundLinks", page.outboundLinks},
        {"externalLinks", page.externalLinks},
        {"contentLength", page.contentLength},
        {"textLength", page.textLength},
        {"scriptCount", page.scriptCount},
        {"hasNoscript", page.hasNoscript},
        {"imagesWithoutAlt", page.imagesWithoutAlt},
        {"structuredDataTypes", page.structuredDataTypes},
        {"fetchDurationMs", page.fetchDuration.count()},
        {"attempts", page.attempts},
        {"depth", page.depth},
        {"source", crawler::toString(page.source)}
    };

    if (page.failure) {
        j["failure"] = {
            {"kind", crawler::toString(page.failure->kind)},
            {"httpCode", page.failure->httpCode},
            {"message", page.failure->message}
        };
    } else {
        j["failure"] = nullptr;
    }
    return j;
}

json toJson(const graph::LinkGraph& graph) {
    json nodes = json::array();
    for (const auto& node : graph.nodes()) {
        nodes.push_back({
            {"url", node.url},
            {"isRoot", node.isRoot},
            {"inSitemap", node.inSitemap},
            {"fetched", node.fetched},
            {"inDegree", node.inDegree},
            {"outDegree", node.outDegree},
            {"depth", node.depth},
            {"authority", node.authority},
            {"pageRank", node.pageRank}
        });
    }

    json edges = json::array();
    for (const auto& [source, target] : graph.edges()) {
        edges.push_back({{"source", source}, {"target", target}});
    }

    return json{
        {"nodeCount", graph.nodeCount()},
        {"edgeCount", graph.edgeCount()},
        {"orphans", graph.orphans()},
        {"nodes", nodes},
        {"edges", edges}
    };
}

json findingsToJson(const std::vector<insights::Finding>& findings) {
    // Findings arrive sorted, so categories come out in report order
    json groups = json::array();
    for (const auto& finding : findings) {
        const std::string category = insights::toString(finding.category);
        if (groups.empty() || groups.back()["category"].get<std::string>() != category) {
            groups.push_back({{"category", category}, {"findings", json::array()}});
        }
        groups.back()["findings"].push_back({
            {"severity", insights::toString(finding.severity)},
            {"affectedUrls", finding.affectedUrls},
            {"detail", finding.detail}
        });
    }
    return groups;
}

json toJson(const AuditResult& result) {
    json pages = json::array();
    for (const auto& page : result.pages) {
        pages.push_back(toJson(page));
    }

    return json{
        {"metadata", toJson(result.metadata)},
        {"summary", toJson(result.summary)},
        {"sitemap", {
            {"documents", result.sitemapDocuments},
            {"urls", result.sitemapUrls}
        }},
        {"pages", pages},
        {"graph", toJson(result.graph)},
        {"findings", findingsToJson(result.findings)},
        {"findingCount", result.findings.size()}
    };
}

} // namespace seo_audit::audit
