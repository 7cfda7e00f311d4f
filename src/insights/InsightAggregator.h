#pragma once

#include <string>
#include <vector>
#include "../crawler/models/AuditConfig.h"
#include "../../include/seo_audit/crawler/models/PageRecord.h"
#include "../../include/seo_audit/graph/LinkGraph.h"
#include "../../include/seo_audit/insights/AuditSummary.h"
#include "../../include/seo_audit/insights/Finding.h"

namespace seo_audit::insights {

struct InsightOptions {
    size_t thinContentBytes = 1500;
    size_t minTextLength = 200;
    size_t csrScriptThreshold = 20;
    size_t maxUrlLength = 100;
    size_t maxUrlPathDepth = 5;
    size_t maxClickDepth = 4;
    double minInternalLinksPerPage = 2.0;

    static InsightOptions fromConfig(const crawler::AuditConfig& config);
};

/**
 * Turns the finished crawl into findings. Every rule is a pure function of
 * the page records and the finalized graph, so the same input always yields
 * the same, identically ordered list.
 */
class InsightAggregator {
public:
    explicit InsightAggregator(InsightOptions options = {});

    std::vector<Finding> analyze(const std::vector<crawler::PageRecord>& pages,
                                 const graph::LinkGraph& graph) const;

    AuditSummary summarize(const std::vector<crawler::PageRecord>& pages,
                           const graph::LinkGraph& graph,
                           const std::vector<Finding>& findings) const;

    static void sortFindings(std::vector<Finding>& findings);

    // Individual rules, pages must be sorted by URL
    using Pages = std::vector<const crawler::PageRecord*>;

    void checkDuplicates(const Pages& pages, std::vector<Finding>& out) const;
    void checkMissingMeta(const Pages& pages, std::vector<Finding>& out) const;
    void checkHeadings(const Pages& pages, std::vector<Finding>& out) const;
    void checkCanonicals(const Pages& pages, std::vector<Finding>& out) const;
    void checkBrokenLinks(const Pages& pages, const graph::LinkGraph& graph, std::vector<Finding>& out) const;
    void checkRedirects(const Pages& pages, std::vector<Finding>& out) const;
    void checkOrphans(const graph::LinkGraph& graph, std::vector<Finding>& out) const;
    void checkUncatalogued(const Pages& pages, const graph::LinkGraph& graph, std::vector<Finding>& out) const;
    void checkThinContent(const Pages& pages, std::vector<Finding>& out) const;
    void checkDepth(const Pages& pages, const graph::LinkGraph& graph, std::vector<Finding>& out) const;
    void checkUrlLength(const Pages& pages, std::vector<Finding>& out) const;
    void checkInternalLinking(const graph::LinkGraph& graph, std::vector<Finding>& out) const;
    void checkRendering(const Pages& pages, const graph::LinkGraph& graph, std::vector<Finding>& out) const;
    void checkImages(const Pages& pages, std::vector<Finding>& out) const;

private:
    // HTTP 200 HTML pages, the only ones with on-page signals
    static bool isContentPage(const crawler::PageRecord& page);
    static const crawler::PageRecord* findRoot(const Pages& pages, const graph::LinkGraph& graph);
    static std::string identity(const crawler::PageRecord& page);

    InsightOptions options;
};

} // namespace seo_audit::insights
