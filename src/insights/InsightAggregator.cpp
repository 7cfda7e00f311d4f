#include "InsightAggregator.h"
#include "../../include/Logger.h"
#include "../../include/seo_audit/common/UrlUtils.h"
#include <algorithm>
#include <cstdio>
#include <map>
#include <set>

namespace seo_audit::insights {

using crawler::PageRecord;

namespace {

bool isBlank(const std::optional<std::string>& value) {
    return !value || value->find_first_not_of(" \t\r\n") == std::string::npos;
}

Finding makeFinding(FindingCategory category, Severity severity,
                    std::vector<std::string> urls, std::string detail) {
    Finding finding;
    finding.category = category;
    finding.severity = severity;
    finding.affectedUrls = std::move(urls);
    finding.detail = std::move(detail);
    return finding;
}

std::string describeFailure(const PageRecord& page) {
    if (!page.failure) {
        return "HTTP " + std::to_string(page.statusCode);
    }
    if (page.failure->kind == crawler::FetchFailureKind::HTTP_ERROR) {
        return "HTTP " + std::to_string(page.failure->httpCode);
    }
    std::string text = crawler::toString(page.failure->kind);
    if (!page.failure->message.empty()) {
        text += ": " + page.failure->message;
    }
    return text;
}

} // namespace

InsightOptions InsightOptions::fromConfig(const crawler::AuditConfig& config) {
    InsightOptions options;
    options.thinContentBytes = config.thinContentBytes;
    options.minTextLength = config.minTextLength;
    options.csrScriptThreshold = config.csrScriptThreshold;
    options.maxUrlLength = config.maxUrlLength;
    options.maxUrlPathDepth = config.maxUrlPathDepth;
    options.maxClickDepth = config.maxClickDepth;
    options.minInternalLinksPerPage = config.minInternalLinksPerPage;
    return options;
}

InsightAggregator::InsightAggregator(InsightOptions insightOptions)
    : options(insightOptions) {
}

bool InsightAggregator::isContentPage(const PageRecord& page) {
    return page.succeeded() && page.statusCode == 200 && page.isHtml();
}

std::string InsightAggregator::identity(const PageRecord& page) {
    if (!page.finalUrl.empty()) {
        if (auto normalized = common::normalizeUrl(page.finalUrl)) {
            return *normalized;
        }
    }
    return page.url;
}

const PageRecord* InsightAggregator::findRoot(const Pages& pages, const graph::LinkGraph& graph) {
    for (const auto* page : pages) {
        const auto* node = graph.find(page->url);
        if (node && node->isRoot) {
            return page;
        }
    }
    return nullptr;
}

std::vector<Finding> InsightAggregator::analyze(const std::vector<PageRecord>& records,
                                                const graph::LinkGraph& graph) const {
    Pages pages;
    pages.reserve(records.size());
    for (const auto& record : records) {
        pages.push_back(&record);
    }
    std::sort(pages.begin(), pages.end(),
              [](const PageRecord* a, const PageRecord* b) { return a->url < b->url; });

    std::vector<Finding> findings;
    checkDuplicates(pages, findings);
    checkMissingMeta(pages, findings);
    checkHeadings(pages, findings);
    checkCanonicals(pages, findings);
    checkBrokenLinks(pages, graph, findings);
    checkRedirects(pages, findings);
    checkOrphans(graph, findings);
    checkUncatalogued(pages, graph, findings);
    checkThinContent(pages, findings);
    checkDepth(pages, graph, findings);
    checkUrlLength(pages, findings);
    checkInternalLinking(graph, findings);
    checkRendering(pages, graph, findings);
    checkImages(pages, findings);

    sortFindings(findings);

    LOG_INFO("Insight analysis produced " + std::to_string(findings.size()) + " findings over " +
             std::to_string(records.size()) + " pages");
    return findings;
}

void InsightAggregator::sortFindings(std::vector<Finding>& findings) {
    std::stable_sort(findings.begin(), findings.end(), findingLess);
}

void InsightAggregator::checkDuplicates(const Pages& pages, std::vector<Finding>& out) const {
    // A redirect target fetched on its own and via a redirect is one page
    std::map<std::string, std::set<std::string>> titles;
    std::map<std::string, std::set<std::string>> descriptions;

    for (const auto* page : pages) {
        if (!isContentPage(*page)) {
            continue;
        }
        if (!isBlank(page->title)) {
            titles[*page->title].insert(identity(*page));
        }
        if (!isBlank(page->metaDescription)) {
            descriptions[*page->metaDescription].insert(identity(*page));
        }
    }

    for (const auto& [title, urls] : titles) {
        if (urls.size() >= 2) {
            out.push_back(makeFinding(FindingCategory::DUPLICATE_TITLE, Severity::MEDIUM,
                                      {urls.begin(), urls.end()},
                                      "Title \"" + title + "\" is shared by " +
                                      std::to_string(urls.size()) + " pages"));
        }
    }
    for (const auto& [description, urls] : descriptions) {
        if (urls.size() >= 2) {
            out.push_back(makeFinding(FindingCategory::DUPLICATE_META, Severity::LOW,
                                      {urls.begin(), urls.end()},
                                      "Meta description \"" + description + "\" is shared by " +
                                      std::to_string(urls.size()) + " pages"));
        }
    }
}

void InsightAggregator::checkMissingMeta(const Pages& pages, std::vector<Finding>& out) const {
    for (const auto* page : pages) {
        if (!isContentPage(*page)) {
            continue;
        }
        if (isBlank(page->title)) {
            out.push_back(makeFinding(FindingCategory::MISSING_META, Severity::HIGH,
                                      {page->url}, "Missing title"));
        }
        if (isBlank(page->metaDescription)) {
            out.push_back(makeFinding(FindingCategory::MISSING_META, Severity::MEDIUM,
                                      {page->url}, "Missing meta description"));
        }
        bool hasH1 = std::any_of(page->h1s.begin(), page->h1s.end(),
                                 [](const std::string& h1) { return !isBlank(h1); });
        if (!hasH1) {
            out.push_back(makeFinding(FindingCategory::MISSING_META, Severity::MEDIUM,
                                      {page->url}, "Missing H1"));
        }
    }
}

void InsightAggregator::checkHeadings(const Pages& pages, std::vector<Finding>& out) const {
    for (const auto* page : pages) {
        if (isContentPage(*page) && page->h1s.size() > 1) {
            out.push_back(makeFinding(FindingCategory::MULTIPLE_H1, Severity::LOW, {page->url},
                                      std::to_string(page->h1s.size()) + " H1 elements"));
        }
    }
}

void InsightAggregator::checkCanonicals(const Pages& pages, std::vector<Finding>& out) const {
    for (const auto* page : pages) {
        if (!isContentPage(*page)) {
            continue;
        }
        if (isBlank(page->canonical)) {
            out.push_back(makeFinding(FindingCategory::MISSING_CANONICAL, Severity::LOW,
                                      {page->url}, "No canonical link"));
            continue;
        }
        auto canonical = common::normalizeUrl(*page->canonical);
        if (!canonical) {
            out.push_back(makeFinding(FindingCategory::CANONICAL_MISMATCH, Severity::MEDIUM,
                                      {page->url}, "Canonical is not a valid URL: " + *page->canonical));
        } else if (*canonical != identity(*page)) {
            out.push_back(makeFinding(FindingCategory::CANONICAL_MISMATCH, Severity::MEDIUM,
                                      {page->url, *canonical}, "Canonical points to " + *canonical));
        }
    }
}

void InsightAggregator::checkBrokenLinks(const Pages& pages,
                                         const graph::LinkGraph& graph,
                                         std::vector<Finding>& out) const {
    for (const auto* page : pages) {
        if (page->succeeded()) {
            continue;
        }
        std::vector<std::string> urls{page->url};
        std::vector<std::string> linking = graph.inboundUrls(page->url);
        urls.insert(urls.end(), linking.begin(), linking.end());

        std::string detail = describeFailure(*page);
        if (linking.empty()) {
            detail += ", not linked from any crawled page";
        } else {
            detail += ", linked from " + std::to_string(linking.size()) + " page(s)";
        }
        out.push_back(makeFinding(FindingCategory::BROKEN_LINK,
                                  linking.empty() ? Severity::MEDIUM : Severity::HIGH,
                                  std::move(urls), detail));
    }
}

void InsightAggregator::checkRedirects(const Pages& pages, std::vector<Finding>& out) const {
    for (const auto* page : pages) {
        if (!page->wasRedirected()) {
            continue;
        }
        const size_t hops = page->redirectChain.size() - 1;
        out.push_back(makeFinding(FindingCategory::REDIRECT_CHAIN,
                                  page->redirectChain.size() >= 3 ? Severity::HIGH : Severity::MEDIUM,
                                  page->redirectChain,
                                  std::to_string(hops) + (hops == 1 ? " redirect" : " redirects") +
                                  " before the final response"));
    }
}

void InsightAggregator::checkOrphans(const graph::LinkGraph& graph, std::vector<Finding>& out) const {
    for (const auto& url : graph.orphans()) {
        const auto* node = graph.find(url);
        if (node && node->inSitemap && !node->isRoot) {
            out.push_back(makeFinding(FindingCategory::ORPHAN_PAGE, Severity::MEDIUM, {url},
                                      "Listed in the sitemap but not linked from any crawled page"));
        }
    }
}

void InsightAggregator::checkUncatalogued(const Pages& pages,
                                          const graph::LinkGraph& graph,
                                          std::vector<Finding>& out) const {
    if (!graph.hasSitemapNodes()) {
        return;
    }
    for (const auto* page : pages) {
        if (!isContentPage(*page)) {
            continue;
        }
        const auto* node = graph.find(page->url);
        const auto* finalNode = graph.find(identity(*page));
        bool listed = (node && node->inSitemap) || (finalNode && finalNode->inSitemap);
        if (!listed) {
            out.push_back(makeFinding(FindingCategory::UNCATALOGUED_PAGE, Severity::LOW, {page->url},
                                      "Crawled page missing from the sitemap"));
        }
    }
}

void InsightAggregator::checkThinContent(const Pages& pages, std::vector<Finding>& out) const {
    for (const auto* page : pages) {
        if (isContentPage(*page) && page->contentLength < options.thinContentBytes) {
            out.push_back(makeFinding(FindingCategory::THIN_CONTENT, Severity::MEDIUM, {page->url},
                                      std::to_string(page->contentLength) + " bytes of content, below " +
                                      std::to_string(options.thinContentBytes)));
        }
    }
}

void InsightAggregator::checkDepth(const Pages& pages,
                                   const graph::LinkGraph& graph,
                                   std::vector<Finding>& out) const {
    for (const auto* page : pages) {
        if (!page->succeeded()) {
            continue;
        }
        const auto* node = graph.find(page->url);
        if (node && node->depth > static_cast<int>(options.maxClickDepth)) {
            out.push_back(makeFinding(FindingCategory::DEEP_PAGE, Severity::MEDIUM, {page->url},
                                      std::to_string(node->depth) + " clicks from the root page"));
        }
        const size_t segments = common::pathDepth(page->url);
        if (segments > options.maxUrlPathDepth) {
            out.push_back(makeFinding(FindingCategory::DEEP_PAGE, Severity::LOW, {page->url},
                                      std::to_string(segments) + " path segments"));
        }
    }
}

void InsightAggregator::checkUrlLength(const Pages& pages, std::vector<Finding>& out) const {
    for (const auto* page : pages) {
        if (page->url.size() > options.maxUrlLength) {
            out.push_back(makeFinding(FindingCategory::LONG_URL, Severity::LOW, {page->url},
                                      std::to_string(page->url.size()) + " characters"));
        }
    }
}

void InsightAggregator::checkInternalLinking(const graph::LinkGraph& graph, std::vector<Finding>& out) const {
    std::vector<std::string> weak;
    size_t fetched = 0;
    for (const auto& node : graph.nodes()) {
        if (!node.fetched) {
            continue;
        }
        fetched++;
        if (static_cast<double>(node.outDegree) < options.minInternalLinksPerPage) {
            weak.push_back(node.url);
        }
    }
    if (fetched < 2) {
        return;
    }

    double ratio = static_cast<double>(graph.edgeCount()) / static_cast<double>(fetched);
    if (ratio >= options.minInternalLinksPerPage) {
        return;
    }

    std::sort(weak.begin(), weak.end());
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.2f", ratio);
    out.push_back(makeFinding(FindingCategory::WEAK_INTERNAL_LINKING, Severity::MEDIUM, std::move(weak),
                              std::string(buffer) + " internal links per page"));
}

void InsightAggregator::checkRendering(const Pages& pages,
                                       const graph::LinkGraph& graph,
                                       std::vector<Finding>& out) const {
    const PageRecord* root = findRoot(pages, graph);
    if (!root || !isContentPage(*root)) {
        return;
    }

    const bool littleText = root->textLength < options.minTextLength;
    if (littleText && root->scriptCount > options.csrScriptThreshold) {
        out.push_back(makeFinding(FindingCategory::CLIENT_SIDE_RENDERING, Severity::HIGH, {root->url},
                                  std::to_string(root->textLength) + " characters of text with " +
                                  std::to_string(root->scriptCount) + " scripts"));
    } else if (littleText && root->hasNoscript) {
        out.push_back(makeFinding(FindingCategory::CLIENT_SIDE_RENDERING, Severity::LOW, {root->url},
                                  "Little server-rendered text and a <noscript> fallback"));
    }

    if (root->structuredDataTypes.empty()) {
        out.push_back(makeFinding(FindingCategory::MISSING_STRUCTURED_DATA, Severity::LOW, {root->url},
                                  "No JSON-LD structured data"));
    }
}

void InsightAggregator::checkImages(const Pages& pages, std::vector<Finding>& out) const {
    for (const auto* page : pages) {
        if (isContentPage(*page) && page->imagesWithoutAlt > 0) {
            out.push_back(makeFinding(FindingCategory::MISSING_ALT_TEXT, Severity::LOW, {page->url},
                                      std::to_string(page->imagesWithoutAlt) + " image(s) without alt text"));
        }
    }
}

AuditSummary InsightAggregator::summarize(const std::vector<PageRecord>& records,
                                          const graph::LinkGraph& graph,
                                          const std::vector<Finding>& findings) const {
    AuditSummary summary;
    summary.pagesCrawled = records.size();

    double totalResponseMs = 0.0;
    for (const auto& record : records) {
        if (record.succeeded()) {
            summary.pagesSucceeded++;
        }
        if (record.wasRedirected()) {
            summary.redirects++;
        }
        totalResponseMs += static_cast<double>(record.fetchDuration.count());
    }
    if (!records.empty()) {
        summary.averageResponseTimeMs = totalResponseMs / static_cast<double>(records.size());
    }

    size_t fetched = 0;
    size_t reachable = 0;
    double depthSum = 0.0;
    for (const auto& node : graph.nodes()) {
        if (node.inSitemap) {
            summary.sitemapUrls++;
        }
        if (node.fetched) {
            fetched++;
            if (node.depth >= 0) {
                reachable++;
                depthSum += node.depth;
            }
        }
    }
    if (reachable > 0) {
        summary.averageClickDepth = depthSum / static_cast<double>(reachable);
    }
    if (fetched > 0) {
        summary.internalLinksPerPage = static_cast<double>(graph.edgeCount()) / static_cast<double>(fetched);
    }

    for (const auto& finding : findings) {
        switch (finding.category) {
            case FindingCategory::MISSING_META:
                if (finding.detail == "Missing title") summary.missingTitles++;
                else if (finding.detail == "Missing meta description") summary.missingDescriptions++;
                else if (finding.detail == "Missing H1") summary.missingH1++;
                break;
            case FindingCategory::MULTIPLE_H1: summary.multipleH1++; break;
            case FindingCategory::MISSING_CANONICAL: summary.missingCanonicals++; break;
            case FindingCategory::ORPHAN_PAGE: summary.orphanPages++; break;
            case FindingCategory::UNCATALOGUED_PAGE: summary.uncataloguedPages++; break;
            case FindingCategory::BROKEN_LINK: summary.brokenLinks++; break;
            case FindingCategory::CLIENT_SIDE_RENDERING:
                summary.renderingMode = finding.severity == Severity::HIGH ? "CSR" : "Possibly CSR";
                break;
            default:
                break;
        }
    }

    Pages pages;
    for (const auto& record : records) {
        pages.push_back(&record);
    }
    if (const PageRecord* root = findRoot(pages, graph)) {
        summary.rootStructuredDataTypes = root->structuredDataTypes;
    }

    return summary;
}

} // namespace seo_audit::insights
