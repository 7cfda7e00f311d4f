#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "insights/InsightAggregator.h"
#include <algorithm>
#include <random>

using namespace seo_audit::insights;
using seo_audit::crawler::FetchFailure;
using seo_audit::crawler::FetchFailureKind;
using seo_audit::crawler::PageRecord;
using seo_audit::graph::LinkGraph;
using seo_audit::graph::LinkGraphBuilder;
using Catch::Matchers::WithinAbs;

namespace {

const std::string kRoot = "https://example.com/";

// A page that triggers no on-page rule
PageRecord healthyPage(const std::string& url, const std::string& title, std::vector<std::string> links = {}) {
    PageRecord record;
    record.url = url;
    record.finalUrl = url;
    record.redirectChain = {url};
    record.statusCode = 200;
    record.contentType = "text/html; charset=utf-8";
    record.title = title;
    record.metaDescription = "About " + title;
    record.canonical = url;
    record.h1s = {title};
    record.contentLength = 5000;
    record.textLength = 1200;
    record.structuredDataTypes = {"Organization"};
    record.outboundLinks = std::move(links);
    return record;
}

PageRecord failedPage(const std::string& url, FetchFailureKind kind, int httpCode, const std::string& message = "") {
    PageRecord record;
    record.url = url;
    record.finalUrl = url;
    record.redirectChain = {url};
    record.statusCode = httpCode;
    FetchFailure failure;
    failure.kind = kind;
    failure.httpCode = httpCode;
    failure.message = message;
    record.failure = failure;
    return record;
}

LinkGraph buildGraph(const std::vector<PageRecord>& pages, const std::vector<std::string>& sitemapUrls = {}) {
    LinkGraphBuilder builder("example.com");
    builder.addSeed(kRoot, true,
                    std::find(sitemapUrls.begin(), sitemapUrls.end(), kRoot) != sitemapUrls.end());
    for (const auto& url : sitemapUrls) {
        builder.addSeed(url, url == kRoot, true);
    }
    for (const auto& page : pages) {
        if (page.succeeded()) {
            builder.addPage(page);
        }
    }
    return builder.finalize();
}

InsightAggregator::Pages sortedPointers(const std::vector<PageRecord>& pages) {
    InsightAggregator::Pages pointers;
    for (const auto& page : pages) {
        pointers.push_back(&page);
    }
    std::sort(pointers.begin(), pointers.end(),
              [](const PageRecord* a, const PageRecord* b) { return a->url < b->url; });
    return pointers;
}

std::vector<Finding> ofCategory(const std::vector<Finding>& findings, FindingCategory category) {
    std::vector<Finding> selected;
    std::copy_if(findings.begin(), findings.end(), std::back_inserter(selected),
                 [category](const Finding& f) { return f.category == category; });
    return selected;
}

} // namespace

TEST_CASE("InsightAggregator reports duplicate titles and descriptions", "[InsightAggregator]") {
    InsightAggregator aggregator;

    SECTION("Pages sharing a title are grouped in one finding") {
        std::vector<PageRecord> pages{
            healthyPage(kRoot, "Welcome"),
            healthyPage("https://example.com/a", "Home"),
            healthyPage("https://example.com/b", "Home"),
        };
        pages[2].metaDescription = pages[1].metaDescription;

        std::vector<Finding> findings;
        aggregator.checkDuplicates(sortedPointers(pages), findings);

        auto titles = ofCategory(findings, FindingCategory::DUPLICATE_TITLE);
        REQUIRE(titles.size() == 1);
        REQUIRE(titles[0].severity == Severity::MEDIUM);
        REQUIRE(titles[0].affectedUrls == std::vector<std::string>{"https://example.com/a", "https://example.com/b"});
        REQUIRE(titles[0].detail == "Title \"Home\" is shared by 2 pages");

        auto metas = ofCategory(findings, FindingCategory::DUPLICATE_META);
        REQUIRE(metas.size() == 1);
        REQUIRE(metas[0].severity == Severity::LOW);
    }

    SECTION("A redirect and its target count as one page") {
        PageRecord redirected = healthyPage("https://example.com/old", "Pricing");
        redirected.finalUrl = "https://example.com/new";
        redirected.redirectChain = {"https://example.com/old", "https://example.com/new"};
        redirected.canonical = "https://example.com/new";

        std::vector<PageRecord> pages{redirected, healthyPage("https://example.com/new", "Pricing")};

        std::vector<Finding> findings;
        aggregator.checkDuplicates(sortedPointers(pages), findings);
        REQUIRE(findings.empty());
    }

    SECTION("Failed and non-HTML pages are ignored") {
        PageRecord pdf = healthyPage("https://example.com/doc.pdf", "Home");
        pdf.contentType = "application/pdf";
        std::vector<PageRecord> pages{healthyPage("https://example.com/a", "Home"), pdf};

        std::vector<Finding> findings;
        aggregator.checkDuplicates(sortedPointers(pages), findings);
        REQUIRE(findings.empty());
    }
}

TEST_CASE("InsightAggregator reports missing on-page elements", "[InsightAggregator]") {
    InsightAggregator aggregator;

    PageRecord bare = healthyPage("https://example.com/bare", "x");
    bare.title.reset();
    bare.metaDescription = "   ";
    bare.h1s.clear();
    bare.canonical.reset();

    PageRecord twoHeadings = healthyPage("https://example.com/two", "Two");
    twoHeadings.h1s = {"First", "Second"};

    std::vector<PageRecord> pages{bare, twoHeadings};
    auto pointers = sortedPointers(pages);

    SECTION("Title, description and H1 are reported separately") {
        std::vector<Finding> findings;
        aggregator.checkMissingMeta(pointers, findings);

        REQUIRE(findings.size() == 3);
        REQUIRE(findings[0].detail == "Missing title");
        REQUIRE(findings[0].severity == Severity::HIGH);
        REQUIRE(findings[1].detail == "Missing meta description");
        REQUIRE(findings[1].severity == Severity::MEDIUM);
        REQUIRE(findings[2].detail == "Missing H1");
        for (const auto& finding : findings) {
            REQUIRE(finding.affectedUrls == std::vector<std::string>{"https://example.com/bare"});
        }
    }

    SECTION("More than one H1") {
        std::vector<Finding> findings;
        aggregator.checkHeadings(pointers, findings);
        REQUIRE(findings.size() == 1);
        REQUIRE(findings[0].category == FindingCategory::MULTIPLE_H1);
        REQUIRE(findings[0].detail == "2 H1 elements");
    }

    SECTION("Missing canonical") {
        std::vector<Finding> findings;
        aggregator.checkCanonicals(pointers, findings);
        REQUIRE(findings.size() == 1);
        REQUIRE(findings[0].category == FindingCategory::MISSING_CANONICAL);
        REQUIRE(findings[0].firstUrl() == "https://example.com/bare");
    }
}

TEST_CASE("InsightAggregator compares canonicals after normalization", "[InsightAggregator]") {
    InsightAggregator aggregator;

    PageRecord same = healthyPage("https://example.com/same", "Same");
    same.canonical = "https://EXAMPLE.com/same/";

    PageRecord elsewhere = healthyPage("https://example.com/copy", "Copy");
    elsewhere.canonical = "https://example.com/original";

    PageRecord invalid = healthyPage("https://example.com/weird", "Weird");
    invalid.canonical = "not a url";

    std::vector<PageRecord> pages{same, elsewhere, invalid};
    std::vector<Finding> findings;
    aggregator.checkCanonicals(sortedPointers(pages), findings);

    REQUIRE(findings.size() == 2);
    REQUIRE(findings[0].category == FindingCategory::CANONICAL_MISMATCH);
    REQUIRE(findings[0].affectedUrls ==
            std::vector<std::string>{"https://example.com/copy", "https://example.com/original"});
    REQUIRE(findings[0].detail == "Canonical points to https://example.com/original");
    REQUIRE(findings[1].detail == "Canonical is not a valid URL: not a url");
}

TEST_CASE("InsightAggregator reports broken links with their referrers", "[InsightAggregator]") {
    InsightAggregator aggregator;

    std::vector<PageRecord> pages{
        healthyPage(kRoot, "Home", {"https://example.com/missing", "https://example.com/a"}),
        healthyPage("https://example.com/a", "A", {"https://example.com/missing"}),
        failedPage("https://example.com/missing", FetchFailureKind::HTTP_ERROR, 404),
        failedPage("https://example.com/slow", FetchFailureKind::READ_TIMEOUT, 0, "timed out"),
    };
    LinkGraph graph = buildGraph(pages, {"https://example.com/slow"});

    std::vector<Finding> findings;
    aggregator.checkBrokenLinks(sortedPointers(pages), graph, findings);

    REQUIRE(findings.size() == 2);

    const Finding& linked = findings[0];
    REQUIRE(linked.category == FindingCategory::BROKEN_LINK);
    REQUIRE(linked.severity == Severity::HIGH);
    REQUIRE(linked.affectedUrls == std::vector<std::string>{
        "https://example.com/missing", kRoot, "https://example.com/a"});
    REQUIRE(linked.detail == "HTTP 404, linked from 2 page(s)");

    const Finding& unlinked = findings[1];
    REQUIRE(unlinked.severity == Severity::MEDIUM);
    REQUIRE(unlinked.affectedUrls == std::vector<std::string>{"https://example.com/slow"});
    REQUIRE(unlinked.detail == "READ_TIMEOUT: timed out, not linked from any crawled page");
}

TEST_CASE("InsightAggregator grades redirect chains by length", "[InsightAggregator]") {
    InsightAggregator aggregator;

    PageRecord single = healthyPage("https://example.com/a", "A");
    single.redirectChain = {"https://example.com/a", "https://example.com/a2"};
    PageRecord chained = healthyPage("https://example.com/b", "B");
    chained.redirectChain = {"https://example.com/b", "https://example.com/b2", "https://example.com/b3"};
    PageRecord direct = healthyPage("https://example.com/c", "C");

    std::vector<PageRecord> pages{single, chained, direct};
    std::vector<Finding> findings;
    aggregator.checkRedirects(sortedPointers(pages), findings);

    REQUIRE(findings.size() == 2);
    REQUIRE(findings[0].severity == Severity::MEDIUM);
    REQUIRE(findings[0].detail == "1 redirect before the final response");
    REQUIRE(findings[1].severity == Severity::HIGH);
    REQUIRE(findings[1].affectedUrls == chained.redirectChain);
    REQUIRE(findings[1].detail == "2 redirects before the final response");
}

TEST_CASE("InsightAggregator compares the sitemap with the link graph", "[InsightAggregator]") {
    InsightAggregator aggregator;

    std::vector<PageRecord> pages{
        healthyPage(kRoot, "Home", {"https://example.com/linked"}),
        healthyPage("https://example.com/linked", "Linked"),
        healthyPage("https://example.com/lonely", "Lonely"),
    };

    SECTION("Sitemap URLs nobody links to are orphans") {
        LinkGraph graph = buildGraph(pages, {kRoot, "https://example.com/lonely"});
        std::vector<Finding> findings;
        aggregator.checkOrphans(graph, findings);

        REQUIRE(findings.size() == 1);
        REQUIRE(findings[0].category == FindingCategory::ORPHAN_PAGE);
        REQUIRE(findings[0].affectedUrls == std::vector<std::string>{"https://example.com/lonely"});
    }

    SECTION("Crawled pages absent from the sitemap are uncatalogued") {
        LinkGraph graph = buildGraph(pages, {kRoot, "https://example.com/lonely"});
        std::vector<Finding> findings;
        aggregator.checkUncatalogued(sortedPointers(pages), graph, findings);

        REQUIRE(findings.size() == 1);
        REQUIRE(findings[0].category == FindingCategory::UNCATALOGUED_PAGE);
        REQUIRE(findings[0].firstUrl() == "https://example.com/linked");
    }

    SECTION("Without a sitemap neither rule fires") {
        LinkGraph graph = buildGraph(pages);
        std::vector<Finding> findings;
        aggregator.checkOrphans(graph, findings);
        aggregator.checkUncatalogued(sortedPointers(pages), graph, findings);
        REQUIRE(findings.empty());
    }
}

TEST_CASE("InsightAggregator applies its size and depth thresholds", "[InsightAggregator]") {
    InsightOptions options;
    options.maxClickDepth = 2;
    InsightAggregator aggregator(options);

    SECTION("Thin content") {
        PageRecord thin = healthyPage("https://example.com/thin", "Thin");
        thin.contentLength = 300;
        std::vector<PageRecord> pages{thin, healthyPage("https://example.com/full", "Full")};

        std::vector<Finding> findings;
        aggregator.checkThinContent(sortedPointers(pages), findings);
        REQUIRE(findings.size() == 1);
        REQUIRE(findings[0].detail == "300 bytes of content, below 1500");
    }

    SECTION("Click depth and path depth") {
        std::vector<PageRecord> pages{
            healthyPage(kRoot, "Home", {"https://example.com/1"}),
            healthyPage("https://example.com/1", "One", {"https://example.com/2"}),
            healthyPage("https://example.com/2", "Two", {"https://example.com/3"}),
            healthyPage("https://example.com/3", "Three"),
            healthyPage("https://example.com/a/b/c/d/e/f", "Nested"),
        };
        LinkGraph graph = buildGraph(pages);

        std::vector<Finding> findings;
        aggregator.checkDepth(sortedPointers(pages), graph, findings);

        REQUIRE(findings.size() == 2);
        REQUIRE(findings[0].affectedUrls == std::vector<std::string>{"https://example.com/3"});
        REQUIRE(findings[0].severity == Severity::MEDIUM);
        REQUIRE(findings[0].detail == "3 clicks from the root page");
        REQUIRE(findings[1].affectedUrls == std::vector<std::string>{"https://example.com/a/b/c/d/e/f"});
        REQUIRE(findings[1].severity == Severity::LOW);
        REQUIRE(findings[1].detail == "6 path segments");
    }

    SECTION("Long URLs") {
        const std::string longUrl = "https://example.com/" + std::string(100, 'x');
        std::vector<PageRecord> pages{healthyPage(longUrl, "Long")};

        std::vector<Finding> findings;
        aggregator.checkUrlLength(sortedPointers(pages), findings);
        REQUIRE(findings.size() == 1);
        REQUIRE(findings[0].detail == std::to_string(longUrl.size()) + " characters");
    }
}

TEST_CASE("InsightAggregator flags weak internal linking", "[InsightAggregator]") {
    InsightAggregator aggregator;

    SECTION("Sparse graph") {
        std::vector<PageRecord> pages{
            healthyPage(kRoot, "Home", {"https://example.com/a"}),
            healthyPage("https://example.com/a", "A"),
        };
        LinkGraph graph = buildGraph(pages);

        std::vector<Finding> findings;
        aggregator.checkInternalLinking(graph, findings);
        REQUIRE(findings.size() == 1);
        REQUIRE(findings[0].category == FindingCategory::WEAK_INTERNAL_LINKING);
        REQUIRE(findings[0].affectedUrls == std::vector<std::string>{kRoot, "https://example.com/a"});
        REQUIRE(findings[0].detail == "0.50 internal links per page");
    }

    SECTION("Well linked graph") {
        std::vector<PageRecord> pages{
            healthyPage(kRoot, "Home", {"https://example.com/a", "https://example.com/b"}),
            healthyPage("https://example.com/a", "A", {kRoot, "https://example.com/b"}),
            healthyPage("https://example.com/b", "B", {kRoot, "https://example.com/a"}),
        };
        LinkGraph graph = buildGraph(pages);

        std::vector<Finding> findings;
        aggregator.checkInternalLinking(graph, findings);
        REQUIRE(findings.empty());
    }

    SECTION("A single page is not judged") {
        std::vector<PageRecord> pages{healthyPage(kRoot, "Home")};
        std::vector<Finding> findings;
        aggregator.checkInternalLinking(buildGraph(pages), findings);
        REQUIRE(findings.empty());
    }
}

TEST_CASE("InsightAggregator inspects how the root page renders", "[InsightAggregator]") {
    InsightAggregator aggregator;

    PageRecord root = healthyPage(kRoot, "App");
    root.textLength = 40;

    SECTION("Script-heavy empty shell") {
        root.scriptCount = 25;
        std::vector<PageRecord> pages{root};
        std::vector<Finding> findings;
        aggregator.checkRendering(sortedPointers(pages), buildGraph(pages), findings);

        REQUIRE(findings.size() == 1);
        REQUIRE(findings[0].category == FindingCategory::CLIENT_SIDE_RENDERING);
        REQUIRE(findings[0].severity == Severity::HIGH);
        REQUIRE(findings[0].detail == "40 characters of text with 25 scripts");
    }

    SECTION("Noscript fallback") {
        root.hasNoscript = true;
        std::vector<PageRecord> pages{root};
        std::vector<Finding> findings;
        aggregator.checkRendering(sortedPointers(pages), buildGraph(pages), findings);

        REQUIRE(findings.size() == 1);
        REQUIRE(findings[0].severity == Severity::LOW);
    }

    SECTION("No structured data") {
        root.textLength = 5000;
        root.structuredDataTypes.clear();
        std::vector<PageRecord> pages{root};
        std::vector<Finding> findings;
        aggregator.checkRendering(sortedPointers(pages), buildGraph(pages), findings);

        REQUIRE(findings.size() == 1);
        REQUIRE(findings[0].category == FindingCategory::MISSING_STRUCTURED_DATA);
    }

    SECTION("Images without alt text") {
        root.imagesWithoutAlt = 3;
        std::vector<PageRecord> pages{root};
        std::vector<Finding> findings;
        aggregator.checkImages(sortedPointers(pages), findings);

        REQUIRE(findings.size() == 1);
        REQUIRE(findings[0].detail == "3 image(s) without alt text");
    }
}

TEST_CASE("InsightAggregator output is deterministic", "[InsightAggregator]") {
    InsightAggregator aggregator;

    std::vector<PageRecord> pages{
        healthyPage(kRoot, "Welcome", {"https://example.com/a", "https://example.com/b",
                                       "https://example.com/missing"}),
        healthyPage("https://example.com/a", "Home"),
        healthyPage("https://example.com/b", "Home"),
        failedPage("https://example.com/missing", FetchFailureKind::HTTP_ERROR, 404),
    };
    pages[1].title.reset();
    pages[2].h1s = {"One", "Two"};
    LinkGraph graph = buildGraph(pages);

    auto first = aggregator.analyze(pages, graph);
    auto second = aggregator.analyze(pages, graph);
    REQUIRE(first == second);

    std::vector<PageRecord> shuffled = pages;
    std::mt19937 rng(42);
    std::shuffle(shuffled.begin(), shuffled.end(), rng);
    REQUIRE(aggregator.analyze(shuffled, graph) == first);

    SECTION("Findings are ordered by category, then URL, then detail") {
        REQUIRE_FALSE(first.empty());
        REQUIRE(std::is_sorted(first.begin(), first.end(), findingLess));
        // "About Home" is shared by /a and /b
        REQUIRE(first.front().category == FindingCategory::DUPLICATE_META);
    }

    SECTION("Summary counts follow the findings") {
        AuditSummary summary = aggregator.summarize(pages, graph, first);
        REQUIRE(summary.pagesCrawled == 4);
        REQUIRE(summary.pagesSucceeded == 3);
        REQUIRE(summary.missingTitles == 1);
        REQUIRE(summary.multipleH1 == 1);
        REQUIRE(summary.brokenLinks == 1);
        REQUIRE(summary.orphanPages == 0);
        REQUIRE(summary.renderingMode == "SSR");
        REQUIRE(summary.rootStructuredDataTypes == std::vector<std::string>{"Organization"});
        REQUIRE_THAT(summary.averageClickDepth, WithinAbs(2.0 / 3.0, 1e-9));
        REQUIRE_THAT(summary.internalLinksPerPage, WithinAbs(1.0, 1e-9));
    }
}
