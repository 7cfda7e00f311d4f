#include <catch2/catch_test_macros.hpp>
#include "audit/AuditJson.h"
#include "audit/AuditPipeline.h"
#include "../support/FakeHttpTransport.h"
#include <algorithm>
#include <stdexcept>

using namespace seo_audit::audit;
using seo_audit::crawler::AuditConfig;
using seo_audit::insights::Finding;
using seo_audit::insights::FindingCategory;
using seo_audit::insights::Severity;
using seo_audit::testing::FakeClock;
using seo_audit::testing::FakeHttpTransport;
using seo_audit::testing::htmlPage;
using namespace std::chrono_literals;

namespace {

AuditConfig pipelineConfig() {
    AuditConfig config;
    config.politenessDelay = 0ms;
    config.maxConcurrentConnections = 4;
    config.baseRetryDelay = 1ms;
    config.wallClockBudget = 30000ms;
    return config;
}

std::string sitemapXml(const std::vector<std::string>& urls) {
    std::string xml = "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
                      "<urlset xmlns=\"http://www.sitemaps.org/schemas/sitemap/0.9\">\n";
    for (const auto& url : urls) {
        xml += "  <url><loc>" + url + "</loc></url>\n";
    }
    return xml + "</urlset>\n";
}

void addRobotsWithSitemap(FakeHttpTransport& transport, const std::vector<std::string>& urls,
                          const std::string& extraRules = "") {
    transport.addPage("https://example.com/robots.txt",
                      "User-agent: *\n" + extraRules + "Disallow: /private\n"
                      "Sitemap: https://example.com/sitemap.xml\n",
                      200, "text/plain");
    transport.addPage("https://example.com/sitemap.xml", sitemapXml(urls), 200, "application/xml");
}

std::vector<Finding> ofCategory(const AuditResult& result, FindingCategory category) {
    std::vector<Finding> selected;
    std::copy_if(result.findings.begin(), result.findings.end(), std::back_inserter(selected),
                 [category](const Finding& f) { return f.category == category; });
    return selected;
}

const seo_audit::crawler::PageRecord* findPage(const AuditResult& result, const std::string& url) {
    auto it = std::find_if(result.pages.begin(), result.pages.end(),
                           [&url](const seo_audit::crawler::PageRecord& page) { return page.url == url; });
    return it == result.pages.end() ? nullptr : &*it;
}

} // namespace

TEST_CASE("AuditPipeline rejects unusable root URLs", "[AuditPipeline]") {
    AuditPipeline pipeline(pipelineConfig(), std::make_shared<FakeHttpTransport>());

    REQUIRE_THROWS_AS(pipeline.run("not a url"), std::invalid_argument);
    REQUIRE_THROWS_AS(pipeline.run("ftp://example.com/"), std::invalid_argument);
    REQUIRE_THROWS_AS(pipeline.run("http://"), std::invalid_argument);
    REQUIRE_THROWS_AS(pipeline.run(""), std::invalid_argument);

    REQUIRE_THROWS_AS(AuditPipeline(pipelineConfig(), nullptr), std::invalid_argument);
}

TEST_CASE("AuditPipeline audits a small site", "[AuditPipeline]") {
    auto transport = std::make_shared<FakeHttpTransport>();
    transport->addPage("https://example.com/",
                       htmlPage("Welcome", {"/about", "/about", "/team", "/gone", "https://other.org/"}));
    transport->addPage("https://example.com/about", htmlPage("Home", {"/", "/team"}));
    transport->addPage("https://example.com/team", htmlPage("Home", {"/about"}));

    AuditPipeline pipeline(pipelineConfig(), transport);
    AuditResult result = pipeline.run("https://EXAMPLE.com");

    REQUIRE(result.metadata.rootUrl == "https://example.com/");
    REQUIRE(result.metadata.status == RunStatus::COMPLETE);
    REQUIRE(result.metadata.stopReason == "frontier exhausted");
    REQUIRE(result.pages.size() == 4);
    REQUIRE(result.metadata.pagesSucceeded == 3);
    REQUIRE(result.metadata.pagesFailed == 1);

    SECTION("Every URL is fetched once no matter how often it is linked") {
        REQUIRE(transport->requestCount("https://example.com/") == 1);
        REQUIRE(transport->requestCount("https://example.com/about") == 1);
        REQUIRE(transport->requestCount("https://example.com/team") == 1);
        REQUIRE(transport->requestCount("https://other.org/") == 0);
    }

    SECTION("Pages sharing a title are reported together") {
        auto duplicates = ofCategory(result, FindingCategory::DUPLICATE_TITLE);
        REQUIRE(duplicates.size() == 1);
        REQUIRE(duplicates[0].affectedUrls ==
                std::vector<std::string>{"https://example.com/about", "https://example.com/team"});
        REQUIRE(duplicates[0].detail == "Title \"Home\" is shared by 2 pages");
    }

    SECTION("A 404 is a broken link naming the page that links to it") {
        auto broken = ofCategory(result, FindingCategory::BROKEN_LINK);
        REQUIRE(broken.size() == 1);
        REQUIRE(broken[0].severity == Severity::HIGH);
        REQUIRE(broken[0].affectedUrls ==
                std::vector<std::string>{"https://example.com/gone", "https://example.com/"});
        REQUIRE(broken[0].detail == "HTTP 404, linked from 1 page(s)");
    }

    SECTION("The graph matches the crawl") {
        REQUIRE(result.graph.find("https://example.com/")->isRoot);
        REQUIRE(result.graph.find("https://example.com/about")->depth == 1);
        REQUIRE(result.graph.find("https://example.com/team")->inDegree == 2);
        REQUIRE(result.graph.find("https://other.org/") == nullptr);
        REQUIRE(result.summary.pagesCrawled == 4);
        REQUIRE(result.summary.brokenLinks == 1);
    }

    SECTION("Missing policy documents become warnings") {
        REQUIRE_FALSE(result.metadata.warnings.empty());
        REQUIRE(result.sitemapUrls.empty());
    }
}

TEST_CASE("AuditPipeline honours the depth limit", "[AuditPipeline]") {
    auto transport = std::make_shared<FakeHttpTransport>();
    transport->addPage("https://example.com/", htmlPage("Home", {"/a", "/b"}));
    transport->addPage("https://example.com/a", htmlPage("A"));

    AuditConfig config = pipelineConfig();
    config.maxDepth = 0;
    AuditPipeline pipeline(config, transport);
    AuditResult result = pipeline.run("https://example.com/");

    REQUIRE(result.metadata.status == RunStatus::COMPLETE);
    REQUIRE(result.pages.size() == 1);
    REQUIRE(result.pages[0].url == "https://example.com/");
    REQUIRE(transport->requestCount("https://example.com/a") == 0);
    // Links beyond the limit are still edges of the root
    REQUIRE(result.graph.find("https://example.com/")->outDegree == 2);
}

TEST_CASE("AuditPipeline compares the sitemap with what the crawl reached", "[AuditPipeline]") {
    auto transport = std::make_shared<FakeHttpTransport>();
    addRobotsWithSitemap(*transport, {
        "https://example.com/",
        "https://example.com/linked",
        "https://example.com/lonely",
        "https://example.com/private/page",
        "https://elsewhere.com/foreign",
    });
    transport->addPage("https://example.com/", htmlPage("Home", {"/linked", "/unlisted"}));
    transport->addPage("https://example.com/linked", htmlPage("Linked", {"/"}));
    transport->addPage("https://example.com/lonely", htmlPage("Lonely"));
    transport->addPage("https://example.com/unlisted", htmlPage("Unlisted", {"/"}));

    AuditPipeline pipeline(pipelineConfig(), transport);
    AuditResult result = pipeline.run("https://example.com/");

    REQUIRE(result.sitemapDocuments == std::vector<std::string>{"https://example.com/sitemap.xml"});
    REQUIRE(result.sitemapUrls.count("https://example.com/lonely") == 1);
    REQUIRE(result.sitemapUrls.count("https://elsewhere.com/foreign") == 0);

    SECTION("Sitemap URLs are crawled as seeds") {
        const auto* lonely = findPage(result, "https://example.com/lonely");
        REQUIRE(lonely != nullptr);
        REQUIRE(lonely->depth == 0);
        REQUIRE(lonely->source == seo_audit::crawler::DiscoverySource::SITEMAP);
    }

    SECTION("robots.txt keeps disallowed sitemap URLs out") {
        REQUIRE(transport->requestCount("https://example.com/private/page") == 0);
        REQUIRE(result.graph.find("https://example.com/private/page") == nullptr);
    }

    SECTION("An unlinked sitemap URL is an orphan") {
        auto orphans = ofCategory(result, FindingCategory::ORPHAN_PAGE);
        REQUIRE(orphans.size() == 1);
        REQUIRE(orphans[0].affectedUrls == std::vector<std::string>{"https://example.com/lonely"});
        REQUIRE(result.summary.orphanPages == 1);
    }

    SECTION("A linked page missing from the sitemap is uncatalogued") {
        auto uncatalogued = ofCategory(result, FindingCategory::UNCATALOGUED_PAGE);
        REQUIRE(uncatalogued.size() == 1);
        REQUIRE(uncatalogued[0].affectedUrls == std::vector<std::string>{"https://example.com/unlisted"});
    }
}

TEST_CASE("AuditPipeline reports redirects", "[AuditPipeline]") {
    auto transport = std::make_shared<FakeHttpTransport>();
    transport->addPage("https://example.com/", htmlPage("Home", {"/old"}));
    transport->addRedirect("https://example.com/old", "/new");
    transport->addPage("https://example.com/new", htmlPage("New"));

    AuditPipeline pipeline(pipelineConfig(), transport);
    AuditResult result = pipeline.run("https://example.com/");

    const auto* old = findPage(result, "https://example.com/old");
    REQUIRE(old != nullptr);
    REQUIRE(old->succeeded());
    REQUIRE(old->finalUrl == "https://example.com/new");

    auto redirects = ofCategory(result, FindingCategory::REDIRECT_CHAIN);
    REQUIRE(redirects.size() == 1);
    REQUIRE(redirects[0].severity == Severity::MEDIUM);
    REQUIRE(redirects[0].affectedUrls ==
            std::vector<std::string>{"https://example.com/old", "https://example.com/new"});
    REQUIRE(result.summary.redirects == 1);
}

TEST_CASE("AuditPipeline counts a redirect as a link to its target", "[AuditPipeline]") {
    auto transport = std::make_shared<FakeHttpTransport>();
    addRobotsWithSitemap(*transport, {"https://example.com/", "https://example.com/new"});
    transport->addPage("https://example.com/", htmlPage("Home", {"/old"}));
    transport->addRedirect("https://example.com/old", "/new");
    transport->addPage("https://example.com/new", htmlPage("New"));

    AuditResult result = AuditPipeline(pipelineConfig(), transport).run("https://example.com/");

    REQUIRE(ofCategory(result, FindingCategory::ORPHAN_PAGE).empty());
    const auto* target = result.graph.find("https://example.com/new");
    REQUIRE(target != nullptr);
    REQUIRE(target->inDegree == 1);
    REQUIRE(target->depth == 2);
    REQUIRE(result.summary.orphanPages == 0);
}

TEST_CASE("AuditPipeline spaces requests to one host", "[AuditPipeline]") {
    auto transport = std::make_shared<FakeHttpTransport>();
    transport->addPage("https://example.com/", htmlPage("Home", {"/a", "/b", "/c"}));
    transport->addPage("https://example.com/a", htmlPage("A"));
    transport->addPage("https://example.com/b", htmlPage("B"));
    transport->addPage("https://example.com/c", htmlPage("C"));

    AuditConfig config = pipelineConfig();
    config.politenessDelay = 150ms;
    AuditPipeline pipeline(config, transport);
    AuditResult result = pipeline.run("https://example.com/");

    REQUIRE(result.pages.size() == 4);
    REQUIRE(result.metadata.crawlDelay == 150ms);

    auto times = transport->pageRequestTimes();
    REQUIRE(times.size() == 4);
    for (size_t i = 1; i < times.size(); ++i) {
        REQUIRE(times[i] - times[i - 1] >= 150ms);
    }
}

TEST_CASE("AuditPipeline spaces retries like any other request", "[AuditPipeline]") {
    auto transport = std::make_shared<FakeHttpTransport>();
    transport->addPage("https://example.com/", htmlPage("Home", {"/a", "/b"}));
    transport->addPage("https://example.com/a", "Service Unavailable", 503);
    transport->addPage("https://example.com/a", htmlPage("A"));
    transport->addPage("https://example.com/b", htmlPage("B"));

    AuditConfig config = pipelineConfig();
    config.politenessDelay = 150ms;
    AuditResult result = AuditPipeline(config, transport).run("https://example.com/");

    REQUIRE(result.metadata.pagesSucceeded == 3);
    REQUIRE(result.metadata.retries == 1);
    REQUIRE(transport->requestCount("https://example.com/a") == 2);

    auto times = transport->pageRequestTimes();
    REQUIRE(times.size() == 4);
    for (size_t i = 1; i < times.size(); ++i) {
        REQUIRE(times[i] - times[i - 1] >= 150ms);
    }
}

TEST_CASE("AuditPipeline takes the larger of politeness and Crawl-delay", "[AuditPipeline]") {
    auto transport = std::make_shared<FakeHttpTransport>();
    addRobotsWithSitemap(*transport, {"https://example.com/"}, "Crawl-delay: 2\n");
    transport->addPage("https://example.com/", htmlPage("Home"));

    AuditConfig config = pipelineConfig();
    config.politenessDelay = 500ms;

    SECTION("robots.txt respected") {
        AuditResult result = AuditPipeline(config, transport).run("https://example.com/");
        REQUIRE(result.metadata.crawlDelay == 2000ms);
    }

    SECTION("robots.txt ignored") {
        config.respectRobotsTxt = false;
        AuditResult result = AuditPipeline(config, transport).run("https://example.com/");
        REQUIRE(result.metadata.crawlDelay == 500ms);
    }
}

TEST_CASE("AuditPipeline returns a partial result when the wall-clock budget runs out", "[AuditPipeline]") {
    std::vector<std::string> sitemap{"https://example.com/"};
    auto transport = std::make_shared<FakeHttpTransport>();
    transport->addPage("https://example.com/", htmlPage("Home"));
    for (int i = 1; i < 20; ++i) {
        const std::string url = "https://example.com/page-" + std::to_string(i);
        sitemap.push_back(url);
        transport->addPage(url, htmlPage("Page " + std::to_string(i)));
    }
    addRobotsWithSitemap(*transport, sitemap);

    // Every page request costs 100ms of pipeline time
    FakeClock clock;
    transport->attachClock(&clock, 100ms);

    AuditConfig config = pipelineConfig();
    config.maxConcurrentConnections = 1;
    config.wallClockBudget = 1000ms;

    AuditPipeline pipeline(config, transport, clock.asFunction());
    AuditResult result;
    REQUIRE_NOTHROW(result = pipeline.run("https://example.com/"));

    REQUIRE(result.metadata.status == RunStatus::PARTIAL);
    REQUIRE(result.metadata.stopReason == "wall-clock budget");
    REQUIRE(result.metadata.pagesSucceeded == 10);
    REQUIRE(result.metadata.discardedUrls == 10);
    REQUIRE(result.pages.size() == 10);
    // Analysis still runs on what was collected
    REQUIRE(result.summary.pagesCrawled == 10);
    REQUIRE(result.summary.sitemapUrls == 20);
}

TEST_CASE("AuditPipeline keeps policy resolution inside the wall-clock budget", "[AuditPipeline]") {
    // No robots.txt and no sitemap anywhere, every request takes 200ms
    auto transport = std::make_shared<FakeHttpTransport>();
    transport->setLatency(200ms);

    AuditConfig config = pipelineConfig();
    config.wallClockBudget = 500ms;

    AuditResult result;
    REQUIRE_NOTHROW(result = AuditPipeline(config, transport).run("https://example.com/"));

    auto requests = transport->requests();
    REQUIRE(requests.size() <= 4);
    for (const auto& request : requests) {
        REQUIRE(request.timeout <= 500ms);
    }
    REQUIRE(result.metadata.elapsed < 1500ms);
    REQUIRE(result.metadata.status == RunStatus::PARTIAL);
    REQUIRE(result.metadata.stopReason == "wall-clock budget");
    REQUIRE(result.metadata.pagesAttempted == 0);
    REQUIRE(std::any_of(result.metadata.warnings.begin(), result.metadata.warnings.end(),
                        [](const std::string& warning) {
                            return warning.find("Wall-clock budget exhausted") != std::string::npos;
                        }));
}

TEST_CASE("AuditPipeline stops at the page budget", "[AuditPipeline]") {
    auto transport = std::make_shared<FakeHttpTransport>();
    transport->addPage("https://example.com/", htmlPage("Home", {"/1", "/2", "/3", "/4"}));

    AuditConfig config = pipelineConfig();
    config.maxPages = 2;
    config.maxConcurrentConnections = 1;
    AuditResult result = AuditPipeline(config, transport).run("https://example.com/");

    REQUIRE(result.metadata.status == RunStatus::PARTIAL);
    REQUIRE(result.metadata.stopReason == "page budget");
    REQUIRE(result.pages.size() == 2);
}

TEST_CASE("Audit results serialize to the report document", "[AuditJson]") {
    auto transport = std::make_shared<FakeHttpTransport>();
    transport->addPage("https://example.com/", htmlPage("Home", {"/gone"}));

    AuditResult result = AuditPipeline(pipelineConfig(), transport).run("https://example.com/");
    json document = toJson(result);

    REQUIRE(document["metadata"]["status"] == "COMPLETE");
    REQUIRE(document["metadata"]["rootUrl"] == "https://example.com/");
    REQUIRE(document["metadata"]["startTime"].get<std::string>().back() == 'Z');
    REQUIRE(document["pages"].size() == 2);
    REQUIRE(document["graph"]["nodeCount"] == 2);
    REQUIRE(document["findingCount"] == result.findings.size());

    SECTION("Absent tags are null, not empty strings") {
        const json& gone = document["pages"][1]["url"] == "https://example.com/gone"
                               ? document["pages"][1] : document["pages"][0];
        REQUIRE(gone["title"].is_null());
        REQUIRE(gone["failure"]["kind"] == "HTTP_ERROR");
        REQUIRE(gone["failure"]["httpCode"] == 404);
    }

    SECTION("Findings are grouped by category in report order") {
        const json& groups = document["findings"];
        REQUIRE(groups.is_array());
        REQUIRE_FALSE(groups.empty());
        std::vector<std::string> categories;
        for (const auto& group : groups) {
            categories.push_back(group["category"].get<std::string>());
            REQUIRE_FALSE(group["findings"].empty());
        }
        auto broken = std::find(categories.begin(), categories.end(), "BROKEN_LINK");
        REQUIRE(broken != categories.end());
        REQUIRE(std::adjacent_find(categories.begin(), categories.end()) == categories.end());
    }
}
