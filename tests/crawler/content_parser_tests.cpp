#include <catch2/catch_test_macros.hpp>
#include "ContentParser.h"
#include <algorithm>

using namespace seo_audit::crawler;

TEST_CASE("ContentParser extracts page signals", "[ContentParser]") {
    ContentParser parser;

    const std::string html = R"(
        <html>
        <head>
            <title>
                Test   Page
            </title>
            <meta name="Description" content="  A page for   testing ">
            <meta name="robots" content="NOINDEX, follow">
            <link rel="canonical" href="/canonical-page">
            <script type="application/ld+json">{"@context": "https://schema.org", "@type": "Organization"}</script>
            <script src="/app.js"></script>
        </head>
        <body>
            <h1>Main  Heading</h1>
            <h1>Second heading</h1>
            <h2>Sub</h2><h2>Sub 2</h2>
            <p>Some visible text.</p>
            <img src="/a.png">
            <img src="/b.png" alt="">
            <noscript>Enable JavaScript</noscript>
        </body>
        </html>
    )";

    auto result = parser.parse(html, "https://example.com/page");

    REQUIRE(result.title == "Test Page");
    REQUIRE(result.metaDescription == "A page for testing");
    REQUIRE(result.metaRobots == "noindex, follow");
    REQUIRE(result.canonical == "https://example.com/canonical-page");
    REQUIRE(result.h1s == std::vector<std::string>{"Main Heading", "Second heading"});
    REQUIRE(result.h2Count == 2);
    REQUIRE(result.scriptCount == 2);
    REQUIRE(result.hasNoscript);
    REQUIRE(result.imagesWithoutAlt == 1);
    REQUIRE(result.structuredDataTypes == std::vector<std::string>{"Organization"});
    REQUIRE(result.textLength > 0);
}

TEST_CASE("ContentParser distinguishes absent from empty tags", "[ContentParser]") {
    ContentParser parser;

    SECTION("Absent tags are nullopt") {
        auto result = parser.parse("<html><body><p>Hello</p></body></html>", "https://example.com/");
        REQUIRE_FALSE(result.title.has_value());
        REQUIRE_FALSE(result.metaDescription.has_value());
        REQUIRE_FALSE(result.canonical.has_value());
        REQUIRE(result.h1s.empty());
    }

    SECTION("Blank tags are empty strings") {
        auto result = parser.parse(
            "<html><head><title>  </title><meta name=\"description\" content=\"\"></head></html>",
            "https://example.com/");
        REQUIRE(result.title.has_value());
        REQUIRE(result.title->empty());
        REQUIRE(result.metaDescription.has_value());
        REQUIRE(result.metaDescription->empty());
    }
}

TEST_CASE("ContentParser extracts links", "[ContentParser]") {
    ContentParser parser;

    const std::string html = R"(
        <html><body>
            <a href="/about">About</a>
            <a href="contact">Contact</a>
            <a href="https://other.com/x">External</a>
            <a href="#top">Top</a>
            <a href="mailto:hello@example.com">Mail</a>
            <a href="javascript:void(0)">JS</a>
            <a href="tel:+123">Call</a>
            <a>No href</a>
        </body></html>
    )";

    auto result = parser.parse(html, "https://example.com/dir/page");
    REQUIRE(result.links == std::vector<std::string>{
        "https://example.com/about",
        "https://example.com/dir/contact",
        "https://other.com/x"
    });

    SECTION("Base href changes link resolution") {
        auto based = parser.parse(
            "<html><head><base href=\"https://example.com/docs/\"></head><body><a href=\"intro\">x</a></body></html>",
            "https://example.com/index");
        REQUIRE(based.links == std::vector<std::string>{"https://example.com/docs/intro"});
    }
}

TEST_CASE("ContentParser reads JSON-LD types", "[ContentParser]") {
    SECTION("Graph and type arrays") {
        auto types = ContentParser::extractJsonLdTypes(R"({
            "@context": "https://schema.org",
            "@graph": [
                {"@type": "WebSite"},
                {"@type": ["Organization", "LocalBusiness"]}
            ]
        })");
        REQUIRE(types == std::vector<std::string>{"WebSite", "Organization", "LocalBusiness"});
    }

    SECTION("Malformed JSON yields nothing") {
        REQUIRE(ContentParser::extractJsonLdTypes("{\"@type\": ").empty());
    }

    SECTION("Visible text of a script-only shell is small") {
        ContentParser parser;
        std::string shell = "<html><head><title>App</title></head><body><div id=\"root\"></div>";
        for (int i = 0; i < 25; ++i) {
            shell += "<script src=\"/chunk" + std::to_string(i) + ".js\"></script>";
        }
        shell += "</body></html>";
        auto result = parser.parse(shell, "https://example.com/");
        REQUIRE(result.scriptCount == 25);
        REQUIRE(result.textLength == 0);
    }
}

TEST_CASE("ContentParser collapses whitespace", "[ContentParser]") {
    REQUIRE(ContentParser::collapseWhitespace("  a \n\t b  ") == "a b");
    REQUIRE(ContentParser::collapseWhitespace("").empty());
}
