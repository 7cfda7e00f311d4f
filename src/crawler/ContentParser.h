#pragma once

#include <string>
#include <vector>
#include <optional>
#include <gumbo.h>

namespace seo_audit::crawler {

// Typed signals extracted from one HTML document. Optional fields are
// std::nullopt when the element is absent and an empty string when present
// but blank.
struct ParsedContent {
    std::optional<std::string> title;
    std::optional<std::string> metaDescription;
    std::optional<std::string> metaRobots;
    std::optional<std::string> canonical;   // resolved against the document base
    std::vector<std::string> h1s;
    size_t h2Count = 0;
    std::vector<std::string> links;         // absolute http(s) <a href> targets
    size_t textLength = 0;                  // visible text, whitespace collapsed
    size_t scriptCount = 0;
    bool hasNoscript = false;
    size_t imagesWithoutAlt = 0;
    std::vector<std::string> structuredDataTypes;  // JSON-LD @type values
};

class ContentParser {
public:
    ContentParser() = default;

    // Parse HTML content in a single gumbo pass. baseUrl is the URL the
    // document was served from; a <base href> overrides it for links.
    ParsedContent parse(const std::string& html, const std::string& baseUrl) const;

    // Collect schema.org @type values from one JSON-LD block. Malformed JSON yields nothing.
    static std::vector<std::string> extractJsonLdTypes(const std::string& json);

    // Trim and collapse runs of whitespace to one space
    static std::string collapseWhitespace(const std::string& text);

private:
    struct WalkState;

    void walk(const GumboNode* node, WalkState& state) const;

    static std::string nodeText(const GumboNode* node);
    static const char* attribute(const GumboNode* node, const char* name);
    static bool isFollowableHref(const std::string& href);
};

} // namespace seo_audit::crawler
