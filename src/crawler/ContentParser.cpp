#include "ContentParser.h"
#include "../../include/Logger.h"
#include "../../include/seo_audit/common/UrlUtils.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <functional>
#include <strings.h>

namespace seo_audit::crawler {

struct ContentParser::WalkState {
    std::string baseUrl;
    ParsedContent result;
    std::string text;
};

namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool equalsIgnoreCase(const char* a, const char* b) {
    return a && b && strcasecmp(a, b) == 0;
}

} // namespace

ParsedContent ContentParser::parse(const std::string& html, const std::string& baseUrl) const {
    LOG_DEBUG("ContentParser::parse called for URL: " + baseUrl + " with HTML length: " +
              std::to_string(html.length()) + " bytes");

    WalkState state;
    state.baseUrl = baseUrl;

    GumboOutput* output = gumbo_parse_with_options(&kGumboDefaultOptions, html.data(), html.size());
    if (!output) {
        LOG_ERROR("Failed to parse HTML with Gumbo: " + baseUrl);
        return state.result;
    }

    walk(output->root, state);
    gumbo_destroy_output(&kGumboDefaultOptions, output);

    state.result.textLength = collapseWhitespace(state.text).size();

    LOG_DEBUG("Extracted " + std::to_string(state.result.links.size()) + " links, " +
              std::to_string(state.result.h1s.size()) + " h1, text length " +
              std::to_string(state.result.textLength) + " from " + baseUrl);
    return std::move(state.result);
}

void ContentParser::walk(const GumboNode* node, WalkState& state) const {
    if (node->type == GUMBO_NODE_TEXT || node->type == GUMBO_NODE_WHITESPACE ||
        node->type == GUMBO_NODE_CDATA) {
        state.text += node->v.text.text;
        state.text += ' ';
        return;
    }
    if (node->type != GUMBO_NODE_ELEMENT && node->type != GUMBO_NODE_TEMPLATE) {
        return;
    }

    ParsedContent& result = state.result;
    const GumboElement& element = node->v.element;

    switch (element.tag) {
        case GUMBO_TAG_TITLE:
            if (!result.title) {
                result.title = collapseWhitespace(nodeText(node));
            }
            return;

        case GUMBO_TAG_BASE:
            if (const char* href = attribute(node, "href")) {
                state.baseUrl = common::resolveUrl(state.baseUrl, href);
            }
            return;

        case GUMBO_TAG_META: {
            const char* name = attribute(node, "name");
            const char* content = attribute(node, "content");
            if (equalsIgnoreCase(name, "description") && !result.metaDescription) {
                result.metaDescription = collapseWhitespace(content ? content : "");
            } else if (equalsIgnoreCase(name, "robots") && !result.metaRobots) {
                result.metaRobots = toLower(collapseWhitespace(content ? content : ""));
            }
            return;
        }

        case GUMBO_TAG_LINK: {
            const char* rel = attribute(node, "rel");
            const char* href = attribute(node, "href");
            if (rel && href && !result.canonical && toLower(collapseWhitespace(rel)) == "canonical") {
                result.canonical = common::resolveUrl(state.baseUrl, href);
            }
            return;
        }

        case GUMBO_TAG_SCRIPT: {
            result.scriptCount++;
            const char* type = attribute(node, "type");
            if (equalsIgnoreCase(type, "application/ld+json")) {
                for (auto& schemaType : extractJsonLdTypes(nodeText(node))) {
                    if (std::find(result.structuredDataTypes.begin(), result.structuredDataTypes.end(),
                                  schemaType) == result.structuredDataTypes.end()) {
                        result.structuredDataTypes.push_back(std::move(schemaType));
                    }
                }
            }
            return;
        }

        case GUMBO_TAG_STYLE:
            return;

        case GUMBO_TAG_NOSCRIPT:
            result.hasNoscript = true;
            return;

        case GUMBO_TAG_H1:
            result.h1s.push_back(collapseWhitespace(nodeText(node)));
            break;

        case GUMBO_TAG_H2:
            result.h2Count++;
            break;

        case GUMBO_TAG_IMG:
            if (!attribute(node, "alt")) {
                result.imagesWithoutAlt++;
            }
            break;

        case GUMBO_TAG_A: {
            const char* href = attribute(node, "href");
            if (href && isFollowableHref(href)) {
                std::string resolved = common::resolveUrl(state.baseUrl, href);
                if (common::hasHttpScheme(resolved)) {
                    result.links.push_back(std::move(resolved));
                }
            }
            break;
        }

        default:
            break;
    }

    for (unsigned int i = 0; i < element.children.length; ++i) {
        walk(static_cast<const GumboNode*>(element.children.data[i]), state);
    }
}

std::string ContentParser::nodeText(const GumboNode* node) {
    if (node->type == GUMBO_NODE_TEXT || node->type == GUMBO_NODE_WHITESPACE ||
        node->type == GUMBO_NODE_CDATA) {
        return node->v.text.text;
    }
    if (node->type != GUMBO_NODE_ELEMENT && node->type != GUMBO_NODE_TEMPLATE) {
        return "";
    }

    std::string text;
    const GumboVector& children = node->v.element.children;
    for (unsigned int i = 0; i < children.length; ++i) {
        if (!text.empty()) {
            text += ' ';
        }
        text += nodeText(static_cast<const GumboNode*>(children.data[i]));
    }
    return text;
}

const char* ContentParser::attribute(const GumboNode* node, const char* name) {
    GumboAttribute* attr = gumbo_get_attribute(&node->v.element.attributes, name);
    return attr ? attr->value : nullptr;
}

bool ContentParser::isFollowableHref(const std::string& href) {
    std::string lower = toLower(collapseWhitespace(href));
    if (lower.empty() || lower[0] == '#') {
        return false;
    }
    for (const char* scheme : {"javascript:", "mailto:", "tel:", "data:", "sms:", "ftp:"}) {
        if (lower.rfind(scheme, 0) == 0) {
            return false;
        }
    }
    return true;
}

std::vector<std::string> ContentParser::extractJsonLdTypes(const std::string& json) {
    std::vector<std::string> types;

    nlohmann::json document = nlohmann::json::parse(json, nullptr, false);
    if (document.is_discarded()) {
        LOG_DEBUG("Ignoring malformed JSON-LD block");
        return types;
    }

    std::function<void(const nlohmann::json&)> collect = [&](const nlohmann::json& node) {
        if (node.is_array()) {
            for (const auto& item : node) {
                collect(item);
            }
            return;
        }
        if (!node.is_object()) {
            return;
        }
        auto typeIt = node.find("@type");
        if (typeIt != node.end()) {
            if (typeIt->is_string()) {
                types.push_back(typeIt->get<std::string>());
            } else if (typeIt->is_array()) {
                for (const auto& t : *typeIt) {
                    if (t.is_string()) {
                        types.push_back(t.get<std::string>());
                    }
                }
            }
        }
        auto graphIt = node.find("@graph");
        if (graphIt != node.end()) {
            collect(*graphIt);
        }
    };

    collect(document);
    return types;
}

std::string ContentParser::collapseWhitespace(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    bool pendingSpace = false;
    for (unsigned char c : text) {
        if (std::isspace(c)) {
            pendingSpace = !out.empty();
            continue;
        }
        if (pendingSpace) {
            out += ' ';
            pendingSpace = false;
        }
        out += static_cast<char>(c);
    }
    return out;
}

} // namespace seo_audit::crawler
