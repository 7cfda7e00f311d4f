#include "SitemapParser.h"
#include "../../include/Logger.h"

#include <libxml/parser.h>
#include <libxml/tree.h>

#include <sstream>

namespace seo_audit::crawler {

namespace {

// RAII wrapper for xmlDoc
class XmlDocGuard {
public:
    explicit XmlDocGuard(xmlDocPtr doc) : doc_(doc) {}
    ~XmlDocGuard() {
        if (doc_) {
            xmlFreeDoc(doc_);
        }
    }
    XmlDocGuard(const XmlDocGuard&) = delete;
    XmlDocGuard& operator=(const XmlDocGuard&) = delete;

    xmlDocPtr get() const { return doc_; }
    explicit operator bool() const { return doc_ != nullptr; }

private:
    xmlDocPtr doc_;
};

bool hasName(xmlNodePtr node, const char* name) {
    return node->type == XML_ELEMENT_NODE && xmlStrcmp(node->name, BAD_CAST name) == 0;
}

std::string trim(const std::string& value) {
    size_t start = value.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = value.find_last_not_of(" \t\r\n");
    return value.substr(start, end - start + 1);
}

std::string nodeText(xmlNodePtr node) {
    xmlChar* content = xmlNodeGetContent(node);
    if (!content) {
        return "";
    }
    std::string text = reinterpret_cast<const char*>(content);
    xmlFree(content);
    return trim(text);
}

std::string childText(xmlNodePtr parent, const char* name) {
    for (xmlNodePtr child = parent->children; child; child = child->next) {
        if (hasName(child, name)) {
            return nodeText(child);
        }
    }
    return "";
}

} // namespace

std::optional<SitemapData> SitemapParser::parse(const std::string& content) {
    const std::string body = trim(content);
    if (body.empty()) {
        LOG_DEBUG("SitemapParser::parse called with empty document");
        return std::nullopt;
    }
    if (body[0] == '<') {
        return parseXml(body);
    }
    return parsePlainText(body);
}

std::optional<SitemapData> SitemapParser::parseXml(const std::string& content) {
    XmlDocGuard doc(xmlReadMemory(content.c_str(),
                                  static_cast<int>(content.size()),
                                  nullptr,
                                  nullptr,
                                  XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING));
    if (!doc) {
        LOG_DEBUG("Sitemap document is not well-formed XML");
        return std::nullopt;
    }

    xmlNodePtr root = xmlDocGetRootElement(doc.get());
    if (!root) {
        return std::nullopt;
    }

    SitemapData data;
    if (hasName(root, "urlset")) {
        for (xmlNodePtr node = root->children; node; node = node->next) {
            if (!hasName(node, "url")) {
                continue;
            }
            SitemapEntry entry;
            entry.loc = childText(node, "loc");
            if (entry.loc.empty()) {
                continue;
            }
            entry.lastmod = childText(node, "lastmod");
            entry.changefreq = childText(node, "changefreq");
            entry.priority = childText(node, "priority");
            data.urls.push_back(std::move(entry));
        }
    } else if (hasName(root, "sitemapindex")) {
        data.isIndex = true;
        for (xmlNodePtr node = root->children; node; node = node->next) {
            if (!hasName(node, "sitemap")) {
                continue;
            }
            std::string loc = childText(node, "loc");
            if (!loc.empty()) {
                data.sitemapUrls.push_back(std::move(loc));
            }
        }
    } else {
        LOG_DEBUG("Unexpected sitemap root element: " + std::string(reinterpret_cast<const char*>(root->name)));
        return std::nullopt;
    }

    LOG_DEBUG("Parsed sitemap: " + std::to_string(data.urls.size()) + " urls, " +
              std::to_string(data.sitemapUrls.size()) + " nested sitemaps");
    return data;
}

std::optional<SitemapData> SitemapParser::parsePlainText(const std::string& content) {
    SitemapData data;
    std::istringstream stream(content);
    std::string line;
    while (std::getline(stream, line)) {
        line = trim(line);
        if (line.empty()) {
            continue;
        }
        if (line.rfind("http://", 0) != 0 && line.rfind("https://", 0) != 0) {
            LOG_DEBUG("Plain text sitemap contains a non-URL line, rejecting document");
            return std::nullopt;
        }
        data.urls.push_back(SitemapEntry{line, "", "", ""});
    }
    if (data.urls.empty()) {
        return std::nullopt;
    }
    return data;
}

std::vector<std::string> SitemapParser::getCommonSitemapPaths() {
    return {
        "/sitemap.xml",
        "/sitemap_index.xml",
        "/sitemap-index.xml",
        "/sitemap1.xml",
        "/sitemap-pages.xml",
        "/sitemap-posts.xml",
        "/sitemap-products.xml",
        "/sitemap-news.xml",
        "/sitemap_index/sitemap.xml"
    };
}

} // namespace seo_audit::crawler
