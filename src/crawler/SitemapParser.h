#pragma once

#include <optional>
#include <string>
#include <vector>

namespace seo_audit::crawler {

struct SitemapEntry {
    std::string loc;
    std::string lastmod;
    std::string changefreq;
    std::string priority;
};

struct SitemapData {
    std::vector<SitemapEntry> urls;           // <urlset> entries
    std::vector<std::string> sitemapUrls;     // nested sitemaps of a <sitemapindex>
    bool isIndex = false;
};

class SitemapParser {
public:
    /**
     * Parse a sitemap document: XML <urlset>, XML <sitemapindex>, or a plain
     * text list with one URL per line.
     * @param content Document body
     * @return Parsed data, or std::nullopt when the document is malformed or is
     *         neither a urlset nor a sitemap index
     */
    static std::optional<SitemapData> parse(const std::string& content);

    // Well-known sitemap locations probed when robots.txt declares none
    static std::vector<std::string> getCommonSitemapPaths();

private:
    static std::optional<SitemapData> parseXml(const std::string& content);
    static std::optional<SitemapData> parsePlainText(const std::string& content);
};

} // namespace seo_audit::crawler
