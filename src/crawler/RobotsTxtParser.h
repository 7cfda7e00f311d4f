#pragma once

#include <string>
#include <regex>
#include "../../include/seo_audit/crawler/models/CrawlPolicy.h"

namespace seo_audit::crawler {

// Robots exclusion protocol parser.
//
// Consecutive User-agent lines form one group; a group ends when a rule line
// is followed by another User-agent line. The group naming our product token
// is used, otherwise the "*" group, otherwise no rules at all. Several groups
// naming the same agent are merged. Sitemap lines are global.
class RobotsTxtParser {
public:
    static RobotsRules parse(const std::string& content, const std::string& userAgent);

    // "SeoAuditBot/1.0 (+https://x)" -> "seoauditbot"
    static std::string productToken(const std::string& userAgent);

    // Convert a robots path pattern ("*" wildcard, "$" end anchor) to an anchored regex
    static std::regex patternToRegex(const std::string& pattern);
};

} // namespace seo_audit::crawler
