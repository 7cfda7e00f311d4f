#pragma once

#include <chrono>
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace seo_audit::crawler {

struct RobotsRule {
    std::string pattern;  // path pattern as written, e.g. "/private*" or "/*.pdf$"
    std::regex regex;
    bool allow = false;
};

// Rules that apply to one user agent after group selection
struct RobotsRules {
    std::vector<RobotsRule> rules;
    std::optional<std::chrono::milliseconds> crawlDelay;
    std::vector<std::string> sitemaps;
    // Group matched for our agent: the product token, "*", or empty when none
    std::string matchedGroup;
    size_t groupCount = 0;
};

// Read-only crawl scope for one audit run
class CrawlPolicy {
public:
    CrawlPolicy() = default;
    CrawlPolicy(std::string userAgent, RobotsRules rules, bool robotsFound);

    // A policy with no rules, used when robots.txt is unavailable
    static CrawlPolicy permissive(const std::string& userAgent);

    // Longest matching rule decides, Allow wins ties, no match means allowed.
    bool isAllowed(const std::string& url) const;

    const std::string& getUserAgent() const { return userAgent_; }
    std::optional<std::chrono::milliseconds> getCrawlDelay() const { return rules_.crawlDelay; }
    const std::vector<RobotsRule>& getRules() const { return rules_.rules; }
    const std::vector<std::string>& getDeclaredSitemaps() const { return rules_.sitemaps; }
    const std::string& getMatchedGroup() const { return rules_.matchedGroup; }
    bool robotsFound() const { return robotsFound_; }

private:
    std::string userAgent_;
    RobotsRules rules_;
    bool robotsFound_ = false;
};

} // namespace seo_audit::crawler
