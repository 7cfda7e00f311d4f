#include "../../include/seo_audit/crawler/models/CrawlPolicy.h"
#include "../../include/seo_audit/common/UrlUtils.h"
#include "../../include/Logger.h"

namespace seo_audit::crawler {

CrawlPolicy::CrawlPolicy(std::string userAgent, RobotsRules rules, bool robotsFound)
    : userAgent_(std::move(userAgent))
    , rules_(std::move(rules))
    , robotsFound_(robotsFound) {
}

CrawlPolicy CrawlPolicy::permissive(const std::string& userAgent) {
    return CrawlPolicy(userAgent, RobotsRules{}, false);
}

bool CrawlPolicy::isAllowed(const std::string& url) const {
    if (rules_.rules.empty()) {
        return true;
    }

    const std::string path = common::extractPathAndQuery(url);
    const RobotsRule* best = nullptr;

    for (const auto& rule : rules_.rules) {
        if (!std::regex_search(path, rule.regex)) {
            continue;
        }
        if (!best || rule.pattern.size() > best->pattern.size() ||
            (rule.pattern.size() == best->pattern.size() && rule.allow && !best->allow)) {
            best = &rule;
        }
    }

    if (!best) {
        return true;
    }

    LOG_TRACE("Robots rule '" + best->pattern + "' (" + (best->allow ? "allow" : "disallow") +
              ") decides " + url);
    return best->allow;
}

} // namespace seo_audit::crawler
