#include "RobotsTxtParser.h"
#include "../../include/Logger.h"
#include <sstream>
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <vector>

namespace seo_audit::crawler {

namespace {

struct Group {
    std::vector<std::string> agents;
    std::vector<RobotsRule> rules;
    std::optional<std::chrono::milliseconds> crawlDelay;
};

std::string trim(const std::string& value) {
    size_t start = value.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = value.find_last_not_of(" \t\r\n");
    return value.substr(start, end - start + 1);
}

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

} // namespace

std::string RobotsTxtParser::productToken(const std::string& userAgent) {
    std::string token = trim(userAgent);
    size_t end = token.find_first_of("/ ;(");
    if (end != std::string::npos) {
        token = token.substr(0, end);
    }
    return toLower(token);
}

std::regex RobotsTxtParser::patternToRegex(const std::string& pattern) {
    std::string regexStr = "^";
    for (size_t i = 0; i < pattern.size(); ++i) {
        char c = pattern[i];
        if (c == '*') {
            regexStr += ".*";
        } else if (c == '$' && i + 1 == pattern.size()) {
            regexStr += "$";
        } else if (std::string("\\^$.|?+()[]{}").find(c) != std::string::npos) {
            regexStr += '\\';
            regexStr += c;
        } else {
            regexStr += c;
        }
    }
    return std::regex(regexStr, std::regex::ECMAScript);
}

RobotsRules RobotsTxtParser::parse(const std::string& content, const std::string& userAgent) {
    const std::string token = productToken(userAgent);
    LOG_DEBUG("RobotsTxtParser::parse called for agent token: " + token +
              ", content length: " + std::to_string(content.size()));

    RobotsRules result;
    std::vector<Group> groups;
    bool groupHasDirectives = false;

    std::istringstream stream(content);
    std::string line;
    size_t lineNumber = 0;

    while (std::getline(stream, line)) {
        lineNumber++;
        size_t hash = line.find('#');
        if (hash != std::string::npos) {
            line.erase(hash);
        }
        line = trim(line);
        if (line.empty()) {
            continue;
        }

        size_t colon = line.find(':');
        if (colon == std::string::npos) {
            LOG_DEBUG("Ignoring robots.txt line " + std::to_string(lineNumber) + " without a field: " + line);
            continue;
        }

        std::string field = toLower(trim(line.substr(0, colon)));
        std::string value = trim(line.substr(colon + 1));

        if (field == "user-agent") {
            if (groups.empty() || groupHasDirectives) {
                groups.emplace_back();
                groupHasDirectives = false;
            }
            groups.back().agents.push_back(toLower(value));
            continue;
        }

        if (field == "sitemap") {
            if (!value.empty()) {
                result.sitemaps.push_back(value);
            }
            continue;
        }

        if (groups.empty()) {
            LOG_DEBUG("Ignoring robots.txt directive outside any group at line " + std::to_string(lineNumber));
            continue;
        }
        groupHasDirectives = true;
        Group& group = groups.back();

        if (field == "disallow" || field == "allow") {
            // An empty Disallow allows everything, an empty Allow means nothing
            if (value.empty()) {
                continue;
            }
            if (value[0] != '/' && value[0] != '*') {
                value = "/" + value;
            }
            RobotsRule rule;
            rule.pattern = value;
            rule.allow = field == "allow";
            try {
                rule.regex = patternToRegex(value);
            } catch (const std::regex_error& e) {
                LOG_WARNING("Skipping robots.txt pattern '" + value + "': " + e.what());
                continue;
            }
            group.rules.push_back(std::move(rule));
        } else if (field == "crawl-delay") {
            try {
                double seconds = std::stod(value);
                if (seconds >= 0) {
                    group.crawlDelay = std::chrono::milliseconds(static_cast<long long>(seconds * 1000.0));
                }
            } catch (const std::exception&) {
                LOG_WARNING("Invalid Crawl-delay value in robots.txt: '" + value + "'");
            }
        } else {
            LOG_TRACE("Unsupported robots.txt field: " + field);
        }
    }

    result.groupCount = groups.size();

    auto collect = [&](const std::string& agent) {
        bool matched = false;
        for (const auto& group : groups) {
            if (std::find(group.agents.begin(), group.agents.end(), agent) == group.agents.end()) {
                continue;
            }
            matched = true;
            result.rules.insert(result.rules.end(), group.rules.begin(), group.rules.end());
            if (group.crawlDelay) {
                result.crawlDelay = group.crawlDelay;
            }
        }
        return matched;
    };

    if (!token.empty() && token != "*" && collect(token)) {
        result.matchedGroup = token;
    } else if (collect("*")) {
        result.matchedGroup = "*";
    }

    LOG_DEBUG("Parsed robots.txt: " + std::to_string(groups.size()) + " groups, " +
              std::to_string(result.rules.size()) + " rules for group '" + result.matchedGroup +
              "', " + std::to_string(result.sitemaps.size()) + " sitemaps");
    return result;
}

} // namespace seo_audit::crawler
