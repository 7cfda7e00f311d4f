#include "ConfigLoader.h"
#include "../../include/Logger.h"
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace seo_audit::config {

using crawler::AuditConfig;
using json = nlohmann::json;

namespace {

std::chrono::milliseconds millis(const json& j, const char* key, std::chrono::milliseconds fallback) {
    return std::chrono::milliseconds(j.value(key, static_cast<long long>(fallback.count())));
}

// Reads an unsigned environment value. Returns false when unset or unparsable.
bool envUnsigned(const char* name, unsigned long long& out) {
    const char* value = std::getenv(name);
    if (!value) {
        return false;
    }
    try {
        size_t consumed = 0;
        std::string text(value);
        if (!text.empty() && text[0] == '-') {
            throw std::invalid_argument("negative");
        }
        unsigned long long parsed = std::stoull(text, &consumed);
        if (consumed != text.size()) {
            throw std::invalid_argument("trailing characters");
        }
        out = parsed;
        return true;
    } catch (const std::invalid_argument&) {
        LOG_WARNING(std::string("Invalid ") + name + "=" + value + ", keeping configured value");
    } catch (const std::out_of_range&) {
        LOG_WARNING(std::string("Out of range ") + name + "=" + value + ", keeping configured value");
    }
    return false;
}

} // namespace

AuditConfig ConfigLoader::fromJson(const json& j, const AuditConfig& defaults) {
    if (!j.is_object()) {
        throw std::runtime_error("Configuration must be a JSON object");
    }

    AuditConfig config = defaults;
    try {
        config.maxPages = j.value("maxPages", defaults.maxPages);
        config.maxDepth = j.value("maxDepth", defaults.maxDepth);
        config.wallClockBudget = millis(j, "wallClockBudgetMs", defaults.wallClockBudget);
        config.respectRobotsTxt = j.value("respectRobotsTxt", defaults.respectRobotsTxt);
        config.maxSitemaps = j.value("maxSitemaps", defaults.maxSitemaps);
        config.maxSitemapUrls = j.value("maxSitemapUrls", defaults.maxSitemapUrls);

        config.userAgent = j.value("userAgent", defaults.userAgent);
        config.maxConcurrentConnections = j.value("maxConcurrentConnections", defaults.maxConcurrentConnections);
        config.politenessDelay = millis(j, "politenessDelayMs", defaults.politenessDelay);
        config.connectTimeout = millis(j, "connectTimeoutMs", defaults.connectTimeout);
        config.requestTimeout = millis(j, "requestTimeoutMs", defaults.requestTimeout);
        config.retryTimeout = millis(j, "retryTimeoutMs", defaults.retryTimeout);
        config.robotsTimeout = millis(j, "robotsTimeoutMs", defaults.robotsTimeout);
        config.maxRedirects = j.value("maxRedirects", defaults.maxRedirects);
        config.verifySSL = j.value("verifySSL", defaults.verifySSL);

        config.maxRetries = j.value("maxRetries", defaults.maxRetries);
        config.baseRetryDelay = millis(j, "baseRetryDelayMs", defaults.baseRetryDelay);
        config.backoffMultiplier = j.value("backoffMultiplier", defaults.backoffMultiplier);
        config.maxRetryDelay = millis(j, "maxRetryDelayMs", defaults.maxRetryDelay);
        if (j.contains("retryableHttpCodes")) {
            config.retryableHttpCodes = j.at("retryableHttpCodes").get<std::set<int>>();
        }

        config.thinContentBytes = j.value("thinContentBytes", defaults.thinContentBytes);
        config.minTextLength = j.value("minTextLength", defaults.minTextLength);
        config.csrScriptThreshold = j.value("csrScriptThreshold", defaults.csrScriptThreshold);
        config.maxUrlLength = j.value("maxUrlLength", defaults.maxUrlLength);
        config.maxUrlPathDepth = j.value("maxUrlPathDepth", defaults.maxUrlPathDepth);
        config.maxClickDepth = j.value("maxClickDepth", defaults.maxClickDepth);
        config.minInternalLinksPerPage = j.value("minInternalLinksPerPage", defaults.minInternalLinksPerPage);
    } catch (const json::type_error& e) {
        throw std::runtime_error(std::string("Invalid configuration value: ") + e.what());
    }

    return config;
}

AuditConfig ConfigLoader::fromFile(const std::string& path, const AuditConfig& defaults) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open configuration file: " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    json j;
    try {
        j = json::parse(buffer.str());
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Cannot parse configuration file " + path + ": " + e.what());
    }

    LOG_INFO("Loaded configuration from " + path);
    return fromJson(j, defaults);
}

void ConfigLoader::applyEnvironment(AuditConfig& config) {
    unsigned long long value = 0;

    if (envUnsigned("SEO_AUDIT_MAX_PAGES", value)) {
        config.maxPages = value;
        LOG_INFO("Using max pages from environment: " + std::to_string(value));
    }
    if (envUnsigned("SEO_AUDIT_MAX_DEPTH", value)) {
        config.maxDepth = value;
        LOG_INFO("Using max depth from environment: " + std::to_string(value));
    }
    if (envUnsigned("SEO_AUDIT_CONCURRENCY", value)) {
        config.maxConcurrentConnections = value;
        LOG_INFO("Using concurrency from environment: " + std::to_string(value));
    }
    if (envUnsigned("SEO_AUDIT_TIMEOUT_MS", value)) {
        config.requestTimeout = std::chrono::milliseconds(value);
        LOG_INFO("Using request timeout from environment: " + std::to_string(value) + "ms");
    }
    if (envUnsigned("SEO_AUDIT_BUDGET_MS", value)) {
        config.wallClockBudget = std::chrono::milliseconds(value);
        LOG_INFO("Using wall-clock budget from environment: " + std::to_string(value) + "ms");
    }
    if (envUnsigned("SEO_AUDIT_DELAY_MS", value)) {
        config.politenessDelay = std::chrono::milliseconds(value);
        LOG_INFO("Using politeness delay from environment: " + std::to_string(value) + "ms");
    }
    if (const char* userAgent = std::getenv("SEO_AUDIT_USER_AGENT")) {
        if (*userAgent) {
            config.userAgent = userAgent;
            LOG_INFO("Using user agent from environment: " + config.userAgent);
        }
    }
}

void ConfigLoader::validate(const AuditConfig& config) {
    if (config.maxConcurrentConnections == 0) {
        throw std::invalid_argument("maxConcurrentConnections must be at least 1");
    }
    if (config.maxPages == 0) {
        throw std::invalid_argument("maxPages must be at least 1");
    }
    if (config.connectTimeout.count() <= 0 || config.requestTimeout.count() <= 0 ||
        config.retryTimeout.count() <= 0 || config.robotsTimeout.count() <= 0) {
        throw std::invalid_argument("Timeouts must be positive");
    }
    if (config.retryTimeout < config.requestTimeout) {
        throw std::invalid_argument("retryTimeoutMs must not be shorter than requestTimeoutMs");
    }
    if (config.wallClockBudget.count() <= 0) {
        throw std::invalid_argument("wallClockBudgetMs must be positive");
    }
    if (config.politenessDelay.count() < 0) {
        throw std::invalid_argument("politenessDelayMs must not be negative");
    }
    if (config.maxRetries < 0) {
        throw std::invalid_argument("maxRetries must not be negative");
    }
    if (config.userAgent.empty()) {
        throw std::invalid_argument("userAgent must not be empty");
    }
}

json ConfigLoader::toJson(const AuditConfig& config) {
    return json{
        {"maxPages", config.maxPages},
        {"maxDepth", config.maxDepth},
        {"wallClockBudgetMs", config.wallClockBudget.count()},
        {"respectRobotsTxt", config.respectRobotsTxt},
        {"maxSitemaps", config.maxSitemaps},
        {"maxSitemapUrls", config.maxSitemapUrls},
        {"userAgent", config.userAgent},
        {"maxConcurrentConnections", config.maxConcurrentConnections},
        {"politenessDelayMs", config.politenessDelay.count()},
        {"connectTimeoutMs", config.connectTimeout.count()},
        {"requestTimeoutMs", config.requestTimeout.count()},
        {"retryTimeoutMs", config.retryTimeout.count()},
        {"robotsTimeoutMs", config.robotsTimeout.count()},
        {"maxRedirects", config.maxRedirects},
        {"verifySSL", config.verifySSL},
        {"maxRetries", config.maxRetries},
        {"baseRetryDelayMs", config.baseRetryDelay.count()},
        {"backoffMultiplier", config.backoffMultiplier},
        {"maxRetryDelayMs", config.maxRetryDelay.count()},
        {"retryableHttpCodes", config.retryableHttpCodes},
        {"thinContentBytes", config.thinContentBytes},
        {"minTextLength", config.minTextLength},
        {"csrScriptThreshold", config.csrScriptThreshold},
        {"maxUrlLength", config.maxUrlLength},
        {"maxUrlPathDepth", config.maxUrlPathDepth},
        {"maxClickDepth", config.maxClickDepth},
        {"minInternalLinksPerPage", config.minInternalLinksPerPage}
    };
}

} // namespace seo_audit::config
