#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "../crawler/models/AuditConfig.h"

namespace seo_audit::config {

// Builds an AuditConfig from JSON and the environment. Durations are
// integer milliseconds, e.g. {"requestTimeoutMs": 5000}.
class ConfigLoader {
public:
    // Missing keys keep their defaults. Throws std::runtime_error on a value
    // of the wrong type.
    static crawler::AuditConfig fromJson(const nlohmann::json& j,
                                         const crawler::AuditConfig& defaults = {});

    // Throws std::runtime_error when the file cannot be read or parsed
    static crawler::AuditConfig fromFile(const std::string& path,
                                         const crawler::AuditConfig& defaults = {});

    // Overrides from SEO_AUDIT_* variables. Unparsable values are logged and ignored.
    static void applyEnvironment(crawler::AuditConfig& config);

    // Throws std::invalid_argument on an unusable configuration
    static void validate(const crawler::AuditConfig& config);

    static nlohmann::json toJson(const crawler::AuditConfig& config);
};

} // namespace seo_audit::config
