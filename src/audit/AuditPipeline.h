#pragma once

#include <memory>
#include <string>
#include "../crawler/Crawler.h"
#include "../crawler/HttpTransport.h"
#include "../crawler/models/AuditConfig.h"
#include "../../include/seo_audit/audit/AuditResult.h"

namespace seo_audit::audit {

// Runs one audit end to end: resolve policy, seed, crawl, finalize the
// graph, analyze. Each run() call is independent.
class AuditPipeline {
public:
    AuditPipeline(crawler::AuditConfig config,
                  std::shared_ptr<crawler::HttpTransport> transport,
                  crawler::Crawler::Clock clock = {});

    // Throws std::invalid_argument when rootUrl is not an absolute http(s) URL.
    // Every environmental failure is reported inside the result instead.
    AuditResult run(const std::string& rootUrl);

    const crawler::AuditConfig& getConfig() const { return config; }

private:
    crawler::AuditConfig config;
    std::shared_ptr<crawler::HttpTransport> transport;
    crawler::Crawler::Clock clock;
};

} // namespace seo_audit::audit
