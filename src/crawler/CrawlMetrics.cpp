#include "CrawlMetrics.h"
#include "../../include/Logger.h"
#include <sstream>
#include <iomanip>

namespace seo_audit::crawler {

void CrawlMetrics::logSummary() const {
    std::ostringstream oss;

    size_t total = getTotalRequests();
    size_t failed = getFailedRequests();

    oss << "\n=== CRAWL METRICS SUMMARY ===\n";
    oss << "Pages attempted: " << total << "\n";
    oss << "Succeeded: " << getSuccessfulRequests() << " (" << std::fixed << std::setprecision(1)
        << (getSuccessRate() * 100) << "%)\n";
    oss << "Failed: " << failed << " (" << std::fixed << std::setprecision(1)
        << (total > 0 ? (static_cast<double>(failed) / total * 100) : 0.0) << "%)\n";
    oss << "Retries: " << getRetriedRequests() << "\n";
    oss << "Redirected: " << getRedirectedRequests() << "\n";
    oss << "Skipped by robots.txt: " << getRobotsSkipped() << "\n";

    auto failureKinds = getFailureKindCounts();
    if (!failureKinds.empty()) {
        oss << "\nFailure kinds:\n";
        for (const auto& [kind, count] : failureKinds) {
            oss << "  " << toString(kind) << ": " << count << "\n";
        }
    }

    oss << "=============================";
    LOG_INFO(oss.str());
}

} // namespace seo_audit::crawler
