#pragma once

#include <atomic>
#include <map>
#include <mutex>
#include <string>
#include "../../include/seo_audit/crawler/models/FetchFailure.h"

namespace seo_audit::crawler {

// Counters shared by the coordinator and the fetch workers of one run
class CrawlMetrics {
public:
    CrawlMetrics() = default;
    ~CrawlMetrics() = default;

    void recordRequest() { totalRequests_.fetch_add(1); }
    void recordSuccess() { successfulRequests_.fetch_add(1); }
    void recordRetry() { retriedRequests_.fetch_add(1); }
    void recordRedirect() { redirectedRequests_.fetch_add(1); }
    void recordRobotsSkips(size_t count) { robotsSkipped_.fetch_add(count); }

    void recordFailure(FetchFailureKind kind) {
        failedRequests_.fetch_add(1);
        std::lock_guard<std::mutex> lock(failureKindMutex_);
        failureKindCounts_[kind]++;
    }

    size_t getTotalRequests() const { return totalRequests_.load(); }
    size_t getSuccessfulRequests() const { return successfulRequests_.load(); }
    size_t getFailedRequests() const { return failedRequests_.load(); }
    size_t getRetriedRequests() const { return retriedRequests_.load(); }
    size_t getRedirectedRequests() const { return redirectedRequests_.load(); }
    size_t getRobotsSkipped() const { return robotsSkipped_.load(); }

    double getSuccessRate() const {
        size_t total = totalRequests_.load();
        return total > 0 ? static_cast<double>(successfulRequests_.load()) / total : 0.0;
    }

    std::map<FetchFailureKind, size_t> getFailureKindCounts() const {
        std::lock_guard<std::mutex> lock(failureKindMutex_);
        return failureKindCounts_;
    }

    void logSummary() const;

private:
    std::atomic<size_t> totalRequests_{0};
    std::atomic<size_t> successfulRequests_{0};
    std::atomic<size_t> failedRequests_{0};
    std::atomic<size_t> retriedRequests_{0};
    std::atomic<size_t> redirectedRequests_{0};
    std::atomic<size_t> robotsSkipped_{0};

    mutable std::mutex failureKindMutex_;
    std::map<FetchFailureKind, size_t> failureKindCounts_;
};

} // namespace seo_audit::crawler
