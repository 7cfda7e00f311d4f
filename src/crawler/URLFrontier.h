#pragma once

#include <chrono>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include "HostThrottle.h"
#include "../../include/seo_audit/crawler/models/CrawlPolicy.h"
#include "../../include/seo_audit/crawler/models/PageRecord.h"

namespace seo_audit::crawler {

enum class UrlState {
    UNKNOWN,
    PENDING,
    IN_FLIGHT,
    COMPLETED,
    FAILED,
    DISCARDED   // was pending when a budget ran out
};

enum class EnqueueResult {
    ACCEPTED,
    DEPTH_LOWERED,  // already pending, now reachable at a smaller depth
    DUPLICATE,
    INVALID_URL,
    EXTERNAL,
    TOO_DEEP,
    DISALLOWED,
    CLOSED
};

std::string toString(EnqueueResult result);

struct FrontierEntry {
    std::string url;   // normalized
    std::string host;
    size_t depth = 0;
    DiscoverySource source = DiscoverySource::LINK;
};

// Crawl state of one audit run. Owned and mutated by the crawl coordinator
// only; workers never touch it. The per-host timer is the exception: it lives
// in a HostThrottle the fetcher shares. Time is passed in so scheduling
// decisions can be tested without sleeping.
class URLFrontier {
public:
    using TimePoint = std::chrono::steady_clock::time_point;

    URLFrontier(std::string targetHost,
                CrawlPolicy policy,
                size_t maxDepth,
                size_t maxConcurrency,
                std::chrono::milliseconds crawlDelay);

    // Normalize and admit a URL. A URL enters the pending queue at most once.
    EnqueueResult enqueue(const std::string& url, size_t depth, DiscoverySource source);

    // Next dispatchable URL, or nullopt when the concurrency bound is reached
    // or every pending host is still inside its crawl-delay window. The
    // returned URL moves to IN_FLIGHT and its host timer is stamped with now.
    std::optional<FrontierEntry> next(TimePoint now);

    // Record the outcome of an in-flight URL. Successful records have their
    // outbound links enqueued at depth + 1. Returns the number of links admitted.
    // Throws std::logic_error if the URL is not in flight.
    size_t onResult(const PageRecord& record);

    // Earliest time a pending URL may be dispatched
    std::optional<TimePoint> nextDispatchTime() const;

    // Stop admitting URLs
    void closeAdmission() { closed = true; }

    // Drop all pending URLs, returns how many were dropped
    size_t discardPending();

    UrlState getState(const std::string& url) const;
    std::optional<size_t> getDepth(const std::string& url) const;
    std::optional<TimePoint> getLastDispatch(const std::string& host) const;

    // Per-host timer, shared with the fetcher for follow-up requests
    std::shared_ptr<HostThrottle> getThrottle() const { return throttle; }

    size_t pendingCount() const { return pending.size(); }
    size_t inFlightCount() const { return inFlight; }
    size_t getDisallowedCount() const { return disallowedCount; }
    bool isFinished() const { return pending.empty() && inFlight == 0; }

    const std::string& getTargetHost() const { return targetHost; }
    std::chrono::milliseconds getCrawlDelay() const { return crawlDelay; }

private:
    struct Slot {
        UrlState state = UrlState::UNKNOWN;
        size_t depth = 0;
        DiscoverySource source = DiscoverySource::LINK;
    };

    std::string targetHost;
    CrawlPolicy policy;
    size_t maxDepth;
    size_t maxConcurrency;
    std::chrono::milliseconds crawlDelay;

    std::deque<std::string> pending;
    std::unordered_map<std::string, Slot> slots;
    std::shared_ptr<HostThrottle> throttle;
    size_t inFlight = 0;
    size_t disallowedCount = 0;
    bool closed = false;
};

} // namespace seo_audit::crawler
