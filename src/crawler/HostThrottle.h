#pragma once

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace seo_audit::crawler {

// Per-host crawl-delay timer. Shared by the coordinator, which stamps it on
// dispatch, and by fetch workers, which stamp it on every request they send
// and every response they receive. A host becomes ready again crawlDelay
// after its latest stamp.
class HostThrottle {
public:
    using TimePoint = std::chrono::steady_clock::time_point;

    explicit HostThrottle(std::chrono::milliseconds crawlDelay);

    // Stamp the host and return true if it is ready at now
    bool tryAcquire(const std::string& host, TimePoint now);

    // Book the first slot at or after earliest that respects the delay and
    // stamp the host with it. The caller waits until the returned time.
    TimePoint reserve(const std::string& host, TimePoint now, TimePoint earliest);

    // Record a request or response at now. Never moves the timer backwards.
    void touch(const std::string& host, TimePoint now);

    // Earliest time the host may be contacted again
    TimePoint readyAt(const std::string& host) const;

    std::optional<TimePoint> getLastStamp(const std::string& host) const;

    std::chrono::milliseconds getCrawlDelay() const { return crawlDelay; }

private:
    std::chrono::milliseconds crawlDelay;

    mutable std::mutex mutex;
    std::unordered_map<std::string, TimePoint> lastStamp;
};

} // namespace seo_audit::crawler
