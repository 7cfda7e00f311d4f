#include "HostThrottle.h"
#include <algorithm>

namespace seo_audit::crawler {

HostThrottle::HostThrottle(std::chrono::milliseconds delay)
    : crawlDelay(delay) {
}

bool HostThrottle::tryAcquire(const std::string& host, TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = lastStamp.find(host);
    if (it != lastStamp.end() && now < it->second + crawlDelay) {
        return false;
    }
    lastStamp[host] = it == lastStamp.end() ? now : std::max(it->second, now);
    return true;
}

HostThrottle::TimePoint HostThrottle::reserve(const std::string& host, TimePoint now, TimePoint earliest) {
    std::lock_guard<std::mutex> lock(mutex);
    TimePoint slot = std::max(now, earliest);
    auto it = lastStamp.find(host);
    if (it != lastStamp.end()) {
        slot = std::max(slot, it->second + crawlDelay);
    }
    lastStamp[host] = slot;
    return slot;
}

void HostThrottle::touch(const std::string& host, TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = lastStamp.find(host);
    if (it == lastStamp.end()) {
        lastStamp.emplace(host, now);
    } else if (now > it->second) {
        it->second = now;
    }
}

HostThrottle::TimePoint HostThrottle::readyAt(const std::string& host) const {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = lastStamp.find(host);
    return it == lastStamp.end() ? TimePoint::min() : it->second + crawlDelay;
}

std::optional<HostThrottle::TimePoint> HostThrottle::getLastStamp(const std::string& host) const {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = lastStamp.find(host);
    if (it == lastStamp.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace seo_audit::crawler
