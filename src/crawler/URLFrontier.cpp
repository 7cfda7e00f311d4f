#include "URLFrontier.h"
#include "../../include/Logger.h"
#include "../../include/seo_audit/common/UrlUtils.h"
#include <algorithm>
#include <stdexcept>

namespace seo_audit::crawler {

std::string toString(EnqueueResult result) {
    switch (result) {
        case EnqueueResult::ACCEPTED: return "ACCEPTED";
        case EnqueueResult::DEPTH_LOWERED: return "DEPTH_LOWERED";
        case EnqueueResult::DUPLICATE: return "DUPLICATE";
        case EnqueueResult::INVALID_URL: return "INVALID_URL";
        case EnqueueResult::EXTERNAL: return "EXTERNAL";
        case EnqueueResult::TOO_DEEP: return "TOO_DEEP";
        case EnqueueResult::DISALLOWED: return "DISALLOWED";
        case EnqueueResult::CLOSED: return "CLOSED";
    }
    return "UNKNOWN";
}

URLFrontier::URLFrontier(std::string host,
                         CrawlPolicy crawlPolicy,
                         size_t depthLimit,
                         size_t concurrency,
                         std::chrono::milliseconds delay)
    : targetHost(std::move(host))
    , policy(std::move(crawlPolicy))
    , maxDepth(depthLimit)
    , maxConcurrency(concurrency)
    , crawlDelay(delay)
    , throttle(std::make_shared<HostThrottle>(delay)) {
    if (maxConcurrency == 0) {
        throw std::invalid_argument("URLFrontier requires a concurrency bound of at least 1");
    }
    LOG_DEBUG("URLFrontier created for host " + targetHost + ", max depth " + std::to_string(maxDepth) +
              ", concurrency " + std::to_string(maxConcurrency) + ", crawl delay " +
              std::to_string(crawlDelay.count()) + "ms");
}

EnqueueResult URLFrontier::enqueue(const std::string& url, size_t depth, DiscoverySource source) {
    if (closed) {
        return EnqueueResult::CLOSED;
    }

    auto normalized = common::normalizeUrl(url);
    if (!normalized) {
        LOG_TRACE("Rejecting unsupported URL: " + url);
        return EnqueueResult::INVALID_URL;
    }

    const std::string host = common::extractHost(*normalized);
    if (!common::isSameSite(host, targetHost)) {
        LOG_TRACE("Not enqueuing external URL: " + *normalized);
        return EnqueueResult::EXTERNAL;
    }

    auto it = slots.find(*normalized);
    if (it != slots.end() && it->second.state != UrlState::UNKNOWN) {
        Slot& slot = it->second;
        if (slot.state == UrlState::PENDING && depth < slot.depth) {
            slot.depth = depth;
            return EnqueueResult::DEPTH_LOWERED;
        }
        LOG_TRACE("URL already known, skipping: " + *normalized);
        return EnqueueResult::DUPLICATE;
    }

    if (depth > maxDepth) {
        LOG_TRACE("URL beyond max depth " + std::to_string(maxDepth) + ": " + *normalized);
        return EnqueueResult::TOO_DEEP;
    }

    if (!policy.isAllowed(*normalized)) {
        disallowedCount++;
        LOG_DEBUG("URL disallowed by robots.txt: " + *normalized);
        return EnqueueResult::DISALLOWED;
    }

    Slot slot;
    slot.state = UrlState::PENDING;
    slot.depth = depth;
    slot.source = source;
    slots[*normalized] = slot;
    pending.push_back(*normalized);

    LOG_DEBUG("Enqueued " + *normalized + " (depth " + std::to_string(depth) + ", " +
              toString(source) + "), pending: " + std::to_string(pending.size()));
    return EnqueueResult::ACCEPTED;
}

std::optional<FrontierEntry> URLFrontier::next(TimePoint now) {
    if (inFlight >= maxConcurrency) {
        return std::nullopt;
    }

    for (auto it = pending.begin(); it != pending.end(); ++it) {
        const std::string host = common::extractHost(*it);
        if (!throttle->tryAcquire(host, now)) {
            continue;
        }

        Slot& slot = slots[*it];
        FrontierEntry entry{*it, host, slot.depth, slot.source};
        slot.state = UrlState::IN_FLIGHT;
        inFlight++;
        pending.erase(it);

        LOG_DEBUG_STREAM("Dispatching " << entry.url << ", in flight: " << inFlight);
        return entry;
    }
    return std::nullopt;
}

size_t URLFrontier::onResult(const PageRecord& record) {
    auto it = slots.find(record.url);
    if (it == slots.end() || it->second.state != UrlState::IN_FLIGHT) {
        throw std::logic_error("URLFrontier::onResult for a URL that is not in flight: " + record.url);
    }

    Slot& slot = it->second;
    slot.state = record.succeeded() ? UrlState::COMPLETED : UrlState::FAILED;
    const size_t depth = slot.depth;
    inFlight--;

    if (!record.succeeded()) {
        return 0;
    }

    // The redirect target was effectively fetched under this record
    if (record.wasRedirected()) {
        auto finalUrl = common::normalizeUrl(record.finalUrl);
        if (finalUrl && *finalUrl != record.url &&
            common::isSameSite(common::extractHost(*finalUrl), targetHost)) {
            Slot& target = slots[*finalUrl];
            if (target.state == UrlState::UNKNOWN) {
                target.state = UrlState::COMPLETED;
                target.depth = depth;
            }
        }
    }

    size_t admitted = 0;
    for (const auto& link : record.outboundLinks) {
        EnqueueResult result = enqueue(link, depth + 1, DiscoverySource::LINK);
        if (result == EnqueueResult::ACCEPTED) {
            admitted++;
        }
    }

    LOG_DEBUG("Completed " + record.url + ": " + std::to_string(record.outboundLinks.size()) +
              " links, " + std::to_string(admitted) + " new");
    return admitted;
}

std::optional<URLFrontier::TimePoint> URLFrontier::nextDispatchTime() const {
    std::optional<TimePoint> earliest;
    for (const auto& url : pending) {
        TimePoint ready = throttle->readyAt(common::extractHost(url));
        if (!earliest || ready < *earliest) {
            earliest = ready;
        }
    }
    return earliest;
}

size_t URLFrontier::discardPending() {
    size_t dropped = pending.size();
    for (const auto& url : pending) {
        slots[url].state = UrlState::DISCARDED;
    }
    pending.clear();
    if (dropped > 0) {
        LOG_INFO("Discarded " + std::to_string(dropped) + " pending URLs");
    }
    return dropped;
}

UrlState URLFrontier::getState(const std::string& url) const {
    auto normalized = common::normalizeUrl(url);
    if (!normalized) {
        return UrlState::UNKNOWN;
    }
    auto it = slots.find(*normalized);
    return it == slots.end() ? UrlState::UNKNOWN : it->second.state;
}

std::optional<size_t> URLFrontier::getDepth(const std::string& url) const {
    auto normalized = common::normalizeUrl(url);
    if (!normalized) {
        return std::nullopt;
    }
    auto it = slots.find(*normalized);
    if (it == slots.end() || it->second.state == UrlState::UNKNOWN) {
        return std::nullopt;
    }
    return it->second.depth;
}

std::optional<URLFrontier::TimePoint> URLFrontier::getLastDispatch(const std::string& host) const {
    return throttle->getLastStamp(host);
}

} // namespace seo_audit::crawler
