#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "HostThrottle.h"
#include "HttpTransport.h"
#include "models/AuditConfig.h"

namespace seo_audit::crawler {

class CrawlMetrics;

struct PageFetchResult {
    bool success = false;
    int statusCode = 0;
    std::string contentType;
    std::string content;
    std::string finalUrl;  // After redirects
    // Requested URL followed by each redirect target
    std::vector<std::string> redirectChain;
    std::optional<FetchFailure> failure;
    std::chrono::milliseconds duration{0};
    size_t attempts = 0;
};

// Fetches one URL to a final response. Redirects are followed here rather
// than inside the transport so the chain can be recorded and loops caught.
class PageFetcher {
public:
    using TimePoint = std::chrono::steady_clock::time_point;
    using Clock = std::function<TimePoint()>;

    PageFetcher(std::shared_ptr<HttpTransport> transport, const AuditConfig& config);

    // Fetch with the page policy: short timeout first, one escalated retry
    // for timeouts and retryable HTTP codes.
    PageFetchResult fetch(const std::string& url);

    // Single attempt with the given timeout, used for robots.txt and sitemaps
    PageFetchResult fetchDocument(const std::string& url, std::chrono::milliseconds timeout);

    void setMetrics(CrawlMetrics* value) { metrics = value; }

    // Gate retries and redirect hops on the crawl's per-host timer. The first
    // request of fetch() is assumed to have been granted by the caller.
    // Pass nullptr to detach.
    void setThrottle(std::shared_ptr<HostThrottle> value, Clock clockFn = {});

private:
    PageFetchResult fetchOnce(const std::string& url, std::chrono::milliseconds timeout);
    HttpResponse send(const HttpRequest& request);
    void awaitTurn(const std::string& url, std::chrono::milliseconds minimumWait);

    std::shared_ptr<HttpTransport> transport;
    AuditConfig config;
    CrawlMetrics* metrics = nullptr;
    std::shared_ptr<HostThrottle> throttle;
    Clock clock;
};

} // namespace seo_audit::crawler
