#include "PageFetcher.h"
#include "CrawlMetrics.h"
#include "FailureClassifier.h"
#include "../../include/Logger.h"
#include "../../include/seo_audit/common/UrlUtils.h"
#include <algorithm>
#include <stdexcept>
#include <thread>

namespace seo_audit::crawler {

PageFetcher::PageFetcher(std::shared_ptr<HttpTransport> transportImpl, const AuditConfig& auditConfig)
    : transport(std::move(transportImpl))
    , config(auditConfig) {
    if (!transport) {
        throw std::invalid_argument("PageFetcher requires an HttpTransport");
    }
}

void PageFetcher::setThrottle(std::shared_ptr<HostThrottle> value, Clock clockFn) {
    throttle = std::move(value);
    clock = clockFn ? std::move(clockFn) : Clock([] { return std::chrono::steady_clock::now(); });
}

void PageFetcher::awaitTurn(const std::string& url, std::chrono::milliseconds minimumWait) {
    if (!throttle) {
        if (minimumWait.count() > 0) {
            std::this_thread::sleep_for(minimumWait);
        }
        return;
    }

    TimePoint now = clock();
    TimePoint slot = throttle->reserve(common::extractHost(url), now, now + minimumWait);
    if (slot > now) {
        LOG_DEBUG("Waiting " + std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(slot - now).count()) +
                  "ms for crawl delay before requesting " + url);
        std::this_thread::sleep_for(slot - now);
    }
}

HttpResponse PageFetcher::send(const HttpRequest& request) {
    if (!throttle) {
        return transport->get(request);
    }
    const std::string host = common::extractHost(request.url);
    throttle->touch(host, clock());
    HttpResponse response = transport->get(request);
    throttle->touch(host, clock());
    return response;
}

PageFetchResult PageFetcher::fetch(const std::string& url) {
    auto start = std::chrono::steady_clock::now();

    PageFetchResult result = fetchOnce(url, config.requestTimeout);
    int retryCount = 0;

    while (result.failure && FailureClassifier::shouldRetry(*result.failure, retryCount, config)) {
        retryCount++;
        auto delay = FailureClassifier::calculateRetryDelay(retryCount, config);
        LOG_INFO("Retrying " + url + " after " + FailureClassifier::describe(*result.failure) +
                 " in " + std::to_string(delay.count()) + "ms with timeout " +
                 std::to_string(config.retryTimeout.count()) + "ms");
        if (metrics) {
            metrics->recordRetry();
        }
        awaitTurn(url, delay);
        result = fetchOnce(url, config.retryTimeout);
    }

    result.attempts = static_cast<size_t>(retryCount) + 1;
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    if (result.failure) {
        LOG_WARNING("Fetch failed for " + url + ": " + FailureClassifier::describe(*result.failure) +
                    " after " + std::to_string(result.attempts) + " attempt(s)");
    }
    return result;
}

PageFetchResult PageFetcher::fetchDocument(const std::string& url, std::chrono::milliseconds timeout) {
    auto start = std::chrono::steady_clock::now();
    PageFetchResult result = fetchOnce(url, timeout);
    result.attempts = 1;
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    return result;
}

PageFetchResult PageFetcher::fetchOnce(const std::string& url, std::chrono::milliseconds timeout) {
    using namespace seo_audit::common;

    PageFetchResult result;
    result.redirectChain.push_back(url);
    std::string current = url;

    auto fail = [&result](FetchFailureKind kind, const std::string& message) {
        FetchFailure failure;
        failure.kind = kind;
        failure.httpCode = result.statusCode;
        failure.message = message;
        result.failure = failure;
        result.success = false;
    };

    while (true) {
        if (result.redirectChain.size() > 1) {
            awaitTurn(current, std::chrono::milliseconds(0));
        }

        HttpRequest request;
        request.url = current;
        request.userAgent = config.userAgent;
        request.connectTimeout = std::min(config.connectTimeout, timeout);
        request.timeout = timeout;
        request.verifySSL = config.verifySSL;

        HttpResponse response = send(request);
        result.finalUrl = current;

        if (!response.received()) {
            result.statusCode = 0;
            fail(*response.transportError, response.errorMessage);
            return result;
        }

        result.statusCode = response.statusCode;
        result.contentType = response.contentType;

        const bool isRedirect = response.statusCode >= 300 && response.statusCode < 400 &&
                                response.statusCode != 304;
        if (isRedirect) {
            if (response.location.empty()) {
                fail(FetchFailureKind::INVALID_RESPONSE,
                     "Redirect " + std::to_string(response.statusCode) + " without Location header");
                return result;
            }

            std::string target = resolveUrl(current, response.location);
            auto normalizedTarget = normalizeUrl(target);
            if (!normalizedTarget) {
                fail(FetchFailureKind::INVALID_RESPONSE, "Redirect to unsupported URL: " + target);
                return result;
            }

            bool loop = std::any_of(result.redirectChain.begin(), result.redirectChain.end(),
                                    [&normalizedTarget](const std::string& visited) {
                                        auto normalized = normalizeUrl(visited);
                                        return normalized && *normalized == *normalizedTarget;
                                    });
            result.redirectChain.push_back(target);
            if (loop) {
                fail(FetchFailureKind::TOO_MANY_REDIRECTS, "Redirect loop detected at " + target);
                return result;
            }
            if (result.redirectChain.size() - 1 > config.maxRedirects) {
                fail(FetchFailureKind::TOO_MANY_REDIRECTS,
                     "More than " + std::to_string(config.maxRedirects) + " redirects");
                return result;
            }

            LOG_DEBUG("Redirect " + std::to_string(response.statusCode) + ": " + current + " -> " + target);
            current = target;
            continue;
        }

        if (auto httpFailure = FailureClassifier::classifyHttpStatus(response.statusCode)) {
            result.failure = httpFailure;
            result.success = false;
            return result;
        }

        if (response.statusCode < 200 || response.statusCode >= 300) {
            fail(FetchFailureKind::INVALID_RESPONSE,
                 "Unexpected HTTP status " + std::to_string(response.statusCode));
            return result;
        }

        result.content = std::move(response.body);
        result.success = true;
        return result;
    }
}

} // namespace seo_audit::crawler
