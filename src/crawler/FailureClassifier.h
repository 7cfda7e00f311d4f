#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <curl/curl.h>
#include "models/AuditConfig.h"
#include "../../include/seo_audit/crawler/models/FetchFailure.h"

namespace seo_audit::crawler {

class FailureClassifier {
public:
    /**
     * Map a libcurl transfer error onto a failure kind
     * @param curlCode CURL error code (not CURLE_OK)
     * @param connected Whether the TCP connection was established before the error
     * @return Failure kind
     */
    static FetchFailureKind classifyCurlError(CURLcode curlCode, bool connected);

    /**
     * Classify a received HTTP status
     * @param httpCode Final HTTP status code
     * @return HTTP_ERROR failure for status >= 400, std::nullopt otherwise
     */
    static std::optional<FetchFailure> classifyHttpStatus(int httpCode);

    /**
     * Check if a failed attempt deserves another one. Only timeouts and the
     * configured retryable HTTP codes are retried.
     * @param failure The failure of the last attempt
     * @param retryCount Retries already performed
     * @param config Audit configuration with retry settings
     * @return true if should retry, false otherwise
     */
    static bool shouldRetry(const FetchFailure& failure, int retryCount, const AuditConfig& config);

    /**
     * Calculate the delay before next retry attempt using exponential backoff
     * @param retryCount Retry attempt number (1-based)
     * @param config Audit configuration with retry settings
     * @return Delay in milliseconds before next retry
     */
    static std::chrono::milliseconds calculateRetryDelay(int retryCount, const AuditConfig& config);

    // Human-readable one-liner, e.g. "HTTP 404" or "DNS_ERROR: Could not resolve host"
    static std::string describe(const FetchFailure& failure);
};

} // namespace seo_audit::crawler
