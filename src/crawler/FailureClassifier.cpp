#include "FailureClassifier.h"
#include "../../include/Logger.h"
#include <algorithm>
#include <cmath>

namespace seo_audit::crawler {

FetchFailureKind FailureClassifier::classifyCurlError(CURLcode curlCode, bool connected) {
    switch (curlCode) {
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
            return FetchFailureKind::DNS_ERROR;

        case CURLE_OPERATION_TIMEDOUT:
            // curl reports connect and transfer timeouts with the same code
            return connected ? FetchFailureKind::READ_TIMEOUT : FetchFailureKind::CONNECT_TIMEOUT;

        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_CACERT_BADFILE:
        case CURLE_SSL_ENGINE_NOTFOUND:
        case CURLE_SSL_ENGINE_SETFAILED:
        case CURLE_SSL_ENGINE_INITFAILED:
        case CURLE_SSL_ISSUER_ERROR:
        case CURLE_SSL_CRL_BADFILE:
        case CURLE_USE_SSL_FAILED:
            return FetchFailureKind::TLS_ERROR;

        case CURLE_TOO_MANY_REDIRECTS:
            return FetchFailureKind::TOO_MANY_REDIRECTS;

        case CURLE_COULDNT_CONNECT:
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_PARTIAL_FILE:
            return FetchFailureKind::CONNECTION_ERROR;

        default:
            LOG_DEBUG("Unclassified CURL error " + std::to_string(static_cast<int>(curlCode)) +
                      " treated as INVALID_RESPONSE");
            return FetchFailureKind::INVALID_RESPONSE;
    }
}

std::optional<FetchFailure> FailureClassifier::classifyHttpStatus(int httpCode) {
    if (httpCode < 400) {
        return std::nullopt;
    }
    FetchFailure failure;
    failure.kind = FetchFailureKind::HTTP_ERROR;
    failure.httpCode = httpCode;
    failure.message = "HTTP " + std::to_string(httpCode);
    return failure;
}

bool FailureClassifier::shouldRetry(const FetchFailure& failure, int retryCount, const AuditConfig& config) {
    if (retryCount >= config.maxRetries) {
        return false;
    }

    switch (failure.kind) {
        case FetchFailureKind::CONNECT_TIMEOUT:
        case FetchFailureKind::READ_TIMEOUT:
            return true;
        case FetchFailureKind::HTTP_ERROR:
            return config.retryableHttpCodes.count(failure.httpCode) > 0;
        default:
            return false;
    }
}

std::chrono::milliseconds FailureClassifier::calculateRetryDelay(int retryCount, const AuditConfig& config) {
    // base * (multiplier ^ (retryCount - 1)), capped
    double multiplier = std::pow(config.backoffMultiplier, std::max(0, retryCount - 1));
    auto calculatedDelay = std::chrono::milliseconds(
        static_cast<long long>(config.baseRetryDelay.count() * multiplier));
    return std::min(calculatedDelay, config.maxRetryDelay);
}

std::string FailureClassifier::describe(const FetchFailure& failure) {
    if (failure.kind == FetchFailureKind::HTTP_ERROR) {
        return "HTTP " + std::to_string(failure.httpCode);
    }
    if (failure.message.empty()) {
        return toString(failure.kind);
    }
    return toString(failure.kind) + ": " + failure.message;
}

} // namespace seo_audit::crawler
