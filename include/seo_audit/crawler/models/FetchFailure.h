#pragma once

#include <string>

namespace seo_audit::crawler {

// Typed reasons a fetch did not produce a usable page
enum class FetchFailureKind {
    DNS_ERROR,
    CONNECT_TIMEOUT,
    READ_TIMEOUT,
    TLS_ERROR,
    HTTP_ERROR,          // final response status >= 400, see httpCode
    TOO_MANY_REDIRECTS,  // hop bound exceeded or redirect loop
    CONNECTION_ERROR,    // refused, reset, unreachable
    INVALID_RESPONSE     // malformed URL, bad redirect target, other transport errors
};

struct FetchFailure {
    FetchFailureKind kind = FetchFailureKind::INVALID_RESPONSE;
    int httpCode = 0;
    std::string message;
};

std::string toString(FetchFailureKind kind);

} // namespace seo_audit::crawler
