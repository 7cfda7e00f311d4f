#pragma once

#include <chrono>
#include <optional>
#include <string>
#include "../../include/seo_audit/crawler/models/FetchFailure.h"

namespace seo_audit::crawler {

struct HttpRequest {
    std::string url;
    std::string userAgent;
    std::chrono::milliseconds connectTimeout{10000};
    std::chrono::milliseconds timeout{10000};
    bool verifySSL = true;
};

// One HTTP exchange. Redirects are not followed: a 3xx comes back with its
// Location header resolved to an absolute URL.
struct HttpResponse {
    int statusCode = 0;
    std::string contentType;
    std::string location;
    std::string body;

    // Set when no HTTP response was received
    std::optional<FetchFailureKind> transportError;
    std::string errorMessage;

    bool received() const { return !transportError.has_value(); }
};

// Network seam of the crawler. Implementations must be safe to call from
// several worker threads at once.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual HttpResponse get(const HttpRequest& request) = 0;
};

} // namespace seo_audit::crawler
