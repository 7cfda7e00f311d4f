#pragma once

#include <string>
#include <vector>
#include <utility>
#include "HttpTransport.h"

namespace seo_audit::crawler {

// libcurl implementation of HttpTransport. Every call uses its own easy
// handle so concurrent workers never share curl state.
class CurlHttpTransport : public HttpTransport {
public:
    CurlHttpTransport();
    ~CurlHttpTransport() override = default;

    HttpResponse get(const HttpRequest& request) override;

    void setCustomHeaders(const std::vector<std::pair<std::string, std::string>>& headers);

    void setProxy(const std::string& proxy);

    // Bodies larger than this abort the transfer
    void setMaxBodyBytes(size_t bytes) { maxBodyBytes = bytes; }

private:
    static size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp);

    std::vector<std::pair<std::string, std::string>> customHeaders;
    std::string proxy;
    size_t maxBodyBytes = 10 * 1024 * 1024;
};

} // namespace seo_audit::crawler
