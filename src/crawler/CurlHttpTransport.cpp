#include "CurlHttpTransport.h"
#include "FailureClassifier.h"
#include "../../include/Logger.h"
#include "../../include/seo_audit/common/UrlUtils.h"
#include <curl/curl.h>
#include <memory>
#include <mutex>
#include <stdexcept>

namespace seo_audit::crawler {

namespace {

struct WriteTarget {
    std::string* buffer;
    size_t limit;
};

// curl_slist owner for one request
class HeaderList {
public:
    HeaderList() = default;
    ~HeaderList() {
        if (list) {
            curl_slist_free_all(list);
        }
    }
    HeaderList(const HeaderList&) = delete;
    HeaderList& operator=(const HeaderList&) = delete;

    void append(const std::string& header) { list = curl_slist_append(list, header.c_str()); }
    curl_slist* get() const { return list; }

private:
    curl_slist* list = nullptr;
};

} // namespace

CurlHttpTransport::CurlHttpTransport() {
    static std::once_flag globalInit;
    std::call_once(globalInit, []() {
        CURLcode code = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (code != CURLE_OK) {
            throw std::runtime_error(std::string("curl_global_init failed: ") + curl_easy_strerror(code));
        }
    });
}

void CurlHttpTransport::setCustomHeaders(const std::vector<std::pair<std::string, std::string>>& headers) {
    customHeaders = headers;
}

void CurlHttpTransport::setProxy(const std::string& value) {
    proxy = value;
}

HttpResponse CurlHttpTransport::get(const HttpRequest& request) {
    using namespace seo_audit::common;
    const std::string cleanedUrl = sanitizeUrl(request.url);
    HttpResponse response;

    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), &curl_easy_cleanup);
    if (!curl) {
        response.transportError = FetchFailureKind::INVALID_RESPONSE;
        response.errorMessage = "Failed to create CURL handle";
        LOG_ERROR(response.errorMessage);
        return response;
    }

    CURL* handle = curl.get();
    char errbuf[CURL_ERROR_SIZE] = {0};

    curl_easy_setopt(handle, CURLOPT_URL, cleanedUrl.c_str());
    curl_easy_setopt(handle, CURLOPT_PROTOCOLS, CURLPROTO_HTTP | CURLPROTO_HTTPS);
    curl_easy_setopt(handle, CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(handle, CURLOPT_USERAGENT, request.userAgent.c_str());
    curl_easy_setopt(handle, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count()));
    curl_easy_setopt(handle, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(request.connectTimeout.count()));
    curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(handle, CURLOPT_FOLLOWLOCATION, 0L);
    curl_easy_setopt(handle, CURLOPT_ACCEPT_ENCODING, "");
    curl_easy_setopt(handle, CURLOPT_SSL_VERIFYPEER, request.verifySSL ? 1L : 0L);
    curl_easy_setopt(handle, CURLOPT_SSL_VERIFYHOST, request.verifySSL ? 2L : 0L);

    if (!proxy.empty()) {
        curl_easy_setopt(handle, CURLOPT_PROXY, proxy.c_str());
    }

    HeaderList headers;
    headers.append("Accept: text/html,application/xhtml+xml,application/xml;q=0.9,text/plain;q=0.8,*/*;q=0.5");
    for (const auto& header : customHeaders) {
        headers.append(header.first + ": " + header.second);
    }
    curl_easy_setopt(handle, CURLOPT_HTTPHEADER, headers.get());

    WriteTarget target{&response.body, maxBodyBytes};
    curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(handle, CURLOPT_WRITEDATA, &target);

    LOG_DEBUG("GET " + cleanedUrl + " (timeout " + std::to_string(request.timeout.count()) + "ms)");
    CURLcode res = curl_easy_perform(handle);

    if (res != CURLE_OK) {
        double connectTime = 0.0;
        curl_easy_getinfo(handle, CURLINFO_CONNECT_TIME, &connectTime);

        response.transportError = FailureClassifier::classifyCurlError(res, connectTime > 0.0);
        response.errorMessage = std::string(curl_easy_strerror(res));
        if (errbuf[0] != '\0') {
            response.errorMessage += " | " + std::string(errbuf);
        }
        response.body.clear();
        LOG_WARNING("CURL error for " + cleanedUrl + ": " + response.errorMessage +
                    " | url_hex=" + hexDump(cleanedUrl));
        return response;
    }

    long statusCode = 0;
    curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &statusCode);
    response.statusCode = static_cast<int>(statusCode);

    char* contentType = nullptr;
    curl_easy_getinfo(handle, CURLINFO_CONTENT_TYPE, &contentType);
    if (contentType) {
        response.contentType = contentType;
    }

    char* redirectUrl = nullptr;
    curl_easy_getinfo(handle, CURLINFO_REDIRECT_URL, &redirectUrl);
    if (redirectUrl) {
        response.location = redirectUrl;
    }

    LOG_DEBUG("HTTP " + std::to_string(response.statusCode) + " for " + cleanedUrl +
              ", " + std::to_string(response.body.size()) + " bytes");
    return response;
}

size_t CurlHttpTransport::writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* target = static_cast<WriteTarget*>(userp);
    size_t totalSize = size * nmemb;
    if (target->buffer->size() + totalSize > target->limit) {
        // Returning a short count makes curl abort with CURLE_WRITE_ERROR
        return 0;
    }
    target->buffer->append(static_cast<char*>(contents), totalSize);
    return totalSize;
}

} // namespace seo_audit::crawler
