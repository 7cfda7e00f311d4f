#include "../../../include/seo_audit/crawler/models/PageRecord.h"

#include <algorithm>
#include <cctype>

namespace seo_audit::crawler {

std::string toString(FetchFailureKind kind) {
    switch (kind) {
        case FetchFailureKind::DNS_ERROR: return "DNS_ERROR";
        case FetchFailureKind::CONNECT_TIMEOUT: return "CONNECT_TIMEOUT";
        case FetchFailureKind::READ_TIMEOUT: return "READ_TIMEOUT";
        case FetchFailureKind::TLS_ERROR: return "TLS_ERROR";
        case FetchFailureKind::HTTP_ERROR: return "HTTP_ERROR";
        case FetchFailureKind::TOO_MANY_REDIRECTS: return "TOO_MANY_REDIRECTS";
        case FetchFailureKind::CONNECTION_ERROR: return "CONNECTION_ERROR";
        case FetchFailureKind::INVALID_RESPONSE: return "INVALID_RESPONSE";
    }
    return "INVALID";
}

std::string toString(DiscoverySource source) {
    switch (source) {
        case DiscoverySource::SEED: return "seed";
        case DiscoverySource::SITEMAP: return "sitemap";
        case DiscoverySource::LINK: return "link";
    }
    return "unknown";
}

bool PageRecord::isHtml() const {
    if (contentType.empty()) {
        return true;
    }
    std::string lower = contentType;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower.find("text/html") != std::string::npos ||
           lower.find("application/xhtml") != std::string::npos;
}

} // namespace seo_audit::crawler
