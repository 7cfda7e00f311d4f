#include "../../include/seo_audit/insights/Finding.h"
#include <tuple>

namespace seo_audit::insights {

std::string toString(FindingCategory category) {
    switch (category) {
        case FindingCategory::DUPLICATE_TITLE: return "DUPLICATE_TITLE";
        case FindingCategory::DUPLICATE_META: return "DUPLICATE_META";
        case FindingCategory::MISSING_META: return "MISSING_META";
        case FindingCategory::MULTIPLE_H1: return "MULTIPLE_H1";
        case FindingCategory::MISSING_CANONICAL: return "MISSING_CANONICAL";
        case FindingCategory::CANONICAL_MISMATCH: return "CANONICAL_MISMATCH";
        case FindingCategory::BROKEN_LINK: return "BROKEN_LINK";
        case FindingCategory::REDIRECT_CHAIN: return "REDIRECT_CHAIN";
        case FindingCategory::ORPHAN_PAGE: return "ORPHAN_PAGE";
        case FindingCategory::UNCATALOGUED_PAGE: return "UNCATALOGUED_PAGE";
        case FindingCategory::THIN_CONTENT: return "THIN_CONTENT";
        case FindingCategory::DEEP_PAGE: return "DEEP_PAGE";
        case FindingCategory::LONG_URL: return "LONG_URL";
        case FindingCategory::WEAK_INTERNAL_LINKING: return "WEAK_INTERNAL_LINKING";
        case FindingCategory::CLIENT_SIDE_RENDERING: return "CLIENT_SIDE_RENDERING";
        case FindingCategory::MISSING_STRUCTURED_DATA: return "MISSING_STRUCTURED_DATA";
        case FindingCategory::MISSING_ALT_TEXT: return "MISSING_ALT_TEXT";
    }
    return "UNKNOWN";
}

std::string toString(Severity severity) {
    switch (severity) {
        case Severity::LOW: return "LOW";
        case Severity::MEDIUM: return "MEDIUM";
        case Severity::HIGH: return "HIGH";
    }
    return "UNKNOWN";
}

const std::string& Finding::firstUrl() const {
    static const std::string empty;
    return affectedUrls.empty() ? empty : affectedUrls.front();
}

bool findingLess(const Finding& a, const Finding& b) {
    return std::forward_as_tuple(a.category, a.firstUrl(), a.detail) <
           std::forward_as_tuple(b.category, b.firstUrl(), b.detail);
}

} // namespace seo_audit::insights
