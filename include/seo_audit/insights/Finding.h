#pragma once

#include <string>
#include <vector>

namespace seo_audit::insights {

// Declaration order is report order
enum class FindingCategory {
    DUPLICATE_TITLE,
    DUPLICATE_META,
    MISSING_META,
    MULTIPLE_H1,
    MISSING_CANONICAL,
    CANONICAL_MISMATCH,
    BROKEN_LINK,
    REDIRECT_CHAIN,
    ORPHAN_PAGE,
    UNCATALOGUED_PAGE,
    THIN_CONTENT,
    DEEP_PAGE,
    LONG_URL,
    WEAK_INTERNAL_LINKING,
    CLIENT_SIDE_RENDERING,
    MISSING_STRUCTURED_DATA,
    MISSING_ALT_TEXT
};

enum class Severity {
    LOW,
    MEDIUM,
    HIGH
};

std::string toString(FindingCategory category);
std::string toString(Severity severity);

// One detected issue. Immutable once produced by the aggregator.
struct Finding {
    FindingCategory category = FindingCategory::MISSING_META;
    Severity severity = Severity::LOW;
    std::vector<std::string> affectedUrls;
    std::string detail;

    const std::string& firstUrl() const;

    bool operator==(const Finding& other) const = default;
};

// Report order: category, then first affected URL, then detail
bool findingLess(const Finding& a, const Finding& b);

} // namespace seo_audit::insights
