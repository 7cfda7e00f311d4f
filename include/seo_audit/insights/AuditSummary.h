#pragma once

#include <string>
#include <vector>

namespace seo_audit::insights {

// Site overview shown at the top of a report
struct AuditSummary {
    size_t pagesCrawled = 0;
    size_t pagesSucceeded = 0;
    size_t sitemapUrls = 0;

    size_t missingTitles = 0;
    size_t missingDescriptions = 0;
    size_t missingH1 = 0;
    size_t multipleH1 = 0;
    size_t missingCanonicals = 0;

    size_t orphanPages = 0;
    size_t uncataloguedPages = 0;
    size_t brokenLinks = 0;
    size_t redirects = 0;

    double averageResponseTimeMs = 0.0;
    double averageClickDepth = 0.0;
    double internalLinksPerPage = 0.0;

    std::vector<std::string> rootStructuredDataTypes;

    // "SSR", "CSR" or "Possibly CSR"
    std::string renderingMode = "SSR";
};

} // namespace seo_audit::insights
