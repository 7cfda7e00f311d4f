#pragma once

#include <nlohmann/json.hpp>
#include "../../include/seo_audit/audit/AuditResult.h"

namespace seo_audit::audit {

using json = nlohmann::json;

// Document handed to the report renderer
json toJson(const AuditResult& result);

json toJson(const RunMetadata& metadata);
json toJson(const insights::AuditSummary& summary);
json toJson(const crawler::PageRecord& page);
json toJson(const graph::LinkGraph& graph);

// Findings grouped by category, categories in report order
json findingsToJson(const std::vector<insights::Finding>& findings);

} // namespace seo_audit::audit
