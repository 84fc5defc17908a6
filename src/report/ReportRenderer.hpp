#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "engine/report_assembler.hpp"
#include "engine/report_document.hpp"

namespace sheltercontrol {

// Sinks for a finished ReportDocument. They only read the document.

nlohmann::json documentToJson(const ReportDocument &document);

// Flat string-keyed mapping for summary-only requests.
nlohmann::json summaryToJson(const AnalyticsSummary &summary);

std::string renderMarkdown(const ReportDocument &document);

} // namespace sheltercontrol
