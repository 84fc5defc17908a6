#include "report/ReportRenderer.hpp"

#include <sstream>
#include <type_traits>
#include <variant>

#include "common/json_utils.hpp"
#include "common/time_utils.hpp"

namespace sheltercontrol {

namespace {

nlohmann::json tableJson(const TableText &text)
{
    nlohmann::json payload;
    payload["header"] = text.header;
    payload["rows"] = text.rows;
    if (!text.totals.empty()) {
        payload["totals"] = text.totals;
    }
    return payload;
}

nlohmann::json sectionJson(const ReportSection &section)
{
    nlohmann::json payload = std::visit(
        [](const auto &value) -> nlohmann::json {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, ChartDescriptor>) {
                return nlohmann::json{
                    {"chartKind", value.kind},
                    {"xLabel", value.xLabel},
                    {"yLabel", value.yLabel},
                    {"labels", value.labels},
                    {"values", value.values}
                };
            } else if constexpr (std::is_same_v<T, DetailTable>) {
                nlohmann::json table = tableJson(toTableText(value));
                table["limit"] = value.limit;
                table["available"] = value.available;
                return table;
            } else if constexpr (std::is_same_v<T, RankedTable>) {
                nlohmann::json table = tableJson(toTableText(value));
                table["limit"] = value.limit;
                return table;
            } else {
                return tableJson(toTableText(value));
            }
        },
        section.payload);

    payload["kind"] = section.kind();
    payload["title"] = section.title;
    return payload;
}

void writeTable(std::ostringstream &out, const TableText &text)
{
    auto writeRow = [&out](const std::vector<std::string> &cells) {
        out << "|";
        for (const auto &cell : cells) {
            out << " " << cell << " |";
        }
        out << "\n";
    };

    writeRow(text.header);
    out << "|";
    for (std::size_t i = 0; i < text.header.size(); ++i) {
        out << " --- |";
    }
    out << "\n";
    for (const auto &row : text.rows) {
        writeRow(row);
    }
    if (!text.totals.empty()) {
        std::vector<std::string> totals;
        for (const auto &cell : text.totals) {
            totals.push_back("**" + cell + "**");
        }
        writeRow(totals);
    }
    out << "\n";
}

void writeChart(std::ostringstream &out, const ChartDescriptor &chart)
{
    out << "_" << toChartKindString(chart.kind) << " chart: " << chart.yLabel
        << " by " << chart.xLabel << "_\n\n";
    for (std::size_t i = 0; i < chart.labels.size() && i < chart.values.size(); ++i) {
        out << "- " << chart.labels[i] << ": " << formatNumber(chart.values[i]) << "\n";
    }
    out << "\n";
}

} // namespace

nlohmann::json documentToJson(const ReportDocument &document)
{
    nlohmann::json payload;
    payload["kind"] = document.kind;
    payload["shelterName"] = document.shelterName;
    payload["title"] = document.title;
    payload["period"] = document.period;
    payload["window"] = document.window;
    payload["generatedAt"] = toIso8601Utc(document.generatedAt);
    payload["footer"] = document.footer;
    payload["sections"] = nlohmann::json::array();
    for (const auto &section : document.sections) {
        payload["sections"].push_back(sectionJson(section));
    }
    payload["diagnostics"] = document.diagnostics;
    return payload;
}

nlohmann::json summaryToJson(const AnalyticsSummary &summary)
{
    nlohmann::json payload = summary.stats;
    payload["window"] = summary.window;
    if (summary.avgDaysSheltered.has_value()) {
        payload["avg_days_sheltered"] = *summary.avgDaysSheltered;
    }
    if (summary.maxDaysSheltered.has_value()) {
        payload["max_days_sheltered"] = *summary.maxDaysSheltered;
    }
    if (!summary.foodTypes.empty()) {
        payload["food_types"] = summary.foodTypes;
    }
    if (summary.totalQuantityDelivered.has_value()) {
        payload["total_quantity_delivered"] = *summary.totalQuantityDelivered;
    }
    payload["diagnostics"] = summary.diagnostics;
    return payload;
}

std::string renderMarkdown(const ReportDocument &document)
{
    std::ostringstream out;
    out << "# " << document.title << "\n\n";
    out << document.period << "\n\n";

    for (const auto &section : document.sections) {
        if (section.kind() == SectionKind::Chart) {
            writeChart(out, std::get<ChartDescriptor>(section.payload));
            continue;
        }

        out << "## " << section.title << "\n\n";
        std::visit(
            [&out](const auto &value) {
                using T = std::decay_t<decltype(value)>;
                if constexpr (!std::is_same_v<T, ChartDescriptor>) {
                    writeTable(out, toTableText(value));
                }
            },
            section.payload);
    }

    const auto &diagnostics = document.diagnostics;
    if (!diagnostics.warnings.empty() || diagnostics.outsideWindow > 0) {
        out << "## Data Quality\n\n";
        out << "- Warnings: " << diagnostics.warnings.size() << "\n";
        out << "- Undated records: persons " << diagnostics.undatedPersons
            << ", donations " << diagnostics.undatedDonations
            << ", deliveries " << diagnostics.undatedDeliveries << "\n";
        out << "- Records outside the window: " << diagnostics.outsideWindow << "\n\n";
    }

    out << "---\n\n" << document.footer << "\n";
    return out.str();
}

} // namespace sheltercontrol
