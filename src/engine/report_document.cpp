#include "engine/report_document.hpp"

#include <iomanip>
#include <sstream>

namespace sheltercontrol {

SectionKind ReportSection::kind() const
{
    switch (payload.index()) {
    case 0:
        return SectionKind::MetricTable;
    case 1:
        return SectionKind::RankedTable;
    case 2:
        return SectionKind::GroupedTable;
    case 3:
        return SectionKind::DetailTable;
    default:
        return SectionKind::Chart;
    }
}

std::string formatNumber(double value, int decimals)
{
    std::ostringstream out;
    out << std::fixed << std::setprecision(decimals) << value;
    return out.str();
}

TableText toTableText(const MetricTable &table)
{
    TableText text;
    text.header = {"Metric", "Value"};
    for (const auto &row : table.rows) {
        text.rows.push_back({row.label, row.display});
    }
    if (text.rows.empty()) {
        text.rows.push_back({kNoDataLabel, "-"});
    }
    return text;
}

TableText toTableText(const GroupedTable &table)
{
    TableText text;
    text.header = {table.keyHeader, table.countHeader};
    if (table.showKg) {
        text.header.push_back("Total kg");
    }

    int totalCount = 0;
    double totalKg = 0.0;
    for (const auto &row : table.rows) {
        std::vector<std::string> cells = {row.label, std::to_string(row.count)};
        if (table.showKg) {
            cells.push_back(formatNumber(row.totalKg));
        }
        text.rows.push_back(std::move(cells));
        totalCount += row.count;
        totalKg += row.totalKg;
    }

    if (text.rows.empty()) {
        std::vector<std::string> placeholder = {kNoDataLabel, "0"};
        if (table.showKg) {
            placeholder.push_back(formatNumber(0.0));
        }
        text.rows.push_back(std::move(placeholder));
        return text;
    }

    if (table.showTotals) {
        text.totals = {"Total", std::to_string(totalCount)};
        if (table.showKg) {
            text.totals.push_back(formatNumber(totalKg));
        }
    }
    return text;
}

TableText toTableText(const RankedTable &table)
{
    TableText text;
    text.header = {"#", table.keyHeader, "Donations", "Total kg"};
    for (const auto &row : table.rows) {
        text.rows.push_back({std::to_string(row.rank), row.key,
                             std::to_string(row.count), formatNumber(row.totalKg)});
    }
    if (text.rows.empty()) {
        text.rows.push_back({"-", kNoDataLabel, "0", formatNumber(0.0)});
    }
    return text;
}

TableText toTableText(const DetailTable &table)
{
    TableText text;
    text.header = {"Date", "Food", "Person", "Quantity"};
    for (const auto &row : table.rows) {
        text.rows.push_back({row.date, row.food, row.person, row.quantity});
    }
    if (text.rows.empty()) {
        text.rows.push_back({kNoDeliveriesLabel, "-", "-", "-"});
    }
    return text;
}

} // namespace sheltercontrol
