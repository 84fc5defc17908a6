#pragma once

#include <cstddef>
#include <string>
#include <variant>
#include <vector>

#include "common/models.hpp"

namespace sheltercontrol {

// Two-column "Metric | Value" table. value keeps the number, display the
// text a renderer should print.
struct MetricRow {
    std::string label;
    double value = 0.0;
    std::string display;
};

struct MetricTable {
    std::vector<MetricRow> rows;
};

struct GroupedRow {
    // Sort key, e.g. "2025-11-18" or "2025-W47".
    std::string key;
    // What the reader sees, e.g. "18/11/2025" or "Week 47".
    std::string label;
    int count = 0;
    double totalKg = 0.0;
};

// Buckets in ascending key order, optionally followed by a totals row.
struct GroupedTable {
    std::string keyHeader;
    std::string countHeader;
    bool showKg = true;
    bool showTotals = true;
    std::vector<GroupedRow> rows;
};

struct RankedRow {
    int rank = 0;
    std::string key;
    int count = 0;
    double totalKg = 0.0;
};

struct RankedTable {
    std::string keyHeader;
    std::size_t limit = 0;
    std::vector<RankedRow> rows;
};

struct DetailRow {
    TimePoint timestamp;
    std::string recordId;
    std::string date;
    std::string food;
    std::string person;
    std::string quantity;
};

struct DetailTable {
    std::size_t limit = 0;
    // Rows eligible before truncation.
    std::size_t available = 0;
    std::vector<DetailRow> rows;
};

// Data for a chart the sink draws; no pixels here.
struct ChartDescriptor {
    ChartKind kind = ChartKind::Bar;
    std::string xLabel;
    std::string yLabel;
    std::vector<std::string> labels;
    std::vector<double> values;
};

using SectionPayload =
    std::variant<MetricTable, RankedTable, GroupedTable, DetailTable, ChartDescriptor>;

struct ReportSection {
    std::string title;
    SectionPayload payload;

    SectionKind kind() const;
};

// Plain text grid of a table section, header first. Empty tables produce a
// single placeholder row so every table renders as well-formed.
struct TableText {
    std::vector<std::string> header;
    std::vector<std::vector<std::string>> rows;
    std::vector<std::string> totals;
};

TableText toTableText(const MetricTable &table);
TableText toTableText(const GroupedTable &table);
TableText toTableText(const RankedTable &table);
TableText toTableText(const DetailTable &table);

// Fixed-point text with the given number of decimals ("12.5").
std::string formatNumber(double value, int decimals = 1);

/**
 * Output of one report request: an ordered list of sections plus the
 * diagnostics gathered while cleaning the inputs.
 *
 * Built once by ReportAssembler and not modified afterwards; renderers only
 * read it. It holds no external resources.
 */
struct ReportDocument {
    ReportKind kind = ReportKind::Weekly;
    std::string shelterName;
    std::string title;
    std::string period;
    std::string footer;
    std::string fileStem;
    DateWindow window;
    TimePoint generatedAt;
    std::vector<ReportSection> sections;
    Diagnostics diagnostics;
};

} // namespace sheltercontrol
