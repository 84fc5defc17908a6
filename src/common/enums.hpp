#pragma once

namespace sheltercontrol {

enum class RecordKind {
    Person,
    Donation,
    Delivery
};

enum class ReportKind {
    Weekly,
    Monthly,
    Summary
};

enum class SectionKind {
    MetricTable,
    RankedTable,
    GroupedTable,
    DetailTable,
    Chart
};

enum class ChartKind {
    Bar,
    Line,
    Pie
};

} // namespace sheltercontrol
