#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/models.hpp"
#include "common/time_utils.hpp"

namespace sheltercontrol {

inline std::string toRecordKindString(RecordKind kind)
{
    switch (kind) {
    case RecordKind::Person:
        return "person";
    case RecordKind::Donation:
        return "donation";
    case RecordKind::Delivery:
        return "delivery";
    }
    return "person";
}

inline std::string toReportKindString(ReportKind kind)
{
    switch (kind) {
    case ReportKind::Weekly:
        return "weekly";
    case ReportKind::Monthly:
        return "monthly";
    case ReportKind::Summary:
        return "summary";
    }
    return "summary";
}

inline std::string toSectionKindString(SectionKind kind)
{
    switch (kind) {
    case SectionKind::MetricTable:
        return "metric_table";
    case SectionKind::RankedTable:
        return "ranked_table";
    case SectionKind::GroupedTable:
        return "grouped_table";
    case SectionKind::DetailTable:
        return "detail_table";
    case SectionKind::Chart:
        return "chart";
    }
    return "metric_table";
}

inline std::string toChartKindString(ChartKind kind)
{
    switch (kind) {
    case ChartKind::Bar:
        return "bar";
    case ChartKind::Line:
        return "line";
    case ChartKind::Pie:
        return "pie";
    }
    return "bar";
}

inline void to_json(nlohmann::json &j, const RecordKind &kind)
{
    j = toRecordKindString(kind);
}

inline void to_json(nlohmann::json &j, const ReportKind &kind)
{
    j = toReportKindString(kind);
}

inline void to_json(nlohmann::json &j, const SectionKind &kind)
{
    j = toSectionKindString(kind);
}

inline void to_json(nlohmann::json &j, const ChartKind &kind)
{
    j = toChartKindString(kind);
}

inline void to_json(nlohmann::json &j, const DateWindow &window)
{
    j = nlohmann::json{
        {"start", toIso8601Utc(window.start)},
        {"end", toIso8601Utc(window.end)}
    };
}

inline void to_json(nlohmann::json &j, const NormalizationWarning &warning)
{
    j = nlohmann::json{
        {"recordKind", warning.recordKind},
        {"recordId", warning.recordId},
        {"index", warning.index},
        {"field", warning.field},
        {"message", warning.message}
    };
}

inline void to_json(nlohmann::json &j, const AggregationBucket &bucket)
{
    j = nlohmann::json{
        {"key", bucket.key},
        {"count", bucket.count},
        {"totalKg", bucket.totalKg}
    };
}

inline void to_json(nlohmann::json &j, const SummaryStats &stats)
{
    j = nlohmann::json{
        {"total_persons", stats.totalPersons},
        {"active_persons", stats.activePersons},
        {"total_donations", stats.totalDonations},
        {"available_donations", stats.availableDonations},
        {"total_kg_donated", stats.totalKgDonated},
        {"total_deliveries", stats.totalDeliveries},
        {"total_kg_delivered", stats.totalKgDelivered},
        {"unique_donors", stats.uniqueDonors}
    };
}

inline void to_json(nlohmann::json &j, const Diagnostics &diagnostics)
{
    j = nlohmann::json{
        {"warningCount", diagnostics.warnings.size()},
        {"warnings", diagnostics.warnings},
        {"undated", {
            {"persons", diagnostics.undatedPersons},
            {"donations", diagnostics.undatedDonations},
            {"deliveries", diagnostics.undatedDeliveries}
        }},
        {"outsideWindow", diagnostics.outsideWindow}
    };
}

// Reads the record store export: {"persons":[], "donations":[], "deliveries":[]}.
// A missing or null collection is empty; any other non-array value throws
// nlohmann::json::type_error.
inline void from_json(const nlohmann::json &j, RawRecordSet &records)
{
    auto collection = [&j](const char *key) {
        if (!j.contains(key) || j.at(key).is_null()) {
            return std::vector<nlohmann::json>{};
        }
        return j.at(key).get<std::vector<nlohmann::json>>();
    };
    records.persons = collection("persons");
    records.donations = collection("donations");
    records.deliveries = collection("deliveries");
}

} // namespace sheltercontrol
