#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/enums.hpp"

namespace sheltercontrol {

using TimePoint = std::chrono::system_clock::time_point;

// Fixed label set used for defaults and placeholder rows.
inline constexpr const char *kUnspecifiedLabel = "Unspecified";
inline constexpr const char *kAnonymousLabel = "Anonymous";
inline constexpr const char *kNotAvailableLabel = "N/A";
inline constexpr const char *kNoDataLabel = "No data";
inline constexpr const char *kNoDeliveriesLabel = "No deliveries recorded";
inline constexpr const char *kDefaultUnit = "kg";

// Inclusive [start, end] range. Construct through makeWindow() or the
// period helpers to get the start <= end check.
struct DateWindow {
    TimePoint start;
    TimePoint end;

    bool contains(TimePoint t) const
    {
        return t >= start && t <= end;
    }
};

// Raw collections as handed over by the record store. Records are
// untyped JSON objects until the normalizer has seen them.
struct RawRecordSet {
    std::vector<nlohmann::json> persons;
    std::vector<nlohmann::json> donations;
    std::vector<nlohmann::json> deliveries;
};

struct ShelteredPerson {
    std::string id;
    // Empty when the raw entry_date was missing or unparsable.
    std::optional<TimePoint> entryDate;
    bool isActive = false;
};

struct FoodDonation {
    std::string id;
    std::optional<TimePoint> donationDate;
    std::string foodType = kUnspecifiedLabel;
    std::string donorName = kAnonymousLabel;
    double quantityKg = 0.0;
    bool isDelivered = false;
};

struct FoodDelivery {
    std::string id;
    std::optional<TimePoint> deliveryDate;
    double quantityKg = 0.0;
    std::string unit = kDefaultUnit;
    std::string personName = kNotAvailableLabel;
    std::string foodType = kNotAvailableLabel;
};

struct NormalizationWarning {
    RecordKind recordKind = RecordKind::Person;
    std::string recordId;
    // Position of the record in its input collection.
    std::size_t index = 0;
    std::string field;
    std::string message;
};

struct AggregationBucket {
    std::string key;
    int count = 0;
    double totalKg = 0.0;
};

struct SummaryStats {
    int totalPersons = 0;
    int activePersons = 0;
    int totalDonations = 0;
    int availableDonations = 0;
    double totalKgDonated = 0.0;
    int totalDeliveries = 0;
    double totalKgDelivered = 0.0;
    int uniqueDonors = 0;
};

// Side channel for everything the normalizer and window filter set aside.
struct Diagnostics {
    std::vector<NormalizationWarning> warnings;
    // Records kept for undated counts but left out of dated sections.
    int undatedPersons = 0;
    int undatedDonations = 0;
    int undatedDeliveries = 0;
    // Records whose own date falls outside the resolved window.
    int outsideWindow = 0;
};

} // namespace sheltercontrol
