#pragma once

#include <cstddef>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace sheltercontrol {

template <typename Record>
struct Normalized {
    Record record;
    std::vector<NormalizationWarning> warnings;
};

struct NormalizedRecords {
    std::vector<ShelteredPerson> persons;
    std::vector<FoodDonation> donations;
    std::vector<FoodDelivery> deliveries;
    std::vector<NormalizationWarning> warnings;
};

/**
 * Best-effort coercion of raw store records into typed entities.
 *
 * None of these functions throw. Every recognized field is parsed or
 * defaulted:
 * - timestamps are parsed with parseIso8601(); a missing or unparsable date
 *   leaves the optional empty and yields a warning
 * - strings default to "Unspecified", "Anonymous" or "N/A"
 * - numbers accept JSON numbers or numeric strings, default to 0 and are
 *   clamped to >= 0
 * - booleans accept true/false, 0/1 and "true"/"false"
 *
 * index is the record's position in its collection and is used as the id
 * fallback ("person-3") so warnings always point somewhere.
 */
Normalized<ShelteredPerson> normalizePerson(const nlohmann::json &raw, std::size_t index);
Normalized<FoodDonation> normalizeDonation(const nlohmann::json &raw, std::size_t index);
Normalized<FoodDelivery> normalizeDelivery(const nlohmann::json &raw, std::size_t index);

// Normalizes all three collections and concatenates their warnings in
// person, donation, delivery order.
NormalizedRecords normalizeAll(const RawRecordSet &raw);

} // namespace sheltercontrol
