#pragma once

#include <cstddef>
#include <string>

#include <QString>

#include <nlohmann/json.hpp>

namespace sheltercontrol {

struct ReportConfig {
    // Maximum rows in the delivery detail listing.
    std::size_t detailRowLimit = 20;
    // Size of the donor leaderboards.
    std::size_t leaderboardSize = 10;
    // Food and person names in detail rows are cut to this many characters.
    std::size_t detailTextWidth = 30;
    std::string defaultShelterName = "Shelter";
    std::string productLabel = "ShelterControl v1.0";
};

// Throws InvalidConfig on wrong types or non-positive limits. Keys that are
// absent keep their defaults.
void from_json(const nlohmann::json &j, ReportConfig &config);
void to_json(nlohmann::json &j, const ReportConfig &config);

// Applies SHELTERCONTROL_DETAIL_ROWS and SHELTERCONTROL_LEADERBOARD_SIZE when set.
void applyEnvironmentOverrides(ReportConfig &config);

/**
 * Defaults, then the JSON file at path (if path is non-empty), then the
 * environment. Throws InvalidConfig when the file cannot be read or parsed.
 */
ReportConfig loadReportConfig(const QString &path);

} // namespace sheltercontrol
