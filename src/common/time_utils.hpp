#pragma once

#include <optional>
#include <string>

#include <QDateTime>
#include <QString>

#include "common/models.hpp"

namespace sheltercontrol {

QDateTime toUtcDateTime(TimePoint timestamp);
TimePoint fromDateTime(const QDateTime &dateTime);

std::string toIso8601Utc(TimePoint timestamp);

/**
 * Parse an ISO-8601 timestamp into a UTC time point.
 *
 * Accepted forms:
 * - "YYYY-MM-DD" (midnight UTC)
 * - "YYYY-MM-DDTHH:MM", "YYYY-MM-DDTHH:MM:SS", optional ".fff" fraction
 *   ('T' may also be a space)
 * - any of the above followed by "Z", "+HH:MM", "-HH:MM", "+HHMM" or "+HH";
 *   a trailing "Z" means +00:00 and no suffix at all is read as UTC
 *
 * Offsets beyond +/-14:00 are rejected. Returns std::nullopt for anything
 * else, including impossible calendar dates such as 2025-02-30.
 */
std::optional<TimePoint> parseIso8601(const std::string &value);

// Midnight UTC of a valid calendar date; month is 1-based.
TimePoint makeUtcDate(int year, int month, int day);

// QDateTime::toString() format, applied in UTC.
std::string formatUtc(TimePoint timestamp, const QString &format);

// "YYYY-MM-DD", used as a sortable day key.
std::string dayKey(TimePoint timestamp);

// "dd/mm/yyyy" as shown in report rows and period lines.
std::string displayDate(TimePoint timestamp);

} // namespace sheltercontrol
