#pragma once

#include <string>

#include "common/clock.hpp"
#include "common/models.hpp"

namespace sheltercontrol {

// ISO-8601 week date. The week-year differs from the calendar year for a
// few days around January 1st.
struct IsoWeek {
    int year = 0;
    int week = 0;
};

// Builds a window and enforces start <= end. Throws InvalidWindow.
DateWindow makeWindow(TimePoint start, TimePoint end);

/**
 * First and last calendar day of a month, in UTC.
 *
 * start is 00:00:00 on day 1 and end is 23:59:59 on the last day, so the
 * window is inclusive of every record dated within the month. December rolls
 * into (year + 1, January) minus one day.
 *
 * Throws InvalidPeriod when month is outside 1-12.
 */
DateWindow monthBounds(int year, int month);

IsoWeek isoWeekDateOf(TimePoint timestamp);

// ISO-8601 week number, 1-53.
int isoWeekOf(TimePoint timestamp);

// Sortable grouping key for a week, e.g. "2025-W01".
std::string isoWeekKey(TimePoint timestamp);

// The last seven days: [now - 7 days, now].
DateWindow defaultWindow(const ClockInterface &clock);

// English month name for 1-12; throws InvalidPeriod otherwise.
std::string monthName(int month);

} // namespace sheltercontrol
