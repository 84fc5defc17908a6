#include "engine/period_calculator.hpp"

#include <chrono>

#include <QDate>
#include <QTime>

#include "common/errors.hpp"
#include "common/time_utils.hpp"

namespace sheltercontrol {

DateWindow makeWindow(TimePoint start, TimePoint end)
{
    if (start > end) {
        throw InvalidWindow("window start " + toIso8601Utc(start)
                            + " is after end " + toIso8601Utc(end));
    }
    return DateWindow{start, end};
}

DateWindow monthBounds(int year, int month)
{
    if (month < 1 || month > 12) {
        throw InvalidPeriod("month must be between 1 and 12, got "
                            + std::to_string(month));
    }
    if (year < 1 || year > 9999) {
        throw InvalidPeriod("year out of range: " + std::to_string(year));
    }

    const QDate first(year, month, 1);
    const QDate last(year, month, first.daysInMonth());
    return DateWindow{fromDateTime(QDateTime(first, QTime(0, 0), Qt::UTC)),
                      fromDateTime(QDateTime(last, QTime(23, 59, 59), Qt::UTC))};
}

IsoWeek isoWeekDateOf(TimePoint timestamp)
{
    IsoWeek week;
    week.week = toUtcDateTime(timestamp).date().weekNumber(&week.year);
    return week;
}

int isoWeekOf(TimePoint timestamp)
{
    return isoWeekDateOf(timestamp).week;
}

std::string isoWeekKey(TimePoint timestamp)
{
    const IsoWeek week = isoWeekDateOf(timestamp);
    return QStringLiteral("%1-W%2")
        .arg(week.year, 4, 10, QLatin1Char('0'))
        .arg(week.week, 2, 10, QLatin1Char('0'))
        .toStdString();
}

DateWindow defaultWindow(const ClockInterface &clock)
{
    const TimePoint now = clock.now();
    return DateWindow{now - std::chrono::hours(24 * 7), now};
}

std::string monthName(int month)
{
    static const char *kMonths[] = {
        "January", "February", "March", "April", "May", "June",
        "July", "August", "September", "October", "November", "December"
    };
    if (month < 1 || month > 12) {
        throw InvalidPeriod("month must be between 1 and 12, got "
                            + std::to_string(month));
    }
    return kMonths[month - 1];
}

} // namespace sheltercontrol
