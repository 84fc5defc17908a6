#include "common/time_utils.hpp"

#include <chrono>
#include <cstdlib>

#include <QDate>
#include <QRegularExpression>
#include <QTime>

namespace sheltercontrol {

namespace {

constexpr int kMaxOffsetSeconds = 14 * 3600;

// Date, then an optional time with an optional zone. Minutes of an offset
// must be two digits whenever a colon is present.
const QRegularExpression &isoShape()
{
    static const QRegularExpression shape(QStringLiteral(
        "^(\\d{4}-\\d{2}-\\d{2})"
        "(?:[Tt ](\\d{2}:\\d{2}(?::\\d{2}(?:[.,]\\d+)?)?)"
        "([Zz]|[+-]\\d{2}(?::?\\d{2})?)?)?$"));
    return shape;
}

} // namespace

QDateTime toUtcDateTime(TimePoint timestamp)
{
    // Floor so instants just before midnight stay on their day.
    const auto millis = std::chrono::floor<std::chrono::milliseconds>(
                            timestamp.time_since_epoch())
                            .count();
    return QDateTime::fromMSecsSinceEpoch(millis, Qt::UTC);
}

TimePoint fromDateTime(const QDateTime &dateTime)
{
    return TimePoint{std::chrono::milliseconds{dateTime.toMSecsSinceEpoch()}};
}

std::string toIso8601Utc(TimePoint timestamp)
{
    return toUtcDateTime(timestamp).toString(Qt::ISODate).toStdString();
}

std::optional<TimePoint> parseIso8601(const std::string &value)
{
    const QString text = QString::fromStdString(value).trimmed();
    const QRegularExpressionMatch match = isoShape().match(text);
    if (!match.hasMatch()) {
        return std::nullopt;
    }

    const QString datePart = match.captured(1);
    const QDate date = QDate::fromString(datePart, Qt::ISODate);
    if (!date.isValid()) {
        return std::nullopt;
    }
    if (match.capturedLength(2) == 0) {
        return fromDateTime(QDateTime(date, QTime(0, 0), Qt::UTC));
    }

    // No zone designator means UTC.
    QString zone = match.captured(3).toUpper();
    if (zone.isEmpty()) {
        zone = QStringLiteral("Z");
    }
    const QDateTime parsed = QDateTime::fromString(
        datePart + QLatin1Char('T') + match.captured(2) + zone, Qt::ISODateWithMs);
    if (!parsed.isValid() || std::abs(parsed.offsetFromUtc()) > kMaxOffsetSeconds) {
        return std::nullopt;
    }
    return fromDateTime(parsed);
}

TimePoint makeUtcDate(int year, int month, int day)
{
    return fromDateTime(QDateTime(QDate(year, month, day), QTime(0, 0), Qt::UTC));
}

std::string formatUtc(TimePoint timestamp, const QString &format)
{
    return toUtcDateTime(timestamp).toString(format).toStdString();
}

std::string dayKey(TimePoint timestamp)
{
    return formatUtc(timestamp, QStringLiteral("yyyy-MM-dd"));
}

std::string displayDate(TimePoint timestamp)
{
    return formatUtc(timestamp, QStringLiteral("dd/MM/yyyy"));
}

} // namespace sheltercontrol
