#include "engine/report_assembler.hpp"

#include <algorithm>
#include <chrono>
#include <set>
#include <utility>
#include <vector>

#include <QString>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/time_utils.hpp"
#include "engine/aggregator.hpp"
#include "engine/period_calculator.hpp"
#include "engine/record_normalizer.hpp"

namespace sheltercontrol {

namespace {

// Normalized records restricted to one window.
struct PreparedRecords {
    DateWindow window;
    std::vector<ShelteredPerson> persons;
    std::vector<FoodDonation> donations;
    std::vector<FoodDelivery> deliveries;
    Diagnostics diagnostics;
};

// Undated records stay for undated counts; dated ones must fall inside.
template <typename Record, typename DateFn>
std::vector<Record> filterToWindow(std::vector<Record> records, const DateWindow &window,
                                   DateFn dateOf, int &undated, int &outside)
{
    std::vector<Record> kept;
    kept.reserve(records.size());
    for (auto &record : records) {
        const std::optional<TimePoint> &date = dateOf(record);
        if (!date.has_value()) {
            ++undated;
            kept.push_back(std::move(record));
        } else if (window.contains(*date)) {
            kept.push_back(std::move(record));
        } else {
            ++outside;
        }
    }
    return kept;
}

PreparedRecords prepare(const DateWindow &window, const RawRecordSet &raw)
{
    NormalizedRecords normalized = normalizeAll(raw);

    PreparedRecords prepared;
    prepared.window = window;
    prepared.diagnostics.warnings = std::move(normalized.warnings);

    Diagnostics &diag = prepared.diagnostics;
    prepared.persons = filterToWindow(
        std::move(normalized.persons), window,
        [](const ShelteredPerson &p) -> const std::optional<TimePoint> & { return p.entryDate; },
        diag.undatedPersons, diag.outsideWindow);
    prepared.donations = filterToWindow(
        std::move(normalized.donations), window,
        [](const FoodDonation &d) -> const std::optional<TimePoint> & { return d.donationDate; },
        diag.undatedDonations, diag.outsideWindow);
    prepared.deliveries = filterToWindow(
        std::move(normalized.deliveries), window,
        [](const FoodDelivery &d) -> const std::optional<TimePoint> & { return d.deliveryDate; },
        diag.undatedDeliveries, diag.outsideWindow);
    return prepared;
}

template <typename Record, typename DateFn>
std::vector<Record> datedOnly(const std::vector<Record> &records, DateFn dateOf)
{
    std::vector<Record> dated;
    for (const auto &record : records) {
        if (dateOf(record).has_value()) {
            dated.push_back(record);
        }
    }
    return dated;
}

std::vector<ShelteredPerson> datedPersons(const std::vector<ShelteredPerson> &persons)
{
    return datedOnly(persons, [](const ShelteredPerson &p) { return p.entryDate; });
}

std::vector<FoodDelivery> datedDeliveries(const std::vector<FoodDelivery> &deliveries)
{
    return datedOnly(deliveries, [](const FoodDelivery &d) { return d.deliveryDate; });
}

MetricRow countRow(const std::string &label, int value)
{
    return MetricRow{label, static_cast<double>(value), std::to_string(value)};
}

MetricRow kgRow(const std::string &label, double value)
{
    return MetricRow{label, value, formatNumber(value) + " kg"};
}

ReportSection summarySection(const std::string &title, const SummaryStats &stats)
{
    MetricTable table;
    table.rows = {
        countRow("Total persons registered", stats.totalPersons),
        countRow("Active persons", stats.activePersons),
        countRow("Total donations", stats.totalDonations),
        countRow("Available donations", stats.availableDonations),
        kgRow("Total kg donated", stats.totalKgDonated),
        countRow("Total deliveries", stats.totalDeliveries),
        kgRow("Total kg delivered", stats.totalKgDelivered),
        countRow("Unique donors", stats.uniqueDonors),
    };
    return ReportSection{title, std::move(table)};
}

GroupedTable groupedTable(const BucketMap &buckets, const std::string &keyHeader,
                          const std::string &countHeader, bool showKg,
                          std::string (*labelOf)(const std::string &key))
{
    GroupedTable table;
    table.keyHeader = keyHeader;
    table.countHeader = countHeader;
    table.showKg = showKg;
    for (const auto &bucket : sortedByKey(buckets)) {
        table.rows.push_back(GroupedRow{bucket.key, labelOf(bucket.key),
                                        bucket.count, bucket.totalKg});
    }
    return table;
}

std::string keyAsLabel(const std::string &key)
{
    return key;
}

// "2025-11-18" -> "18/11/2025"
std::string dayLabel(const std::string &key)
{
    if (key.size() != 10) {
        return key;
    }
    return key.substr(8, 2) + "/" + key.substr(5, 2) + "/" + key.substr(0, 4);
}

// "2025-W07" -> "Week 7"
std::string weekLabel(const std::string &key)
{
    const auto pos = key.find("-W");
    if (pos == std::string::npos) {
        return key;
    }
    return "Week " + std::to_string(std::stoi(key.substr(pos + 2)));
}

// Appends the chart only when it has something to draw.
void appendChart(std::vector<ReportSection> &sections, const std::string &title,
                 ChartKind kind, const std::string &xLabel, const std::string &yLabel,
                 const GroupedTable &table, bool useKg)
{
    if (table.rows.empty()) {
        return;
    }
    ChartDescriptor chart;
    chart.kind = kind;
    chart.xLabel = xLabel;
    chart.yLabel = yLabel;
    for (const auto &row : table.rows) {
        chart.labels.push_back(row.label);
        chart.values.push_back(useKg ? row.totalKg : static_cast<double>(row.count));
    }
    sections.push_back(ReportSection{title, std::move(chart)});
}

RankedTable donorLeaderboard(const std::vector<FoodDonation> &donations, std::size_t size)
{
    const BucketMap byDonor = groupBy(
        donations, [](const FoodDonation &d) { return d.donorName; }, kAnonymousLabel);

    RankedTable table;
    table.keyHeader = "Donor";
    table.limit = size;
    int rank = 0;
    for (const auto &bucket : topN(byDonor, size)) {
        table.rows.push_back(RankedRow{++rank, bucket.key, bucket.count, bucket.totalKg});
    }
    return table;
}

std::string truncateText(const std::string &text, std::size_t width)
{
    // Count characters, not UTF-8 bytes.
    const QString value = QString::fromStdString(text);
    if (static_cast<std::size_t>(value.size()) <= width) {
        return text;
    }
    return value.left(static_cast<int>(width)).toStdString();
}

DetailTable deliveryDetail(const std::vector<FoodDelivery> &deliveries,
                           const ReportConfig &config)
{
    std::vector<FoodDelivery> dated = datedDeliveries(deliveries);
    std::sort(dated.begin(), dated.end(),
              [](const FoodDelivery &a, const FoodDelivery &b) {
                  if (*a.deliveryDate != *b.deliveryDate) {
                      return *a.deliveryDate > *b.deliveryDate;
                  }
                  return a.id < b.id;
              });

    DetailTable table;
    table.limit = config.detailRowLimit;
    table.available = dated.size();
    const std::size_t count = std::min(dated.size(), config.detailRowLimit);
    for (std::size_t i = 0; i < count; ++i) {
        const FoodDelivery &delivery = dated[i];
        DetailRow row;
        row.timestamp = *delivery.deliveryDate;
        row.recordId = delivery.id;
        row.date = displayDate(*delivery.deliveryDate);
        row.food = truncateText(delivery.foodType, config.detailTextWidth);
        row.person = truncateText(delivery.personName, config.detailTextWidth);
        row.quantity = formatNumber(delivery.quantityKg) + " " + delivery.unit;
        table.rows.push_back(std::move(row));
    }
    return table;
}

// Whole days since entry, floored; entries in the future count as 0.
std::vector<double> stayLengths(const std::vector<ShelteredPerson> &persons, TimePoint now)
{
    std::vector<double> days;
    for (const auto &person : persons) {
        if (!person.entryDate.has_value()) {
            continue;
        }
        const auto elapsed = std::chrono::floor<std::chrono::hours>(now - *person.entryDate);
        const long long whole = elapsed.count() >= 0
            ? elapsed.count() / 24
            : 0;
        days.push_back(static_cast<double>(whole));
    }
    return days;
}

// Count over a count, reading an empty denominator as one.
double perAtLeastOne(double numerator, double denominator)
{
    return numerator / std::max(denominator, 1.0);
}

int distinctDeliveryDays(const std::vector<FoodDelivery> &deliveries)
{
    std::set<std::string> days;
    for (const auto &delivery : deliveries) {
        if (delivery.deliveryDate.has_value()) {
            days.insert(dayKey(*delivery.deliveryDate));
        }
    }
    return static_cast<int>(days.size());
}

ReportSection detailedStatsSection(const PreparedRecords &prepared, TimePoint now)
{
    const double avgStay = average(stayLengths(prepared.persons, now));
    const double kgDelivered = totalKg(prepared.deliveries);
    const double perDay = perAtLeastOne(static_cast<double>(prepared.deliveries.size()),
                                        distinctDeliveryDays(prepared.deliveries));
    std::set<std::string> foodTypes;
    for (const auto &donation : prepared.donations) {
        foodTypes.insert(donation.foodType);
    }
    // Not capped: several deliveries may draw on one donation.
    const double deliveryRate = perAtLeastOne(static_cast<double>(prepared.deliveries.size()),
                                              static_cast<double>(prepared.donations.size()))
        * 100.0;

    MetricTable table;
    table.rows = {
        MetricRow{"Average stay", avgStay, formatNumber(avgStay) + " days"},
        kgRow("Total kg delivered", kgDelivered),
        MetricRow{"Average deliveries per day", perDay, formatNumber(perDay)},
        countRow("Distinct food types", static_cast<int>(foodTypes.size())),
        MetricRow{"Delivery rate", deliveryRate, formatNumber(deliveryRate) + "%"},
    };
    return ReportSection{"Detailed Statistics", std::move(table)};
}

std::string footerText(TimePoint now, const ReportConfig &config)
{
    return "Generated at " + formatUtc(now, QStringLiteral("dd/MM/yyyy HH:mm")) + " | "
        + config.productLabel;
}

logging::RequestContext requestContext(const char *kind, const std::string &shelterName)
{
    return logging::RequestContext{QString(), QString::fromLatin1(kind),
                                   QString::fromStdString(shelterName)};
}

void logRequestComplete(const QString &where, const ReportDocument &document)
{
    SCLOG_INFO(QStringLiteral("ReportAssembler"),
               where,
               QStringLiteral("report_assembled"),
               QStringLiteral("report_request"),
               QStringLiteral("aggregation"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"kind", document.kind},
                               {"window", document.window},
                               {"sections", document.sections.size()},
                               {"warnings", document.diagnostics.warnings.size()},
                               {"outsideWindow", document.diagnostics.outsideWindow}}));
    logging::logDiagnosticsSummary(QStringLiteral("ReportAssembler"), where, document.diagnostics);
}

} // namespace

ReportAssembler::ReportAssembler(const ClockInterface &clock, ReportConfig config)
    : m_clock(clock)
    , m_config(std::move(config))
{
}

const ReportConfig &ReportAssembler::config() const
{
    return m_config;
}

ReportDocument ReportAssembler::buildWeekly(const std::optional<DateWindow> &window,
                                            const std::string &shelterName,
                                            const RawRecordSet &records) const
{
    const std::string shelter = shelterName.empty() ? m_config.defaultShelterName : shelterName;
    logging::RequestScope scope(requestContext("weekly", shelter));

    const DateWindow resolved = window.has_value()
        ? makeWindow(window->start, window->end)
        : defaultWindow(m_clock);
    SCLOG_INFO(QStringLiteral("ReportAssembler"),
               QStringLiteral("buildWeekly"),
               QStringLiteral("report_start"),
               QStringLiteral("report_request"),
               window.has_value() ? QStringLiteral("explicit_window")
                                  : QStringLiteral("default_window"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"window", resolved},
                               {"persons", records.persons.size()},
                               {"donations", records.donations.size()},
                               {"deliveries", records.deliveries.size()}}));

    const PreparedRecords prepared = prepare(resolved, records);
    const TimePoint now = m_clock.now();

    ReportDocument document;
    document.kind = ReportKind::Weekly;
    document.shelterName = shelter;
    document.title = "Weekly Report - " + document.shelterName;
    document.period = "Period: " + displayDate(resolved.start) + " - "
        + displayDate(resolved.end);
    document.footer = footerText(now, m_config);
    document.fileStem = "weekly_report_" + formatUtc(resolved.start, QStringLiteral("yyyyMMdd"))
        + "_" + formatUtc(resolved.end, QStringLiteral("yyyyMMdd"));
    document.window = resolved;
    document.generatedAt = now;

    auto &sections = document.sections;
    sections.push_back(summarySection(
        "Executive Summary",
        summaryStats(prepared.persons, prepared.donations, prepared.deliveries)));

    const BucketMap personsByDay = groupBy(
        datedPersons(prepared.persons),
        [](const ShelteredPerson &p) { return dayKey(*p.entryDate); });
    GroupedTable personsTable = groupedTable(personsByDay, "Date", "Persons", false, dayLabel);
    sections.push_back(ReportSection{"Persons Registered per Day", personsTable});
    appendChart(sections, "Persons Registered per Day", ChartKind::Bar,
                "Date", "Persons", personsTable, false);

    const BucketMap donationsByType = groupBy(
        prepared.donations, [](const FoodDonation &d) { return d.foodType; });
    GroupedTable typesTable =
        groupedTable(donationsByType, "Food type", "Donations", true, keyAsLabel);
    sections.push_back(ReportSection{"Donations by Food Type", typesTable});
    appendChart(sections, "Donations by Food Type", ChartKind::Bar,
                "Food type", "Donations", typesTable, false);

    sections.push_back(ReportSection{
        "Top " + std::to_string(m_config.leaderboardSize) + " Donors",
        donorLeaderboard(prepared.donations, m_config.leaderboardSize)});

    const BucketMap deliveriesByDay = groupBy(
        datedDeliveries(prepared.deliveries),
        [](const FoodDelivery &d) { return dayKey(*d.deliveryDate); });
    GroupedTable deliveriesTable =
        groupedTable(deliveriesByDay, "Date", "Deliveries", true, dayLabel);
    sections.push_back(ReportSection{"Deliveries per Day", deliveriesTable});
    appendChart(sections, "Deliveries per Day", ChartKind::Line,
                "Date", "Deliveries", deliveriesTable, false);

    sections.push_back(ReportSection{"Delivery Detail",
                                     deliveryDetail(prepared.deliveries, m_config)});

    document.diagnostics = prepared.diagnostics;
    logRequestComplete(QStringLiteral("buildWeekly"), document);
    return document;
}

ReportDocument ReportAssembler::buildMonthly(int month, int year,
                                             const std::string &shelterName,
                                             const RawRecordSet &records) const
{
    const std::string shelter = shelterName.empty() ? m_config.defaultShelterName : shelterName;
    logging::RequestScope scope(requestContext("monthly", shelter));

    const DateWindow resolved = monthBounds(year, month);
    SCLOG_INFO(QStringLiteral("ReportAssembler"),
               QStringLiteral("buildMonthly"),
               QStringLiteral("report_start"),
               QStringLiteral("report_request"),
               QStringLiteral("month_window"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"month", month},
                               {"year", year},
                               {"persons", records.persons.size()},
                               {"donations", records.donations.size()},
                               {"deliveries", records.deliveries.size()}}));

    const PreparedRecords prepared = prepare(resolved, records);
    const TimePoint now = m_clock.now();

    ReportDocument document;
    document.kind = ReportKind::Monthly;
    document.shelterName = shelter;
    document.title = "Monthly Report - " + document.shelterName;
    document.period = monthName(month) + " " + std::to_string(year);
    document.footer = footerText(now, m_config);
    document.fileStem = "monthly_report_" + formatUtc(resolved.start, QStringLiteral("yyyy_MM"));
    document.window = resolved;
    document.generatedAt = now;

    auto &sections = document.sections;
    sections.push_back(summarySection(
        "Monthly Summary",
        summaryStats(prepared.persons, prepared.donations, prepared.deliveries)));

    const BucketMap deliveriesByWeek = groupBy(
        datedDeliveries(prepared.deliveries),
        [](const FoodDelivery &d) { return isoWeekKey(*d.deliveryDate); });
    GroupedTable weeklyTable =
        groupedTable(deliveriesByWeek, "Week", "Deliveries", true, weekLabel);
    sections.push_back(ReportSection{"Weekly Trends", weeklyTable});
    appendChart(sections, "Deliveries per Week", ChartKind::Bar,
                "Week of year", "Deliveries", weeklyTable, false);

    const BucketMap donationsByType = groupBy(
        prepared.donations, [](const FoodDonation &d) { return d.foodType; });
    GroupedTable typesTable =
        groupedTable(donationsByType, "Food type", "Donations", true, keyAsLabel);
    sections.push_back(ReportSection{"Food Type Distribution", typesTable});
    appendChart(sections, "Food Type Distribution", ChartKind::Pie,
                "Food type", "Donations", typesTable, false);

    RankedTable donors = donorLeaderboard(prepared.donations, m_config.leaderboardSize);
    const std::string donorsTitle =
        "Top " + std::to_string(m_config.leaderboardSize) + " Donors";
    if (!donors.rows.empty()) {
        ChartDescriptor chart;
        chart.kind = ChartKind::Bar;
        chart.xLabel = "Total kg";
        chart.yLabel = "Donor";
        for (const auto &row : donors.rows) {
            chart.labels.push_back(row.key);
            chart.values.push_back(row.totalKg);
        }
        sections.push_back(ReportSection{donorsTitle, std::move(donors)});
        sections.push_back(ReportSection{donorsTitle, std::move(chart)});
    } else {
        sections.push_back(ReportSection{donorsTitle, std::move(donors)});
    }

    sections.push_back(detailedStatsSection(prepared, now));

    document.diagnostics = prepared.diagnostics;
    logRequestComplete(QStringLiteral("buildMonthly"), document);
    return document;
}

AnalyticsSummary ReportAssembler::summarize(const std::optional<DateWindow> &window,
                                            const RawRecordSet &records) const
{
    logging::RequestScope scope(requestContext("summary", m_config.defaultShelterName));

    const DateWindow resolved = window.has_value()
        ? makeWindow(window->start, window->end)
        : defaultWindow(m_clock);
    const PreparedRecords prepared = prepare(resolved, records);

    AnalyticsSummary summary;
    summary.window = resolved;
    summary.stats = summaryStats(prepared.persons, prepared.donations, prepared.deliveries);

    const std::vector<double> stays = stayLengths(prepared.persons, m_clock.now());
    if (!stays.empty()) {
        summary.avgDaysSheltered = average(stays);
        summary.maxDaysSheltered =
            static_cast<int>(*std::max_element(stays.begin(), stays.end()));
    }
    for (const auto &donation : prepared.donations) {
        ++summary.foodTypes[donation.foodType];
    }
    if (!prepared.deliveries.empty()) {
        summary.totalQuantityDelivered = totalKg(prepared.deliveries);
    }
    summary.diagnostics = prepared.diagnostics;

    SCLOG_INFO(QStringLiteral("ReportAssembler"),
               QStringLiteral("summarize"),
               QStringLiteral("summary_computed"),
               QStringLiteral("report_request"),
               QStringLiteral("aggregation"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"window", resolved},
                               {"stats", summary.stats},
                               {"warnings", summary.diagnostics.warnings.size()}}));
    logging::logDiagnosticsSummary(QStringLiteral("ReportAssembler"),
                                   QStringLiteral("summarize"),
                                   summary.diagnostics);
    return summary;
}

} // namespace sheltercontrol
