#include "report/ReportCli.hpp"

#include <chrono>
#include <iostream>
#include <optional>
#include <stdexcept>

#include <QByteArray>
#include <QDate>
#include <QFile>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/time_utils.hpp"
#include "engine/report_assembler.hpp"
#include "engine/report_config.hpp"
#include "report/ReportRenderer.hpp"

namespace sheltercontrol {

namespace {

// Bad arguments or unreadable input; reported like the engine's own
// input-contract errors.
class UsageError : public std::runtime_error {
public:
    explicit UsageError(const std::string &message)
        : std::runtime_error(message)
    {
    }
};

QString usageText()
{
    return QStringLiteral(
        "Usage:\n"
        "  sheltercontrol-report weekly --input PATH [--from ISO --to ISO] [--shelter NAME]\n"
        "                               [--format markdown|json] [--out PATH]\n"
        "  sheltercontrol-report monthly --input PATH [--month M] [--year Y] [--shelter NAME]\n"
        "                                [--format markdown|json] [--out PATH]\n"
        "  sheltercontrol-report summary --input PATH [--from ISO --to ISO] [--out PATH]\n"
        "Common options: --config PATH, --trace\n");
}

QString getArgValue(const QStringList &args, const QString &key)
{
    const int idx = args.indexOf(key);
    if (idx < 0 || idx + 1 >= args.size()) {
        return {};
    }
    return args.at(idx + 1);
}

QString getFormat(const QStringList &args)
{
    const QString value = getArgValue(args, QStringLiteral("--format"));
    if (value.isEmpty()) {
        return QStringLiteral("markdown");
    }
    return value.toLower();
}

void requireValidFormat(const QString &format)
{
    if (format != QStringLiteral("markdown") && format != QStringLiteral("json")) {
        throw UsageError("Invalid format. Use markdown or json.");
    }
}

RawRecordSet readRecordFile(const QString &path)
{
    if (path.isEmpty()) {
        throw UsageError("Missing --input PATH.");
    }
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        throw UsageError("Cannot open input file " + path.toStdString() + ".");
    }
    const QByteArray data = file.readAll();
    nlohmann::json parsed;
    try {
        parsed = nlohmann::json::parse(data.toStdString());
    } catch (const nlohmann::json::parse_error &ex) {
        throw UsageError("Input file is not valid JSON: " + std::string(ex.what()));
    }
    if (!parsed.is_object()) {
        throw UsageError("Input file must hold a JSON object.");
    }
    try {
        return parsed.get<RawRecordSet>();
    } catch (const nlohmann::json::type_error &ex) {
        throw UsageError("Record collections must be JSON arrays: " + std::string(ex.what()));
    }
}

void writeOutput(const QString &outPath, const std::string &content)
{
    if (outPath.isEmpty()) {
        std::cout << content;
        if (content.empty() || content.back() != '\n') {
            std::cout << std::endl;
        }
        return;
    }

    QFile file(outPath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        throw std::runtime_error("Failed to open output file " + outPath.toStdString());
    }
    const QByteArray data = QByteArray::fromStdString(content);
    if (file.write(data) != data.size()) {
        throw std::runtime_error("Failed to write output file " + outPath.toStdString());
    }
}

int parseIntArg(const QStringList &args, const QString &key, int fallback)
{
    const QString value = getArgValue(args, key);
    if (value.isEmpty()) {
        return fallback;
    }
    bool ok = false;
    const int parsed = value.toInt(&ok);
    if (!ok) {
        throw UsageError("Invalid integer for " + key.toStdString() + ".");
    }
    return parsed;
}

TimePoint timestampArg(const QString &value)
{
    const auto parsed = parseIso8601(value.trimmed().toStdString());
    if (!parsed.has_value()) {
        throw UsageError("Invalid ISO8601 timestamp: " + value.toStdString());
    }
    return *parsed;
}

// --from/--to come as a pair; without them the assembler picks its default.
std::optional<DateWindow> windowFromArgs(const QStringList &args)
{
    const QString fromValue = getArgValue(args, QStringLiteral("--from"));
    const QString toValue = getArgValue(args, QStringLiteral("--to"));
    if (fromValue.isEmpty() != toValue.isEmpty()) {
        throw UsageError("Pass both --from and --to, or neither.");
    }
    if (fromValue.isEmpty()) {
        return std::nullopt;
    }

    const TimePoint from = timestampArg(fromValue);
    TimePoint to = timestampArg(toValue);
    // A bare date as the upper bound covers that whole day.
    if (toValue.trimmed().size() == 10) {
        to += std::chrono::hours(24) - std::chrono::seconds(1);
    }
    return DateWindow{from, to};
}

void printError(const std::string &error, const std::string &message)
{
    const nlohmann::json payload{{"error", error}, {"message", message}};
    std::cerr << payload.dump() << std::endl;
}

} // namespace

ReportCli::ReportCli()
    : m_clock(m_systemClock)
{
}

ReportCli::ReportCli(const ClockInterface &clock)
    : m_clock(clock)
{
}

int ReportCli::run(int argc, char *argv[])
{
    QStringList args;
    args.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        args.push_back(QString::fromLocal8Bit(argv[i]));
    }
    return run(args);
}

int ReportCli::run(const QStringList &args)
{
    // Parse the subcommand and delegate to the report handler.
    if (args.size() < 2) {
        std::cerr << usageText().toStdString();
        return 2;
    }

    const QString command = args.at(1);
    SCLOG_INFO(QStringLiteral("ReportCli"),
               QStringLiteral("run"),
               QStringLiteral("report_cli_command"),
               QStringLiteral("user_invocation"),
               QStringLiteral("cli"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"command", command.toStdString()}}));

    try {
        if (command == QStringLiteral("weekly")) {
            return runWeeklyReport(args);
        }
        if (command == QStringLiteral("monthly")) {
            return runMonthlyReport(args);
        }
        if (command == QStringLiteral("summary")) {
            return runSummaryReport(args);
        }
    } catch (const UsageError &ex) {
        printError("usage_error", ex.what());
        std::cerr << usageText().toStdString();
        return 2;
    } catch (const InvalidWindow &ex) {
        printError("invalid_window", ex.what());
        return 2;
    } catch (const InvalidPeriod &ex) {
        printError("invalid_period", ex.what());
        return 2;
    } catch (const InvalidConfig &ex) {
        printError("invalid_config", ex.what());
        return 2;
    } catch (const std::exception &ex) {
        SCLOG_ERROR(QStringLiteral("ReportCli"),
                    QStringLiteral("run"),
                    QStringLiteral("report_failed"),
                    QStringLiteral("internal_error"),
                    QStringLiteral("cli"),
                    logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"command", command.toStdString()},
                                    {"error", ex.what()}}));
        printError("internal_error", ex.what());
        return 1;
    }

    std::cerr << usageText().toStdString();
    return 2;
}

int ReportCli::runWeeklyReport(const QStringList &args)
{
    // Weekly reports default to the last seven days when no window is given.
    const std::optional<DateWindow> window = windowFromArgs(args);

    const QString format = getFormat(args);
    requireValidFormat(format);

    const ReportConfig config = loadReportConfig(getArgValue(args, QStringLiteral("--config")));
    const RawRecordSet records = readRecordFile(getArgValue(args, QStringLiteral("--input")));

    ReportAssembler assembler(m_clock, config);
    const ReportDocument document = assembler.buildWeekly(
        window, getArgValue(args, QStringLiteral("--shelter")).toStdString(), records);

    writeOutput(getArgValue(args, QStringLiteral("--out")),
                format == QStringLiteral("json") ? documentToJson(document).dump(2)
                                                 : renderMarkdown(document));

    SCLOG_INFO(QStringLiteral("ReportCli"),
               QStringLiteral("runWeeklyReport"),
               QStringLiteral("report_weekly"),
               QStringLiteral("user_invocation"),
               QStringLiteral("record_export"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"sections", document.sections.size()},
                               {"file", document.fileStem},
                               {"format", format.toStdString()}}));
    return 0;
}

int ReportCli::runMonthlyReport(const QStringList &args)
{
    // Monthly reports default to the clock's current month.
    const QDate today = toUtcDateTime(m_clock.now()).date();
    const int month = parseIntArg(args, QStringLiteral("--month"), today.month());
    const int year = parseIntArg(args, QStringLiteral("--year"), today.year());

    const QString format = getFormat(args);
    requireValidFormat(format);

    const ReportConfig config = loadReportConfig(getArgValue(args, QStringLiteral("--config")));
    const RawRecordSet records = readRecordFile(getArgValue(args, QStringLiteral("--input")));

    ReportAssembler assembler(m_clock, config);
    const ReportDocument document = assembler.buildMonthly(
        month, year, getArgValue(args, QStringLiteral("--shelter")).toStdString(), records);

    writeOutput(getArgValue(args, QStringLiteral("--out")),
                format == QStringLiteral("json") ? documentToJson(document).dump(2)
                                                 : renderMarkdown(document));

    SCLOG_INFO(QStringLiteral("ReportCli"),
               QStringLiteral("runMonthlyReport"),
               QStringLiteral("report_monthly"),
               QStringLiteral("user_invocation"),
               QStringLiteral("record_export"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"sections", document.sections.size()},
                               {"file", document.fileStem},
                               {"format", format.toStdString()}}));
    return 0;
}

int ReportCli::runSummaryReport(const QStringList &args)
{
    // Summary requests skip sections entirely and print flat JSON.
    const std::optional<DateWindow> window = windowFromArgs(args);

    const ReportConfig config = loadReportConfig(getArgValue(args, QStringLiteral("--config")));
    const RawRecordSet records = readRecordFile(getArgValue(args, QStringLiteral("--input")));

    ReportAssembler assembler(m_clock, config);
    const AnalyticsSummary summary = assembler.summarize(window, records);
    writeOutput(getArgValue(args, QStringLiteral("--out")), summaryToJson(summary).dump(2));
    return 0;
}

} // namespace sheltercontrol
