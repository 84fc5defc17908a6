#include "common/logging.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QThread>
#include <QUuid>

#include <cstdio>
#include <mutex>
#include <utility>

#include "common/json_utils.hpp"

namespace sheltercontrol::logging {

namespace {

constexpr qint64 kMaxLogSizeBytes = 5 * 1024 * 1024;

std::mutex g_logMutex;
bool g_traceEnabled = false;
QString g_processName;

thread_local RequestContext t_request;

const char *levelName(LogLevel level)
{
    switch (level) {
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    }
    return "INFO";
}

QString logsDir()
{
    const QString overridden = qEnvironmentVariable("SHELTERCONTROL_LOG_DIR");
    if (!overridden.isEmpty()) {
        return overridden;
    }
    const QString home = qEnvironmentVariable("HOME");
    const QString relative = QStringLiteral(".local/share/sheltercontrol/logs");
    return home.isEmpty() ? relative : home + QLatin1Char('/') + relative;
}

// Keeps one previous generation as <file>.1.
void rotateIfNeeded(const QString &path)
{
    const QFileInfo info(path);
    if (!info.exists() || info.size() < kMaxLogSizeBytes) {
        return;
    }
    const QString rotated = path + QStringLiteral(".1");
    QFile::remove(rotated);
    QFile::rename(path, rotated);
}

void appendLine(const QString &path, const QByteArray &line)
{
    rotateIfNeeded(path);
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        std::fprintf(stderr, "%s\n", line.constData());
        return;
    }
    file.write(line);
    file.write("\n");
}

} // namespace

void initLogging(const QString &processName, bool traceEnabled)
{
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_processName = processName;
    g_traceEnabled = traceEnabled;
}

const RequestContext &currentRequest()
{
    return t_request;
}

RequestScope::RequestScope(RequestContext context)
    : m_previous(std::exchange(t_request, std::move(context)))
{
    if (t_request.correlationId.isEmpty()) {
        t_request.correlationId = QUuid::createUuid().toString(QUuid::WithoutBraces);
    }
}

RequestScope::~RequestScope()
{
    t_request = std::move(m_previous);
}

const RequestContext &RequestScope::context() const
{
    return t_request;
}

QString defaultProcessName()
{
    return g_processName.isEmpty() ? QStringLiteral("sheltercontrol") : g_processName;
}

QString defaultWho()
{
    if (!t_request.shelterName.isEmpty()) {
        return QStringLiteral("shelter:") + t_request.shelterName;
    }
    QString login = qEnvironmentVariable("USER");
    if (login.isEmpty()) {
        login = QStringLiteral("unknown");
    }
    return QStringLiteral("operator:") + login;
}

void logEvent(LogLevel level,
              const QString &processName,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const QString &how,
              const QString &who,
              const QString &correlationId,
              const nlohmann::json &context)
{
    nlohmann::json payload = {
        {"ts", QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs).toStdString()},
        {"level", levelName(level)},
        {"process", processName.toStdString()},
        {"thread", QStringLiteral("0x%1")
                       .arg(reinterpret_cast<quintptr>(QThread::currentThreadId()), 0, 16)
                       .toStdString()},
        {"component", component.toStdString()},
        {"where", where.toStdString()},
        {"what", what.toStdString()},
        {"why", why.toStdString()},
        {"how", how.toStdString()},
        {"who", who.toStdString()},
        {"corr", (correlationId.isEmpty() ? t_request.correlationId : correlationId)
                     .toStdString()},
        {"context", context}
    };
    if (!t_request.reportKind.isEmpty()) {
        payload["request"] = {{"kind", t_request.reportKind.toStdString()},
                              {"shelter", t_request.shelterName.toStdString()}};
    }
    const QByteArray line = QByteArray::fromStdString(payload.dump());

    const QString dir = logsDir();
    const QString base = dir + QLatin1Char('/')
        + (processName.isEmpty() ? defaultProcessName() : processName);

    std::lock_guard<std::mutex> lock(g_logMutex);
    if (level == LogLevel::Debug && !g_traceEnabled) {
        return;
    }
    QDir().mkpath(dir);
    appendLine(base + QStringLiteral(".log"), line);
    if (g_traceEnabled) {
        appendLine(base + QStringLiteral("-trace.log"), line);
    }
}

void logDiagnosticsSummary(const QString &component,
                           const QString &where,
                           const Diagnostics &diagnostics)
{
    const int undated = diagnostics.undatedPersons + diagnostics.undatedDonations
        + diagnostics.undatedDeliveries;
    const bool clean = diagnostics.warnings.empty() && undated == 0
        && diagnostics.outsideWindow == 0;

    nlohmann::json byKind = nlohmann::json::object();
    for (const auto &warning : diagnostics.warnings) {
        const std::string kind = toRecordKindString(warning.recordKind);
        byKind[kind] = byKind.value(kind, 0) + 1;
    }

    logEvent(clean ? LogLevel::Info : LogLevel::Warn,
             defaultProcessName(),
             component,
             where,
             QStringLiteral("diagnostics_summary"),
             QStringLiteral("data_quality"),
             clean ? QStringLiteral("all_records_clean") : QStringLiteral("records_degraded"),
             defaultWho(),
             QString(),
             nlohmann::json{{"warnings", diagnostics.warnings.size()},
                            {"warningsByKind", byKind},
                            {"undated", {{"persons", diagnostics.undatedPersons},
                                         {"donations", diagnostics.undatedDonations},
                                         {"deliveries", diagnostics.undatedDeliveries}}},
                            {"outsideWindow", diagnostics.outsideWindow}});
}

} // namespace sheltercontrol::logging
