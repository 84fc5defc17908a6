#pragma once

#include <QString>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace sheltercontrol::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Call once from main(). Lines go to <logs>/<processName>.log, where <logs>
// is $SHELTERCONTROL_LOG_DIR or $HOME/.local/share/sheltercontrol/logs.
// With trace on, Debug lines are kept and every line is mirrored to
// <processName>-trace.log.
void initLogging(const QString &processName, bool traceEnabled);

// The report request being served on this thread. Empty outside a request.
struct RequestContext {
    QString correlationId;
    QString reportKind;
    QString shelterName;
};

const RequestContext &currentRequest();

// Installs a request for the lifetime of the scope and restores the previous
// one afterwards. A blank correlation id is replaced with a fresh UUID.
class RequestScope {
public:
    explicit RequestScope(RequestContext context);
    ~RequestScope();

    RequestScope(const RequestScope &) = delete;
    RequestScope &operator=(const RequestScope &) = delete;

    const RequestContext &context() const;

private:
    RequestContext m_previous;
};

/**
 * Write one JSON line.
 *
 * Fields: ts, level, process, thread, component, where, what, why, how, who,
 * corr, context, plus "request" {kind, shelter} while a RequestScope is
 * active. An empty correlationId falls back to the current request's id.
 */
void logEvent(LogLevel level,
              const QString &processName,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const QString &how,
              const QString &who,
              const QString &correlationId,
              const nlohmann::json &context = nlohmann::json::object());

QString defaultProcessName();

// "shelter:<name>" inside a request, "operator:<login>" otherwise.
QString defaultWho();

// One line per report with warning and dropped-record counts: WARN when any
// record was defaulted, left undated or fell outside the window, else INFO.
void logDiagnosticsSummary(const QString &component,
                           const QString &where,
                           const Diagnostics &diagnostics);

} // namespace sheltercontrol::logging

#define SCLOG_AT(level, component, where, what, why, how, who, corr, ctxJson) \
    ::sheltercontrol::logging::logEvent((level), \
                                        ::sheltercontrol::logging::defaultProcessName(), \
                                        (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define SCLOG_DEBUG(component, where, what, why, how, who, corr, ctxJson) \
    SCLOG_AT(::sheltercontrol::logging::LogLevel::Debug, (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define SCLOG_INFO(component, where, what, why, how, who, corr, ctxJson) \
    SCLOG_AT(::sheltercontrol::logging::LogLevel::Info, (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define SCLOG_WARN(component, where, what, why, how, who, corr, ctxJson) \
    SCLOG_AT(::sheltercontrol::logging::LogLevel::Warn, (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define SCLOG_ERROR(component, where, what, why, how, who, corr, ctxJson) \
    SCLOG_AT(::sheltercontrol::logging::LogLevel::Error, (component), (where), (what), (why), (how), (who), (corr), (ctxJson))
