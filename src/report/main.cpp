#include <QCoreApplication>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"
#include "report/ReportCli.hpp"

namespace {

// Strips every --trace flag; true when at least one was present.
bool takeTraceFlag(QStringList &args)
{
    return args.removeAll(QStringLiteral("--trace")) > 0;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("sheltercontrol-report"));
    QCoreApplication::setApplicationVersion(QStringLiteral("1.0"));

    QStringList args = QCoreApplication::arguments();
    const bool traceFlag = takeTraceFlag(args);
    const bool trace = traceFlag || qEnvironmentVariableIntValue("SHELTERCONTROL_TRACE") == 1;
    sheltercontrol::logging::initLogging(QCoreApplication::applicationName(), trace);

    SCLOG_INFO(QStringLiteral("main"),
               QStringLiteral("main"),
               QStringLiteral("report_cli_start"),
               QStringLiteral("user_invocation"),
               traceFlag ? QStringLiteral("trace_flag") : QStringLiteral("cli"),
               sheltercontrol::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"command", args.size() > 1 ? args.at(1).toStdString() : ""},
                               {"trace", trace}}));

    sheltercontrol::ReportCli cli;
    return cli.run(args);
}
