#pragma once

#include <QString>
#include <QStringList>

#include "common/clock.hpp"
#include "common/models.hpp"

namespace sheltercontrol {

class ReportCli
{
public:
    ReportCli();
    // The clock must outlive the CLI; tests pass a FixedClock.
    explicit ReportCli(const ClockInterface &clock);

    // CLI dispatcher for weekly, monthly and summary reports.
    // returns exit code: 0 success, 2 invalid input, 1 internal failure
    int run(int argc, char *argv[]);
    // args[0] is the program name.
    int run(const QStringList &args);

private:
    // Each subcommand reads a record export and renders the result.
    int runWeeklyReport(const QStringList &args);
    int runMonthlyReport(const QStringList &args);
    int runSummaryReport(const QStringList &args);

    SystemClock m_systemClock;
    const ClockInterface &m_clock;
};

} // namespace sheltercontrol
