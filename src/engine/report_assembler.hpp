#pragma once

#include <map>
#include <optional>
#include <string>

#include "common/clock.hpp"
#include "common/models.hpp"
#include "engine/report_config.hpp"
#include "engine/report_document.hpp"

namespace sheltercontrol {

// Result of a summary-only request: flat statistics, no sections.
struct AnalyticsSummary {
    DateWindow window;
    SummaryStats stats;
    // Present only when at least one person has a usable entry date.
    std::optional<double> avgDaysSheltered;
    std::optional<int> maxDaysSheltered;
    // Donation count per food type; empty when there are no donations.
    std::map<std::string, int> foodTypes;
    std::optional<double> totalQuantityDelivered;
    Diagnostics diagnostics;
};

/**
 * Turns raw record collections into report documents.
 *
 * Each call resolves the window, normalizes the three collections, drops
 * records whose own date falls outside the window, and assembles the
 * sections for the requested report kind. Calls share no mutable state.
 *
 * The clock is the only source of "now" (stay lengths and footers); it must
 * outlive the assembler.
 */
class ReportAssembler
{
public:
    explicit ReportAssembler(const ClockInterface &clock,
                             ReportConfig config = ReportConfig{});

    // A missing window means the last seven days. Throws InvalidWindow when
    // window->start is after window->end.
    ReportDocument buildWeekly(const std::optional<DateWindow> &window,
                               const std::string &shelterName,
                               const RawRecordSet &records) const;

    // Throws InvalidPeriod when month is outside 1-12.
    ReportDocument buildMonthly(int month, int year,
                                const std::string &shelterName,
                                const RawRecordSet &records) const;

    AnalyticsSummary summarize(const std::optional<DateWindow> &window,
                               const RawRecordSet &records) const;

    const ReportConfig &config() const;

private:
    const ClockInterface &m_clock;
    ReportConfig m_config;
};

} // namespace sheltercontrol
