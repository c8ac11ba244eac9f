#pragma once

/**
 * @file RunReport.hpp
 * @brief End-of-run summary printed to the console
 */

#include <bioslurry/analysis/MetricsExtractor.hpp>
#include <bioslurry/core/CoreTypes.hpp>
#include <bioslurry/io/AsciiTable.hpp>
#include <bioslurry/io/Banner.hpp>
#include <bioslurry/io/Console.hpp>

#include <cstddef>
#include <optional>
#include <sstream>
#include <string>

namespace bioslurry {

/**
 * @brief How a run ended
 */
enum class RunStatus {
    Success,           ///< Simulated and summarised
    InvalidParameters, ///< Rejected before stepping
    Error              ///< Failed during export or configuration
};

[[nodiscard]] inline std::string to_string(RunStatus status) {
    switch (status) {
    case RunStatus::Success:
        return "SUCCESS";
    case RunStatus::InvalidParameters:
        return "INVALID PARAMETERS";
    case RunStatus::Error:
        return "ERROR";
    }
    return "UNKNOWN";
}

/**
 * @brief Report generator
 *
 * Metrics are optional: a rejected run prints only its status and reason.
 */
class RunReport {
  public:
    explicit RunReport(const Console &console) : console_(console) {}

    void SetStatus(RunStatus status, const std::string &reason = "") {
        status_ = status;
        reason_ = reason;
    }

    void SetScenario(const std::string &name) { scenario_ = name; }

    void SetTiming(double sim_hours, double wall_seconds, std::size_t samples) {
        sim_hours_ = sim_hours;
        wall_seconds_ = wall_seconds;
        samples_ = samples;
    }

    void SetMetrics(const MetricsSummary &metrics) { metrics_ = metrics; }

    [[nodiscard]] std::string Generate() const {
        std::ostringstream oss;
        oss << Banner::GetReportHeader() << "\n";

        oss << "  Scenario:         " << scenario_ << "\n";
        oss << "  Status:           " << to_string(status_) << "\n";
        if (!reason_.empty()) {
            oss << "  Reason:           " << reason_ << "\n";
        }

        if (samples_ > 0) {
            oss << "  Simulated:        " << Console::FormatFixed(sim_hours_, 1) << " h ("
                << Console::FormatFixed(HoursToDays(sim_hours_), 1) << " d), " << samples_
                << " samples\n";
            oss << "  Wall Time:        " << Console::FormatFixed(wall_seconds_ * 1e3, 2)
                << " ms\n";
        }

        if (metrics_) {
            oss << "\n" << Indent(MetricsTable(*metrics_));
            oss << "\n" << Indent(CalendarTable(*metrics_));
        }

        oss << Banner::GetRule() << "\n";
        return oss.str();
    }

    void Print() const {
        const std::string report = Generate();
        const char *color = status_ == RunStatus::Success ? AnsiColor::Green : AnsiColor::Red;
        console_.Write(console_.Colorize(report, color));
        console_.Flush();
    }

    /// "N/A" when T90 was not reached, otherwise days with one decimal
    [[nodiscard]] static std::string FormatT90(const std::optional<double> &t90) {
        return t90 ? Console::FormatFixed(*t90, 1) : "N/A";
    }

  private:
    const Console &console_;

    RunStatus status_ = RunStatus::Success;
    std::string reason_;
    std::string scenario_;
    double sim_hours_ = 0.0;
    double wall_seconds_ = 0.0;
    std::size_t samples_ = 0;
    std::optional<MetricsSummary> metrics_;

    [[nodiscard]] static std::string MetricsTable(const MetricsSummary &m) {
        AsciiTable table;
        table.AddColumn("METRIC", 18);
        table.AddColumn("VALUE", 10, AsciiTable::Align::Right);
        table.AddColumn("UNIT", 6);

        table.AddRow({"Removal day 3", Console::FormatFixed(m.day3.removal_percent, 1), "%"});
        table.AddRow({"Removal day 7", Console::FormatFixed(m.day7.removal_percent, 1), "%"});
        table.AddRow({"Removal day 14", Console::FormatFixed(m.day14.removal_percent, 1), "%"});
        table.AddRow({"T90", FormatT90(m.T90), "d"});
        table.AddRow({"Max biomass", Console::FormatFixed(m.X_max, 1), "mg/L"});
        table.AddRow({"AMPA peak", Console::FormatFixed(m.C_A_peak, 2), "mg/L"});
        table.AddRow({"Final removal", Console::FormatFixed(m.final_removal, 1), "%"});
        return "[ METRICS ]\n" + table.Render();
    }

    [[nodiscard]] static std::string CalendarTable(const MetricsSummary &m) {
        AsciiTable table;
        table.AddColumn("TARGET (d)", 0, AsciiTable::Align::Right);
        table.AddColumn("SAMPLE (d)", 0, AsciiTable::Align::Right);
        table.AddColumn("C_G_aq (mg/L)", 0, AsciiTable::Align::Right);
        table.AddColumn("REMOVAL (%)", 0, AsciiTable::Align::Right);
        table.AddColumn("MATCH", 0);

        for (const CalendarPoint *p : {&m.day3, &m.day7, &m.day14}) {
            table.AddRow({Console::FormatFixed(p->target_day, 0),
                          Console::FormatFixed(p->sample_day, 3), Console::FormatFixed(p->C_G_aq, 2),
                          Console::FormatFixed(p->removal_percent, 1),
                          p->matched ? "yes" : "fallback"});
        }
        return "[ CALENDAR (" + to_string(m.day_lookup) + ") ]\n" + table.Render();
    }

    [[nodiscard]] static std::string Indent(const std::string &block) {
        std::istringstream iss(block);
        std::ostringstream oss;
        std::string line;
        while (std::getline(iss, line)) {
            oss << "  " << line << "\n";
        }
        return oss.str();
    }
};

} // namespace bioslurry
