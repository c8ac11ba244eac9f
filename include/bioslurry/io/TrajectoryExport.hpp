#pragma once

/**
 * @file TrajectoryExport.hpp
 * @brief CSV export and tabular views of a trajectory
 */

#include <bioslurry/core/Error.hpp>
#include <bioslurry/io/AsciiTable.hpp>
#include <bioslurry/io/Console.hpp>
#include <bioslurry/sim/Trajectory.hpp>

#include <cerrno>
#include <cstddef>
#include <cstring>
#include <fstream>
#include <string>

namespace bioslurry {

/// Column headers of the trajectory CSV, in order
constexpr const char *kCsvHeader =
    "Time (h),Time (days),C_G_aq (mg/L),C_G_s (mg/kg),C_A_aq (mg/L),X (mg/L),Removal (%)";

/// One table row per two days at the default 0.5 h step
constexpr std::size_t kTableStride = 48;

namespace detail {

/// @throws IOError if the file cannot be opened or written
inline void WriteToFile(const std::string &path, const std::string &content) {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw IOError("open", path, std::strerror(errno));
    }
    file << content;
    if (file.fail()) {
        throw IOError("write", path, std::strerror(errno));
    }
}

} // namespace detail

/**
 * @brief Trajectory as CSV text
 *
 * Header row plus one row per snapshot, joined with '\n' (no trailing
 * newline). Precision: time_h 2, time_days 3, concentrations 4, removal 2.
 */
[[nodiscard]] inline std::string TrajectoryToCsv(const Trajectory &trajectory) {
    std::string csv = kCsvHeader;
    for (const auto &s : trajectory) {
        csv += '\n';
        csv += Console::FormatFixed(s.time_h, 2) + ',' + Console::FormatFixed(s.time_days, 3) +
               ',' + Console::FormatFixed(s.C_G_aq, 4) + ',' + Console::FormatFixed(s.C_G_s, 4) +
               ',' + Console::FormatFixed(s.C_A_aq, 4) + ',' + Console::FormatFixed(s.X, 4) +
               ',' + Console::FormatFixed(s.removal_percent, 2);
    }
    return csv;
}

/// @throws IOError on write failure
inline void WriteTrajectoryCsv(const Trajectory &trajectory, const std::string &path) {
    detail::WriteToFile(path, TrajectoryToCsv(trajectory));
}

/**
 * @brief Results table: every stride-th snapshot plus the last one
 */
[[nodiscard]] inline std::string RenderResultsTable(const Trajectory &trajectory,
                                                    std::size_t stride = kTableStride) {
    AsciiTable table;
    table.AddColumn("Day", 0, AsciiTable::Align::Right);
    table.AddColumn("C_G_aq (mg/L)", 0, AsciiTable::Align::Right);
    table.AddColumn("C_G_s (mg/kg)", 0, AsciiTable::Align::Right);
    table.AddColumn("AMPA (mg/L)", 0, AsciiTable::Align::Right);
    table.AddColumn("X (mg/L)", 0, AsciiTable::Align::Right);
    table.AddColumn("Removal (%)", 0, AsciiTable::Align::Right);

    for (const auto &s : trajectory.Subsample(stride)) {
        table.AddRow({Console::FormatFixed(s.time_days, 1), Console::FormatFixed(s.C_G_aq, 2),
                      Console::FormatFixed(s.C_G_s, 2), Console::FormatFixed(s.C_A_aq, 3),
                      Console::FormatFixed(s.X, 2), Console::FormatFixed(s.removal_percent, 1)});
    }
    return table.Render();
}

} // namespace bioslurry
