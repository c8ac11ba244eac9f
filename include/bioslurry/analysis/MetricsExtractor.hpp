#pragma once

/**
 * @file MetricsExtractor.hpp
 * @brief Scalar performance indicators derived from a trajectory
 *
 * Removal and residual concentration at day 3/7/14, biomass and AMPA peaks,
 * T90 and final values. A read-only reduction: the trajectory is never
 * modified.
 */

#include <bioslurry/model/Parameters.hpp>
#include <bioslurry/sim/Trajectory.hpp>

#include <array>
#include <cstddef>
#include <optional>
#include <string>

namespace bioslurry {

/// A calendar sample matches when its day value is within this distance of the target
constexpr double kDayMatchTolerance = 0.1;

/// Removal percentage defining T90
constexpr double kT90RemovalPercent = 90.0;

/// Calendar points reported in the summary [d]
constexpr std::array<double, 3> kCalendarDays = {3.0, 7.0, 14.0};

/**
 * @brief How a calendar day is resolved to a snapshot
 */
enum class DayLookupPolicy {
    FirstSample, ///< First sample within tolerance, else the first sample of the run
    Nearest      ///< Sample with the smallest day distance (ties: earliest)
};

[[nodiscard]] std::string to_string(DayLookupPolicy policy);

/**
 * @brief Parse "first" / "nearest" (case-insensitive)
 * @throws ConfigError for unknown names
 */
[[nodiscard]] DayLookupPolicy ParseDayLookupPolicy(const std::string &name);

/**
 * @brief A calendar day resolved to one snapshot
 */
struct CalendarPoint {
    double target_day = 0.0;      ///< Requested day [d]
    std::size_t index = 0;        ///< Resolved snapshot index
    double sample_day = 0.0;      ///< Day of the resolved snapshot [d]
    bool matched = false;         ///< True if within kDayMatchTolerance of the target
    double removal_percent = 0.0; ///< Removal at the resolved snapshot [%]
    double C_G_aq = 0.0;          ///< Residual aqueous glyphosate [mg/L]
};

/**
 * @brief Summary of one run
 *
 * Times are in days. T90 is empty when removal never reaches 90 %.
 */
struct MetricsSummary {
    CalendarPoint day3;
    CalendarPoint day7;
    CalendarPoint day14;

    double X_max = 0.0;   ///< Peak biomass [mg/L]
    double t_X_max = 0.0; ///< Time of peak biomass [d]
    double X_final = 0.0; ///< Biomass at the last sample [mg/L]

    double C_A_peak = 0.0; ///< Peak AMPA [mg/L]
    double t_A_peak = 0.0; ///< Time of peak AMPA [d]

    std::optional<double> T90; ///< First day with removal >= 90 %
    double final_removal = 0.0;

    double initial_total = 0.0; ///< Reference total glyphosate from the parameter set [mg/L]
    double horizon_days = 0.0;  ///< Configured t_final [d]
    DayLookupPolicy day_lookup = DayLookupPolicy::FirstSample;

    [[nodiscard]] bool T90Reached() const { return T90.has_value(); }
};

/**
 * @brief Reduces a trajectory to a MetricsSummary
 *
 * Peak scans run in trajectory order and keep the first maximum.
 */
class MetricsExtractor {
  public:
    MetricsExtractor() = default;
    explicit MetricsExtractor(DayLookupPolicy policy) : policy_(policy) {}

    [[nodiscard]] DayLookupPolicy Policy() const { return policy_; }

    /**
     * @brief Compute the summary
     * @throws TrajectoryError if the trajectory is empty
     */
    [[nodiscard]] MetricsSummary Extract(const Trajectory &trajectory,
                                         const ParameterSet &params) const;

    /**
     * @brief Resolve one calendar day according to the policy
     * @throws TrajectoryError if the trajectory is empty
     */
    [[nodiscard]] CalendarPoint Lookup(const Trajectory &trajectory, double target_day) const;

  private:
    DayLookupPolicy policy_ = DayLookupPolicy::FirstSample;
};

/// Convenience: extract with the given policy
[[nodiscard]] MetricsSummary ExtractMetrics(const Trajectory &trajectory,
                                            const ParameterSet &params,
                                            DayLookupPolicy policy = DayLookupPolicy::FirstSample);

} // namespace bioslurry
