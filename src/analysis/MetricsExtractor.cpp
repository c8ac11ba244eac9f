/**
 * @file MetricsExtractor.cpp
 * @brief Trajectory reduction to summary metrics
 */

#include <bioslurry/analysis/MetricsExtractor.hpp>
#include <bioslurry/core/CoreTypes.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>

namespace bioslurry {

namespace {

std::size_t FirstWithinTolerance(const Trajectory &trajectory, double target_day) {
    for (std::size_t i = 0; i < trajectory.Size(); ++i) {
        if (std::abs(trajectory[i].time_days - target_day) < kDayMatchTolerance) {
            return i;
        }
    }
    // No sample near the target: fall back to the start of the run, for every
    // target day (day 14 does not fall back to the end)
    return 0;
}

std::size_t Nearest(const Trajectory &trajectory, double target_day) {
    std::size_t best = 0;
    double best_distance = std::abs(trajectory[0].time_days - target_day);
    for (std::size_t i = 1; i < trajectory.Size(); ++i) {
        const double distance = std::abs(trajectory[i].time_days - target_day);
        if (distance < best_distance) {
            best = i;
            best_distance = distance;
        }
    }
    return best;
}

/// Index of the first maximum of a field
template <typename Getter> std::size_t ArgMax(const Trajectory &trajectory, Getter get) {
    std::size_t best = 0;
    for (std::size_t i = 1; i < trajectory.Size(); ++i) {
        if (get(trajectory[i]) > get(trajectory[best])) {
            best = i;
        }
    }
    return best;
}

} // namespace

// =============================================================================
// DayLookupPolicy
// =============================================================================

std::string to_string(DayLookupPolicy policy) {
    switch (policy) {
    case DayLookupPolicy::FirstSample:
        return "first";
    case DayLookupPolicy::Nearest:
        return "nearest";
    }
    return "unknown";
}

DayLookupPolicy ParseDayLookupPolicy(const std::string &name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "first" || lower == "first_sample")
        return DayLookupPolicy::FirstSample;
    if (lower == "nearest")
        return DayLookupPolicy::Nearest;
    BIOSLURRY_THROW(ConfigError("Unknown day lookup policy: " + name));
}

// =============================================================================
// MetricsExtractor
// =============================================================================

CalendarPoint MetricsExtractor::Lookup(const Trajectory &trajectory, double target_day) const {
    if (trajectory.Empty()) {
        BIOSLURRY_THROW(TrajectoryError::Empty("Metrics lookup"));
    }

    const std::size_t index = (policy_ == DayLookupPolicy::Nearest)
                                  ? Nearest(trajectory, target_day)
                                  : FirstWithinTolerance(trajectory, target_day);
    const StateSnapshot &s = trajectory[index];

    CalendarPoint point;
    point.target_day = target_day;
    point.index = index;
    point.sample_day = s.time_days;
    point.matched = std::abs(s.time_days - target_day) < kDayMatchTolerance;
    point.removal_percent = s.removal_percent;
    point.C_G_aq = s.C_G_aq;
    return point;
}

MetricsSummary MetricsExtractor::Extract(const Trajectory &trajectory,
                                         const ParameterSet &params) const {
    if (trajectory.Empty()) {
        BIOSLURRY_THROW(TrajectoryError::Empty("Metrics extraction"));
    }

    MetricsSummary m;
    m.day_lookup = policy_;
    m.initial_total = params.InitialTotal();
    m.horizon_days = HoursToDays(params.t_final);

    m.day3 = Lookup(trajectory, kCalendarDays[0]);
    m.day7 = Lookup(trajectory, kCalendarDays[1]);
    m.day14 = Lookup(trajectory, kCalendarDays[2]);

    const auto &x_peak = trajectory[ArgMax(trajectory, [](const StateSnapshot &s) { return s.X; })];
    m.X_max = x_peak.X;
    m.t_X_max = x_peak.time_days;

    const auto &a_peak =
        trajectory[ArgMax(trajectory, [](const StateSnapshot &s) { return s.C_A_aq; })];
    m.C_A_peak = a_peak.C_A_aq;
    m.t_A_peak = a_peak.time_days;

    const auto t90 = std::find_if(trajectory.begin(), trajectory.end(), [](const StateSnapshot &s) {
        return s.removal_percent >= kT90RemovalPercent;
    });
    if (t90 != trajectory.end()) {
        m.T90 = t90->time_days;
    }

    const StateSnapshot &last = trajectory.Back();
    m.X_final = last.X;
    m.final_removal = last.removal_percent;

    return m;
}

MetricsSummary ExtractMetrics(const Trajectory &trajectory, const ParameterSet &params,
                              DayLookupPolicy policy) {
    return MetricsExtractor(policy).Extract(trajectory, params);
}

} // namespace bioslurry
