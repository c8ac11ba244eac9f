#pragma once

/**
 * @file Trajectory.hpp
 * @brief State snapshots and the immutable trajectory of one run
 */

#include <bioslurry/core/Error.hpp>

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace bioslurry {

// =============================================================================
// StateSnapshot
// =============================================================================

/**
 * @brief Reactor state recorded at one step
 *
 * Concentrations are the values at the start of the step (before the Euler
 * update); rates are evaluated at that same state.
 */
struct StateSnapshot {
    double time_h = 0.0;    ///< Elapsed time [h]
    double time_days = 0.0; ///< Elapsed time [d]

    double C_G_aq = 0.0;  ///< Aqueous glyphosate [mg/L]
    double C_G_s = 0.0;   ///< Sorbed glyphosate [mg/kg]
    double C_A_aq = 0.0;  ///< Aqueous AMPA [mg/L]
    double X = 0.0;       ///< Biomass [mg/L]
    double C_total = 0.0; ///< C_G_aq + theta * C_G_s [mg/L]

    double removal_percent = 0.0; ///< Removal of total glyphosate, clamped to [0, 100]

    double monod_factor = 0.0;  ///< Saturation factor [-]
    double r_degradation = 0.0; ///< Degradation rate [mg/L/h]
    double r_sorption = 0.0;    ///< Net sorption rate, positive = aq -> solid [mg/L/h]
};

/// Chart feed decimation: every 4th sample
constexpr std::size_t kChartStride = 4;

/**
 * @brief Snapshot fields that can be extracted as a chart series
 */
enum class TrajectoryField {
    GlyphosateAq,
    GlyphosateSorbed,
    AmpaAq,
    Biomass,
    TotalContaminant,
    RemovalPercent,
    MonodFactor,
    DegradationRate,
    SorptionRate
};

[[nodiscard]] inline double FieldValue(const StateSnapshot &s, TrajectoryField field) {
    switch (field) {
    case TrajectoryField::GlyphosateAq:
        return s.C_G_aq;
    case TrajectoryField::GlyphosateSorbed:
        return s.C_G_s;
    case TrajectoryField::AmpaAq:
        return s.C_A_aq;
    case TrajectoryField::Biomass:
        return s.X;
    case TrajectoryField::TotalContaminant:
        return s.C_total;
    case TrajectoryField::RemovalPercent:
        return s.removal_percent;
    case TrajectoryField::MonodFactor:
        return s.monod_factor;
    case TrajectoryField::DegradationRate:
        return s.r_degradation;
    case TrajectoryField::SorptionRate:
        return s.r_sorption;
    }
    return 0.0;
}

[[nodiscard]] inline std::string to_string(TrajectoryField field) {
    switch (field) {
    case TrajectoryField::GlyphosateAq:
        return "C_G_aq";
    case TrajectoryField::GlyphosateSorbed:
        return "C_G_s";
    case TrajectoryField::AmpaAq:
        return "C_A_aq";
    case TrajectoryField::Biomass:
        return "X";
    case TrajectoryField::TotalContaminant:
        return "C_total";
    case TrajectoryField::RemovalPercent:
        return "removal_percent";
    case TrajectoryField::MonodFactor:
        return "monod_factor";
    case TrajectoryField::DegradationRate:
        return "r_degradation";
    case TrajectoryField::SorptionRate:
        return "r_sorption";
    }
    return "unknown";
}

// =============================================================================
// Trajectory
// =============================================================================

/**
 * @brief Ordered, immutable sequence of snapshots from one run
 *
 * Only const access is offered. A new run produces a new Trajectory;
 * nothing ever rewrites an existing one.
 */
class Trajectory {
  public:
    using const_iterator = std::vector<StateSnapshot>::const_iterator;

    Trajectory() = default;
    explicit Trajectory(std::vector<StateSnapshot> samples) : samples_(std::move(samples)) {}

    [[nodiscard]] std::size_t Size() const { return samples_.size(); }
    [[nodiscard]] bool Empty() const { return samples_.empty(); }

    /// Checked access
    /// @throws TrajectoryError if index is out of range
    [[nodiscard]] const StateSnapshot &At(std::size_t index) const {
        if (index >= samples_.size()) {
            BIOSLURRY_THROW(TrajectoryError(index, samples_.size()));
        }
        return samples_[index];
    }

    [[nodiscard]] const StateSnapshot &operator[](std::size_t index) const {
        return samples_[index];
    }

    /// @throws TrajectoryError if empty
    [[nodiscard]] const StateSnapshot &Front() const {
        if (samples_.empty()) {
            BIOSLURRY_THROW(TrajectoryError::Empty("Front()"));
        }
        return samples_.front();
    }

    /// @throws TrajectoryError if empty
    [[nodiscard]] const StateSnapshot &Back() const {
        if (samples_.empty()) {
            BIOSLURRY_THROW(TrajectoryError::Empty("Back()"));
        }
        return samples_.back();
    }

    [[nodiscard]] const_iterator begin() const { return samples_.begin(); }
    [[nodiscard]] const_iterator end() const { return samples_.end(); }

    [[nodiscard]] const std::vector<StateSnapshot> &Samples() const { return samples_; }

    /**
     * @brief Uniform subsample: every stride-th snapshot plus the last one
     *
     * stride == 0 is treated as 1.
     */
    [[nodiscard]] std::vector<StateSnapshot> Subsample(std::size_t stride) const {
        if (stride == 0) {
            stride = 1;
        }
        std::vector<StateSnapshot> out;
        out.reserve(samples_.size() / stride + 2);
        for (std::size_t i = 0; i < samples_.size(); ++i) {
            if (i % stride == 0 || i + 1 == samples_.size()) {
                out.push_back(samples_[i]);
            }
        }
        return out;
    }

    /**
     * @brief (time_days, value) pairs for one field, every stride-th sample
     *
     * Unlike Subsample(), the last sample is only included if it falls on the
     * stride, matching the chart feed.
     */
    [[nodiscard]] std::vector<std::pair<double, double>> Series(TrajectoryField field,
                                                                std::size_t stride = 1) const {
        if (stride == 0) {
            stride = 1;
        }
        std::vector<std::pair<double, double>> out;
        out.reserve(samples_.size() / stride + 1);
        for (std::size_t i = 0; i < samples_.size(); i += stride) {
            out.emplace_back(samples_[i].time_days, FieldValue(samples_[i], field));
        }
        return out;
    }

  private:
    std::vector<StateSnapshot> samples_;
};

} // namespace bioslurry
