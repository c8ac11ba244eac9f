#pragma once

/**
 * @file Parameters.hpp
 * @brief Reactor parameter set (initial conditions, kinetics, sorption, time)
 *
 * NOT templated - uses double for all values. A ParameterSet is immutable
 * for the duration of a run; the engine takes it by const reference.
 */

#include <bioslurry/core/Error.hpp>

#include <cmath>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace bioslurry {

/// Largest trajectory the engine agrees to allocate
constexpr std::size_t kMaxSamples = 10'000'000;

/// Slack (in steps) absorbed when counting samples up to t_final
constexpr double kStepCountSlack = 1e-9;

/**
 * @brief Parameter set for one bioslurry reactor run
 *
 * Field names follow the model notation: G = glyphosate, A = AMPA,
 * aq = aqueous phase, s = sorbed phase, X = biomass.
 */
struct ParameterSet {
    // =========================================================================
    // Initial Conditions
    // =========================================================================
    double C_G_aq_0 = 100.0; ///< Aqueous glyphosate [mg/L]
    double C_G_s_0 = 0.0;    ///< Sorbed glyphosate [mg/kg]
    double C_A_aq_0 = 0.0;   ///< Aqueous AMPA [mg/L]
    double X_0 = 10.0;       ///< Biomass [mg/L]

    // =========================================================================
    // Biodegradation Kinetics
    // =========================================================================
    double k_max = 0.08;  ///< Maximum degradation rate [1/h]
    double K_s = 20.0;    ///< Half-saturation constant [mg/L]
    double mu_max = 0.05; ///< Maximum growth rate [1/h]
    double k_d = 0.005;   ///< Death rate [1/h]
    double Y_x = 0.3;     ///< Biomass yield [mg/mg] (not used by the rate law)

    // =========================================================================
    // Sorption
    // =========================================================================
    double K_d = 50.0;   ///< Distribution coefficient [L/kg]
    double k_sorp = 0.1; ///< Sorption rate [1/h]
    double theta = 0.1;  ///< Solid/liquid ratio [kg/L]

    // =========================================================================
    // Metabolite (AMPA)
    // =========================================================================
    double Y_A = 0.6;  ///< AMPA yield [mol/mol]
    double k_A = 0.02; ///< AMPA decay rate [1/h]

    // =========================================================================
    // Time
    // =========================================================================
    double t_final = 336.0; ///< Simulated duration [h]
    double dt = 0.5;        ///< Fixed step [h]

    /// Create the reference parameter set (14 days, 0.5 h step)
    [[nodiscard]] static ParameterSet Default() { return ParameterSet{}; }

    /// Initial total contaminant mass (aqueous + theta * sorbed)
    [[nodiscard]] double InitialTotal() const { return C_G_aq_0 + theta * C_G_s_0; }

    /**
     * @brief Number of samples from t=0 up to and including t_final
     *
     * Only meaningful for a valid parameter set.
     */
    [[nodiscard]] std::size_t SampleCount() const {
        return static_cast<std::size_t>(std::floor(t_final / dt + kStepCountSlack)) + 1;
    }

    /**
     * @brief Validate the parameter set
     * @return One message per violated constraint (empty when valid)
     */
    [[nodiscard]] std::vector<std::string> Validate() const {
        std::vector<std::string> errors;

        const std::vector<std::pair<const char *, double>> all = {
            {"C_G_aq_0", C_G_aq_0}, {"C_G_s_0", C_G_s_0}, {"C_A_aq_0", C_A_aq_0},
            {"X_0", X_0},           {"k_max", k_max},     {"K_s", K_s},
            {"mu_max", mu_max},     {"k_d", k_d},         {"Y_x", Y_x},
            {"K_d", K_d},           {"k_sorp", k_sorp},   {"theta", theta},
            {"Y_A", Y_A},           {"k_A", k_A},         {"t_final", t_final},
            {"dt", dt}};

        bool all_finite = true;
        for (const auto &[key, value] : all) {
            if (!std::isfinite(value)) {
                errors.push_back(std::string(key) + " must be finite");
                all_finite = false;
            }
        }
        if (!all_finite) {
            return errors;
        }

        // Time stepping
        if (t_final <= 0.0) {
            errors.push_back("t_final must be positive");
        }
        if (dt <= 0.0) {
            errors.push_back("dt must be positive");
        }
        if (dt > 0.0 && t_final > 0.0) {
            if (dt > t_final) {
                errors.push_back("dt must not exceed t_final");
            } else if (t_final / dt + 1.0 > static_cast<double>(kMaxSamples)) {
                errors.push_back("t_final/dt exceeds the sample limit of " +
                                 std::to_string(kMaxSamples));
            }
        }

        // Initial conditions
        if (C_G_aq_0 < 0.0) {
            errors.push_back("C_G_aq_0 must be non-negative");
        }
        if (C_G_s_0 < 0.0) {
            errors.push_back("C_G_s_0 must be non-negative");
        }
        if (C_A_aq_0 < 0.0) {
            errors.push_back("C_A_aq_0 must be non-negative");
        }
        if (X_0 < 0.0) {
            errors.push_back("X_0 must be non-negative");
        }

        // Divisors
        if (K_d <= 0.0) {
            errors.push_back("K_d must be positive");
        }
        if (theta <= 0.0) {
            errors.push_back("theta must be positive");
        }

        // Rate constants and yields (zero disables a pathway)
        const std::vector<std::pair<const char *, double>> rates = {
            {"k_max", k_max}, {"K_s", K_s},       {"mu_max", mu_max}, {"k_d", k_d},
            {"Y_x", Y_x},     {"k_sorp", k_sorp}, {"Y_A", Y_A},       {"k_A", k_A}};
        for (const auto &[key, value] : rates) {
            if (value < 0.0) {
                errors.push_back(std::string(key) + " must be non-negative");
            }
        }

        return errors;
    }

    [[nodiscard]] bool IsValid() const { return Validate().empty(); }

    /// @throws ParameterError listing every violated constraint
    void ThrowIfInvalid() const {
        auto errors = Validate();
        if (!errors.empty()) {
            BIOSLURRY_THROW(ParameterError(std::move(errors)));
        }
    }
};

} // namespace bioslurry
