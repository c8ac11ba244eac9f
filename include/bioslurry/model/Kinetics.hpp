#pragma once

/**
 * @file Kinetics.hpp
 * @brief Rate laws for glyphosate biodegradation, sorption and AMPA formation
 *
 * Monod-limited degradation and growth, linear first-order sorption towards
 * a Kd equilibrium, first-order death and AMPA decay.
 *
 * Templated on Scalar so the same rate law feeds any Janus-compatible
 * integrator.
 */

#include <bioslurry/core/CoreTypes.hpp>
#include <bioslurry/model/Parameters.hpp>

namespace bioslurry {

/// Guards the Monod denominator when aqueous concentration and K_s are both zero
constexpr double kMonodEpsilon = 1e-10;

/**
 * @brief Instantaneous process rates at one state
 *
 * @tparam Scalar Numeric type
 */
template <typename Scalar> struct ReactionRates {
    Scalar monod{};          ///< Saturation factor S/(K_s + S + eps) [-]
    Scalar degradation{};    ///< k_max * monod * X [mg/L/h]
    Scalar sorption{};       ///< k_sorp * (C_aq - C_s/K_d), positive = aq -> solid [mg/L/h]
    Scalar growth{};         ///< mu_max * monod * X [mg/L/h]
    Scalar death{};          ///< k_d * X [mg/L/h]
    Scalar ampa_formation{}; ///< Y_A * degradation [mg/L/h]
    Scalar ampa_decay{};     ///< k_A * C_A [mg/L/h]
};

/**
 * @brief Evaluate every process rate at the given state
 *
 * @param p Parameter set (constants only; initial conditions are ignored)
 * @param x State vector (kGlyphosateAq .. kBiomass)
 */
template <typename Scalar>
[[nodiscard]] ReactionRates<Scalar> ComputeRates(const ParameterSet &p,
                                                 const JanusVector<Scalar> &x) {
    const Scalar c_aq = x[kGlyphosateAq];
    const Scalar c_s = x[kGlyphosateSorbed];
    const Scalar c_a = x[kAmpaAq];
    const Scalar biomass = x[kBiomass];

    ReactionRates<Scalar> r;
    r.monod = c_aq / (p.K_s + c_aq + kMonodEpsilon);
    r.degradation = p.k_max * r.monod * biomass;
    r.sorption = p.k_sorp * (c_aq - c_s / p.K_d);
    r.growth = p.mu_max * r.monod * biomass;
    r.death = p.k_d * biomass;
    r.ampa_formation = p.Y_A * r.degradation;
    r.ampa_decay = p.k_A * c_a;
    return r;
}

/**
 * @brief Assemble state derivatives from process rates
 *
 * Sorbed concentration is per unit solid, so the transfer is divided by the
 * solid/liquid ratio.
 */
template <typename Scalar>
[[nodiscard]] JanusVector<Scalar> Derivatives(const ParameterSet &p,
                                              const ReactionRates<Scalar> &r) {
    JanusVector<Scalar> dx(kStateSize);
    dx[kGlyphosateAq] = -r.degradation - r.sorption;
    dx[kGlyphosateSorbed] = r.sorption / p.theta;
    dx[kAmpaAq] = r.ampa_formation - r.ampa_decay;
    dx[kBiomass] = r.growth - r.death;
    return dx;
}

/**
 * @brief Reactor right-hand side f(t, x) -> dx/dt
 *
 * The model is autonomous; t is accepted for the integrator signature.
 */
template <typename Scalar>
[[nodiscard]] JanusVector<Scalar> ReactorDynamics(const ParameterSet &p, Scalar /*t*/,
                                                  const JanusVector<Scalar> &x) {
    return Derivatives<Scalar>(p, ComputeRates<Scalar>(p, x));
}

/// Total contaminant mass in liquid-equivalent units: C_aq + theta * C_s
template <typename Scalar>
[[nodiscard]] Scalar TotalContaminant(const ParameterSet &p, const JanusVector<Scalar> &x) {
    return x[kGlyphosateAq] + p.theta * x[kGlyphosateSorbed];
}

} // namespace bioslurry
