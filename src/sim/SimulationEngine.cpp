/**
 * @file SimulationEngine.cpp
 * @brief Reactor time stepping
 */

#include <bioslurry/sim/EulerIntegrator.hpp>
#include <bioslurry/sim/SimulationEngine.hpp>

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>
#include <vector>

namespace bioslurry {

namespace {

StateSnapshot MakeSnapshot(double t, const JanusVector<double> &x, double total, double removal,
                           const ReactionRates<double> &rates) {
    StateSnapshot s;
    s.time_h = t;
    s.time_days = HoursToDays(t);
    s.C_G_aq = std::max(0.0, x[kGlyphosateAq]);
    s.C_G_s = std::max(0.0, x[kGlyphosateSorbed]);
    s.C_A_aq = std::max(0.0, x[kAmpaAq]);
    s.X = std::max(0.0, x[kBiomass]);
    s.C_total = std::max(0.0, total);
    s.removal_percent = removal;
    s.monod_factor = rates.monod;
    s.r_degradation = rates.degradation;
    s.r_sorption = rates.sorption;
    return s;
}

void ClampNonNegative(JanusVector<double> &x) {
    for (int i = 0; i < kStateSize; ++i) {
        x[i] = std::max(0.0, x[i]);
    }
}

bool AllFinite(const StateSnapshot &s) {
    return std::isfinite(s.C_G_aq) && std::isfinite(s.C_G_s) && std::isfinite(s.C_A_aq) &&
           std::isfinite(s.X);
}

} // namespace

// =============================================================================
// SimulationEngine
// =============================================================================

SimulationEngine::SimulationEngine() : SimulationEngine(GetLogService()) {}

SimulationEngine::SimulationEngine(LogService &log)
    : integrator_(std::make_unique<EulerIntegrator<double>>()), log_(&log) {}

Trajectory SimulationEngine::Run(const ParameterSet &params) {
    LogContextManager::ScopedContext ctx("engine");

    params.ThrowIfInvalid();

    const std::size_t n_samples = params.SampleCount();
    const double total_0 = params.InitialTotal();

    log_->Debug(0.0, integrator_->Name() + " run: " + std::to_string(n_samples) +
                         " samples, dt=" + Console::FormatFixed(params.dt, 4) + " h, t_final=" +
                         Console::FormatFixed(params.t_final, 2) + " h");

    JanusVector<double> x(kStateSize);
    x[kGlyphosateAq] = params.C_G_aq_0;
    x[kGlyphosateSorbed] = params.C_G_s_0;
    x[kAmpaAq] = params.C_A_aq_0;
    x[kBiomass] = params.X_0;

    const Integrator<double>::DerivativeFunc dynamics =
        [&params](double t, const JanusVector<double> &state) {
            return ReactorDynamics<double>(params, t, state);
        };

    std::vector<StateSnapshot> samples;
    samples.reserve(n_samples);

    for (std::size_t n = 0; n < n_samples; ++n) {
        const double t = static_cast<double>(n) * params.dt;

        const auto rates = ComputeRates<double>(params, x);
        const double total = TotalContaminant<double>(params, x);
        samples.push_back(MakeSnapshot(t, x, total, RemovalPercent(total, total_0), rates));

        if (n + 1 < n_samples) {
            x = integrator_->Step(dynamics, x, t, params.dt);
            ClampNonNegative(x);
        }
    }

    const StateSnapshot &last = samples.back();
    if (!AllFinite(last)) {
        log_->Warning(last.time_h, "state overflowed to a non-finite value; check rate constants");
    }
    log_->Event(last.time_h, "run complete: " + std::to_string(samples.size()) +
                                 " samples, final removal " +
                                 Console::FormatFixed(last.removal_percent, 1) + " %");

    return Trajectory(std::move(samples));
}

std::shared_ptr<const Trajectory> SimulationEngine::RunShared(const ParameterSet &params) {
    return std::make_shared<const Trajectory>(Run(params));
}

// =============================================================================
// Free Functions
// =============================================================================

double RemovalPercent(double total, double total_0) {
    if (total_0 <= 0.0) {
        return 0.0;
    }
    const double removal = 100.0 * (1.0 - total / total_0);
    return std::min(100.0, std::max(0.0, removal));
}

Trajectory Simulate(const ParameterSet &params) {
    SimulationEngine engine;
    return engine.Run(params);
}

} // namespace bioslurry
