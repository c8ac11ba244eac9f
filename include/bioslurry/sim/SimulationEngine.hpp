#pragma once

/**
 * @file SimulationEngine.hpp
 * @brief Fixed-step integration of the bioslurry reactor model
 */

#include <bioslurry/io/LogService.hpp>
#include <bioslurry/model/Kinetics.hpp>
#include <bioslurry/model/Parameters.hpp>
#include <bioslurry/sim/Integrator.hpp>
#include <bioslurry/sim/Trajectory.hpp>

#include <memory>

namespace bioslurry {

/**
 * @brief Runs the reactor model from t = 0 to t_final
 *
 * Every call to Run() validates the parameter set, allocates a fresh
 * Trajectory and returns it; the engine keeps no state between runs apart
 * from the integrator object itself.
 *
 * Per step n (t = n * dt):
 * 1. evaluate rates at the current state
 * 2. record the snapshot (pre-update values)
 * 3. advance with the integrator and clamp every state to >= 0
 *
 * Example:
 * @code
 * SimulationEngine engine;
 * Trajectory traj = engine.Run(ParameterSet::Default());
 * @endcode
 */
class SimulationEngine {
  public:
    /// Forward Euler engine logging to the global log service
    SimulationEngine();

    explicit SimulationEngine(LogService &log);

    /**
     * @brief Simulate one run
     *
     * @throws ParameterError if the parameter set is invalid (nothing is simulated)
     */
    [[nodiscard]] Trajectory Run(const ParameterSet &params);

    /// Same as Run(), handed out as an immutable shared trajectory for concurrent readers
    [[nodiscard]] std::shared_ptr<const Trajectory> RunShared(const ParameterSet &params);

    [[nodiscard]] const Integrator<double> &GetIntegrator() const { return *integrator_; }

  private:
    std::unique_ptr<Integrator<double>> integrator_;
    LogService *log_;
};

/**
 * @brief Removal of total contaminant relative to the initial total, in [0, 100]
 *
 * Zero when the initial total is zero (nothing to remove).
 */
[[nodiscard]] double RemovalPercent(double total, double total_0);

/// Convenience: run a default engine once
[[nodiscard]] Trajectory Simulate(const ParameterSet &params);

} // namespace bioslurry
