#pragma once

/**
 * @file Integrator.hpp
 * @brief Abstract interface for fixed-step numerical integrators
 */

#include <bioslurry/core/CoreTypes.hpp>

#include <functional>
#include <string>

namespace bioslurry {

/**
 * @brief Abstract interface for fixed-step integrators
 *
 * Integrators advance state using derivative information supplied by the
 * engine. Templated on Scalar like the rate law.
 *
 * @tparam Scalar Numeric type
 */
template <typename Scalar> class Integrator {
  public:
    virtual ~Integrator() = default;

    /**
     * @brief Derivative function signature
     *
     * Maps (t, X) → dX/dt
     */
    using DerivativeFunc =
        std::function<JanusVector<Scalar>(Scalar t, const JanusVector<Scalar> &x)>;

    /**
     * @brief Advance state by one step
     *
     * @param f Derivative function
     * @param x Current state vector
     * @param t Current time
     * @param dt Time step
     * @return New state at t + dt
     */
    virtual JanusVector<Scalar> Step(const DerivativeFunc &f, const JanusVector<Scalar> &x,
                                     Scalar t, Scalar dt) = 0;

    /// Integrator name for logging
    [[nodiscard]] virtual std::string Name() const = 0;

    /// Integrator order (for error analysis)
    [[nodiscard]] virtual int Order() const = 0;
};

} // namespace bioslurry
