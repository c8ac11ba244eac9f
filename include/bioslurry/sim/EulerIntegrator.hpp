#pragma once

/**
 * @file EulerIntegrator.hpp
 * @brief Forward Euler integrator (1st order)
 */

#include <bioslurry/sim/Integrator.hpp>
#include <janus/math/IntegratorStep.hpp>

namespace bioslurry {

/**
 * @brief Forward Euler integrator (1st order)
 *
 * x_{n+1} = x_n + dt · f(t_n, x_n). One derivative evaluation per step.
 * Wraps janus::euler_step().
 *
 * @tparam Scalar Numeric type
 */
template <typename Scalar> class EulerIntegrator : public Integrator<Scalar> {
  public:
    using typename Integrator<Scalar>::DerivativeFunc;

    JanusVector<Scalar> Step(const DerivativeFunc &f, const JanusVector<Scalar> &x, Scalar t,
                             Scalar dt) override {
        return janus::euler_step(f, x, t, dt);
    }

    [[nodiscard]] std::string Name() const override { return "Euler"; }
    [[nodiscard]] int Order() const override { return 1; }
};

} // namespace bioslurry
