// Ticket: 0017_semi_implicit_euler

#ifndef RBD_SIM_PHYSICS_INTEGRATION_SEMI_IMPLICIT_EULER_INTEGRATOR_HPP
#define RBD_SIM_PHYSICS_INTEGRATION_SEMI_IMPLICIT_EULER_INTEGRATOR_HPP

#include "rbd-sim/src/Physics/Integration/Integrator.hpp"

namespace rbd_sim
{

/**
 * @brief Semi-implicit (symplectic) Euler integrator
 *
 * Momenta are advanced first, then position and rotation use the updated
 * velocities:
 *
 *   p_new = p + (F + a m - drag p) Δt
 *   x_new = x + (p_new / m) Δt
 *
 * and likewise for the angular state. Uses the same force and torque
 * expressions as RK4Integrator.
 *
 * @ticket 0017_semi_implicit_euler
 */
class SemiImplicitEulerIntegrator final : public Integrator
{
public:
  SemiImplicitEulerIntegrator() = default;
  ~SemiImplicitEulerIntegrator() override = default;

  SemiImplicitEulerIntegrator(const SemiImplicitEulerIntegrator&) = default;
  SemiImplicitEulerIntegrator& operator=(const SemiImplicitEulerIntegrator&) =
    default;
  SemiImplicitEulerIntegrator(SemiImplicitEulerIntegrator&&) noexcept = default;
  SemiImplicitEulerIntegrator& operator=(
    SemiImplicitEulerIntegrator&&) noexcept = default;

  void step(RigidBody& body, double dt) const override;
};

}  // namespace rbd_sim

#endif  // RBD_SIM_PHYSICS_INTEGRATION_SEMI_IMPLICIT_EULER_INTEGRATOR_HPP
