// Ticket: 0016_rk4_integration

#ifndef RBD_SIM_PHYSICS_INTEGRATION_RK4_INTEGRATOR_HPP
#define RBD_SIM_PHYSICS_INTEGRATION_RK4_INTEGRATOR_HPP

#include <Eigen/Geometry>

#include "rbd-sim/src/DataTypes/Vector3D.hpp"
#include "rbd-sim/src/Physics/Integration/Integrator.hpp"

namespace rbd_sim
{

/**
 * @brief Fourth-order Runge-Kutta integrator for linear and angular motion
 *
 * The state is (position, rotation, momentum, angular momentum). Each of the
 * four stages evaluates the derivative
 *
 *   ẋ = p / m
 *   q̇ = ½ [0, ω] ⊗ q,       ω = L ⊘ I
 *   ṗ = F + a m - drag p
 *   L̇ = T + α m - angularDrag L
 *
 * at the current momenta perturbed by the previous stage's ṗ and L̇ over the
 * stage's sub-step (0, Δt/2, Δt/2, Δt). The accumulated force, acceleration,
 * torque and angular acceleration are held constant over the step.
 *
 * The weighted derivative (k1 + 2k2 + 2k3 + k4) / 6 is then applied over Δt.
 * The rotation update adds the quaternion derivative component-wise and
 * renormalizes.
 *
 * For constant force and zero drag the position update reproduces
 * x₀ + v₀Δt + ½aΔt² exactly.
 *
 * @ticket 0016_rk4_integration
 */
class RK4Integrator final : public Integrator
{
public:
  /**
   * @brief Time derivative of the integrated state
   */
  struct Derivative
  {
    Vector3D velocity;
    Eigen::Quaterniond spin{0.0, 0.0, 0.0, 0.0};
    Vector3D force;
    Vector3D torque;
  };

  RK4Integrator() = default;
  ~RK4Integrator() override = default;

  RK4Integrator(const RK4Integrator&) = default;
  RK4Integrator& operator=(const RK4Integrator&) = default;
  RK4Integrator(RK4Integrator&&) noexcept = default;
  RK4Integrator& operator=(RK4Integrator&&) noexcept = default;

  void step(RigidBody& body, double dt) const override;

  /**
   * @brief Stage-1 derivative: evaluated at the body's current state
   */
  [[nodiscard]] static Derivative evaluate(const RigidBody& body);

  /**
   * @brief Stage 2-4 derivative: momenta perturbed by the previous stage
   *
   * @param body Body providing the unperturbed state and accumulators
   * @param previous Derivative of the previous stage
   * @param dt Sub-step over which the previous derivative is applied [s]
   */
  [[nodiscard]] static Derivative evaluate(const RigidBody& body,
                                           const Derivative& previous,
                                           double dt);

  /**
   * @brief ṗ = F + a m - drag p
   */
  [[nodiscard]] static Vector3D computeForce(const RigidBody& body,
                                             const Vector3D& momentum);

  /**
   * @brief L̇ = T + α m - angularDrag L
   */
  [[nodiscard]] static Vector3D computeTorque(const RigidBody& body,
                                              const Vector3D& angularMomentum);
};

}  // namespace rbd_sim

#endif  // RBD_SIM_PHYSICS_INTEGRATION_RK4_INTEGRATOR_HPP
