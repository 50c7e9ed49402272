// Ticket: 0016_rk4_integration

#ifndef RBD_SIM_PHYSICS_INTEGRATION_INTEGRATOR_HPP
#define RBD_SIM_PHYSICS_INTEGRATION_INTEGRATOR_HPP

namespace rbd_sim
{

class RigidBody;

/**
 * @brief Abstract interface for numerical integration of rigid body motion
 *
 * Decouples the integration scheme from the simulation loop:
 * - Swappable integrators (RK4, semi-implicit Euler)
 * - Isolated testing of integration math
 * - PhysicsSystem as pure orchestrator
 *
 * An integrator reads the body's accumulated force, acceleration, torque and
 * angular acceleration and advances position, rotation, momentum and angular
 * momentum. It never clears the accumulators.
 *
 * Thread safety: Implementations are stateless
 *
 * @ticket 0016_rk4_integration
 */
class Integrator
{
public:
  virtual ~Integrator() = default;

  /**
   * @brief Integrate the body forward by one time step
   * @param body Body to advance (modified in place)
   * @param dt Time step [s]
   */
  virtual void step(RigidBody& body, double dt) const = 0;

protected:
  Integrator() = default;
  Integrator(const Integrator&) = default;
  Integrator& operator=(const Integrator&) = default;
  Integrator(Integrator&&) noexcept = default;
  Integrator& operator=(Integrator&&) noexcept = default;
};

}  // namespace rbd_sim

#endif  // RBD_SIM_PHYSICS_INTEGRATION_INTEGRATOR_HPP
