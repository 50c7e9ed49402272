// Ticket: 0014_surface_friction

#ifndef RBD_SIM_PHYSICS_COLLISION_FRICTION_MODEL_HPP
#define RBD_SIM_PHYSICS_COLLISION_FRICTION_MODEL_HPP

#include "rbd-sim/src/DataTypes/Coordinate.hpp"
#include "rbd-sim/src/DataTypes/Vector3D.hpp"

namespace rbd_sim
{

class RigidBody;

/**
 * @brief Force-based surface friction for bodies in contact.
 *
 * The normal force is estimated from gravity alone:
 *
 *   N = m g cos θ
 *
 * where θ is the angle between the contact-to-body line and the down axis,
 * so a body resting on top of a contact gets N = -m g (straight up).
 *
 * The friction-opposing direction is that of the effective force
 *
 *   F_eff = p / Δt + m g
 *
 * and the coefficient is chosen by comparing |F_eff|² with the squared
 * sleep threshold: below it the body is considered at rest and the static
 * coefficient applies, otherwise the kinetic one. The applied forces are
 * -μ |N| F̂_eff (friction) and N itself.
 *
 * @ticket 0014_surface_friction
 */
namespace FrictionModel
{

inline const Vector3D kDownAxis{0.0, -1.0, 0.0};

struct Result
{
  Vector3D normalForce;
  Vector3D frictionForce;
  double coefficient{0.0};
  bool usedStaticCoefficient{false};
};

/**
 * @brief Compute the friction forces without applying them
 *
 * @param body Body in contact
 * @param contactPoint World-space contact point [m]
 * @param staticCoefficient Combined static coefficient for this body's side
 * @param kineticCoefficient Combined kinetic coefficient for this body's side
 * @param gravity Gravity acceleration; ignored when the body does not
 *        simulate gravity [m/s²]
 * @param fixedTimeStep Fixed simulation step [s]
 */
[[nodiscard]] Result compute(const RigidBody& body,
                             const Coordinate& contactPoint,
                             double staticCoefficient,
                             double kineticCoefficient,
                             const Coordinate& gravity,
                             double fixedTimeStep);

/**
 * @brief Compute the friction forces and add them to the body's force accumulator
 */
Result apply(RigidBody& body,
             const Coordinate& contactPoint,
             double staticCoefficient,
             double kineticCoefficient,
             const Coordinate& gravity,
             double fixedTimeStep);

}  // namespace FrictionModel

}  // namespace rbd_sim

#endif  // RBD_SIM_PHYSICS_COLLISION_FRICTION_MODEL_HPP
