// Ticket: 0012_narrow_phase

#ifndef RBD_SIM_PHYSICS_COLLISION_CONTACT_HPP
#define RBD_SIM_PHYSICS_COLLISION_CONTACT_HPP

#include "rbd-sim/src/DataTypes/Coordinate.hpp"
#include "rbd-sim/src/DataTypes/Vector3D.hpp"

namespace rbd_sim
{

/**
 * @brief Result of a positive narrow-phase test between shapes A and B.
 *
 * The normal points from A toward B: resolving the contact moves A along
 * -normal and B along +normal. Produced and consumed within one collision
 * pass; only the touching-set membership it causes outlives the pass.
 *
 * @ticket 0012_narrow_phase
 */
struct Contact
{
  Vector3D normal;              // Unit vector from A toward B (world space)
  double penetrationDepth{0.0};  // [m], >= 0 for overlapping spheres
  Coordinate contactPoint;      // World space [m]
};

}  // namespace rbd_sim

#endif  // RBD_SIM_PHYSICS_COLLISION_CONTACT_HPP
