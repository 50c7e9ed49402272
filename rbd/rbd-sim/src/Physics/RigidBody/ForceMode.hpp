// Ticket: 0008_rigid_body_force_accumulation

#ifndef RBD_SIM_PHYSICS_RIGID_BODY_FORCE_MODE_HPP
#define RBD_SIM_PHYSICS_RIGID_BODY_FORCE_MODE_HPP

#include <cstdint>

namespace rbd_sim
{

/**
 * @brief How a force applied at a point enters the accumulators
 *
 * - Force: mass-scaled, continuous
 * - Acceleration: mass-independent, continuous
 * - Impulse: mass-scaled, instantaneous (divided by the fixed time step)
 * - VelocityChange: mass-independent, instantaneous (divided by the fixed
 *   time step)
 */
enum class ForceMode : uint8_t
{
  Force,
  Acceleration,
  Impulse,
  VelocityChange
};

}  // namespace rbd_sim

#endif  // RBD_SIM_PHYSICS_RIGID_BODY_FORCE_MODE_HPP
