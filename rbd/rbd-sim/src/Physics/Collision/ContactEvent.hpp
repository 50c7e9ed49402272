// Ticket: 0015_contact_events

#ifndef RBD_SIM_PHYSICS_COLLISION_CONTACT_EVENT_HPP
#define RBD_SIM_PHYSICS_COLLISION_CONTACT_EVENT_HPP

#include <cstdint>

#include "rbd-sim/src/Physics/Collision/ShapeHandle.hpp"

namespace rbd_sim
{

/**
 * @brief Touching-set transition recorded during collision response
 *
 * Queued in preUpdate and dispatched in postUpdate. Handles may be stale by
 * dispatch time if a listener deregisters shapes.
 */
struct ContactEvent
{
  enum class Type : uint8_t
  {
    Begin,
    End
  };

  Type type{Type::Begin};
  ShapeHandle a;
  ShapeHandle b;
};

}  // namespace rbd_sim

#endif  // RBD_SIM_PHYSICS_COLLISION_CONTACT_EVENT_HPP
