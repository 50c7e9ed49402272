// Ticket: 0010_shape_variants
// Ticket: 0011_spatial_registry

#ifndef RBD_SIM_PHYSICS_COLLISION_SHAPE_HANDLE_HPP
#define RBD_SIM_PHYSICS_COLLISION_SHAPE_HANDLE_HPP

#include <cstddef>
#include <cstdint>
#include <functional>

#include "rbd-sim/src/Container/SlotMap.hpp"

namespace rbd_sim
{

/**
 * @brief Closed set of collision geometry variants
 *
 * Values index the narrow-phase dispatch table and the registry buckets.
 */
enum class ShapeKind : uint8_t
{
  Sphere = 0,
  Plane = 1
};

inline constexpr size_t kShapeKindCount = 2;

/**
 * @brief Whether a shape can be moved by collision response
 */
enum class Mobility : uint8_t
{
  Static = 0,
  Dynamic = 1
};

/**
 * @brief Opaque reference to a registered shape.
 *
 * Names the registry bucket holding the shape and the slot within it.
 * Handles go stale when the shape is deregistered or changes bucket;
 * ShapeRegistry::find returns nullptr for stale handles.
 */
struct ShapeHandle
{
  Mobility mobility{Mobility::Static};
  ShapeKind kind{ShapeKind::Sphere};
  SlotHandle slot;

  bool operator==(const ShapeHandle&) const = default;
};

struct ShapeHandleHash
{
  size_t operator()(const ShapeHandle& handle) const noexcept
  {
    const size_t bucket = (static_cast<size_t>(handle.mobility) << 8U) |
                          static_cast<size_t>(handle.kind);
    return SlotHandleHash{}(handle.slot) ^ (std::hash<size_t>{}(bucket) << 1U);
  }
};

}  // namespace rbd_sim

#endif  // RBD_SIM_PHYSICS_COLLISION_SHAPE_HANDLE_HPP
