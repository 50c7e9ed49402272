// Ticket: 0011_spatial_registry

#ifndef RBD_SIM_PHYSICS_COLLISION_SHAPE_REGISTRY_HPP
#define RBD_SIM_PHYSICS_COLLISION_SHAPE_REGISTRY_HPP

#include <array>
#include <cstddef>

#include "rbd-sim/src/Container/SlotMap.hpp"
#include "rbd-sim/src/Physics/Collision/ShapeHandle.hpp"

namespace rbd_sim
{

class Shape;

/**
 * @brief Broad phase: registered shapes bucketed by mobility and kind.
 *
 * Each (mobility, kind) bucket is a SlotMap of non-owning shape pointers,
 * so insertion and removal are O(1) and iteration order is fixed between
 * mutations. The registry never inspects the shapes beyond their mobility
 * and kind at insertion; keeping handles current after a mobility change is
 * the caller's job (PhysicsSystem::refreshShape).
 *
 * Iteration order: buckets in ShapeKind order, shapes in bucket order.
 *
 * @ticket 0011_spatial_registry
 */
class ShapeRegistry
{
public:
  using Bucket = SlotMap<Shape*>;

  ShapeRegistry() = default;

  /**
   * @brief Add a shape to the bucket matching its current mobility and kind
   */
  ShapeHandle insert(Shape& shape);

  /**
   * @return false when the handle is stale (nothing removed)
   */
  bool erase(const ShapeHandle& handle);

  /**
   * @return The registered shape, or nullptr for a stale handle
   */
  [[nodiscard]] Shape* find(const ShapeHandle& handle) const;

  [[nodiscard]] bool contains(const ShapeHandle& handle) const;

  [[nodiscard]] const Bucket& bucket(Mobility mobility, ShapeKind kind) const;

  [[nodiscard]] size_t size() const;

  [[nodiscard]] size_t size(Mobility mobility) const;

  void clear();

  /**
   * @brief Visit every shape of one mobility
   *
   * @param visitor Callable as visitor(const ShapeHandle&, Shape&)
   */
  template <typename Visitor>
  void forEach(Mobility mobility, Visitor&& visitor) const
  {
    for (size_t kind = 0; kind < kShapeKindCount; ++kind)
    {
      const Bucket& shapes = buckets_[index(mobility)][kind];
      for (size_t position = 0; position < shapes.size(); ++position)
      {
        const ShapeHandle handle{.mobility = mobility,
                                 .kind = static_cast<ShapeKind>(kind),
                                 .slot = shapes.handleAt(position)};
        visitor(handle, *shapes[position]);
      }
    }
  }

private:
  static constexpr size_t kMobilityCount = 2;

  static size_t index(Mobility mobility)
  {
    return static_cast<size_t>(mobility);
  }

  Bucket& bucketFor(const ShapeHandle& handle);

  std::array<std::array<Bucket, kShapeKindCount>, kMobilityCount> buckets_;
};

}  // namespace rbd_sim

#endif  // RBD_SIM_PHYSICS_COLLISION_SHAPE_REGISTRY_HPP
