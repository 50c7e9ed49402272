// Ticket: 0011_spatial_registry

#include "rbd-sim/src/Physics/Collision/ShapeRegistry.hpp"

#include "rbd-sim/src/Physics/Collision/Shape.hpp"

namespace rbd_sim
{

ShapeHandle ShapeRegistry::insert(Shape& shape)
{
  const Mobility mobility = shape.getMobility();
  const ShapeKind kind = shape.getKind();
  Bucket& shapes = buckets_[index(mobility)][static_cast<size_t>(kind)];
  return ShapeHandle{
    .mobility = mobility, .kind = kind, .slot = shapes.insert(&shape)};
}

bool ShapeRegistry::erase(const ShapeHandle& handle)
{
  return bucketFor(handle).erase(handle.slot);
}

Shape* ShapeRegistry::find(const ShapeHandle& handle) const
{
  Shape* const* shape = bucket(handle.mobility, handle.kind).find(handle.slot);
  return shape != nullptr ? *shape : nullptr;
}

bool ShapeRegistry::contains(const ShapeHandle& handle) const
{
  return bucket(handle.mobility, handle.kind).contains(handle.slot);
}

const ShapeRegistry::Bucket& ShapeRegistry::bucket(Mobility mobility,
                                                   ShapeKind kind) const
{
  return buckets_[index(mobility)][static_cast<size_t>(kind)];
}

size_t ShapeRegistry::size() const
{
  return size(Mobility::Static) + size(Mobility::Dynamic);
}

size_t ShapeRegistry::size(Mobility mobility) const
{
  size_t count = 0;
  for (const Bucket& shapes : buckets_[index(mobility)])
  {
    count += shapes.size();
  }
  return count;
}

void ShapeRegistry::clear()
{
  for (auto& row : buckets_)
  {
    for (Bucket& shapes : row)
    {
      shapes.clear();
    }
  }
}

ShapeRegistry::Bucket& ShapeRegistry::bucketFor(const ShapeHandle& handle)
{
  return buckets_[index(handle.mobility)][static_cast<size_t>(handle.kind)];
}

}  // namespace rbd_sim
