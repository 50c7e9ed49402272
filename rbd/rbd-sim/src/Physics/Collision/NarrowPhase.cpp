// Ticket: 0012_narrow_phase

#include "rbd-sim/src/Physics/Collision/NarrowPhase.hpp"

#include <array>
#include <cmath>

namespace rbd_sim::NarrowPhase
{

namespace
{

using DispatchRow = std::array<TestFunction, kShapeKindCount>;

// Indexed [kind of A][kind of B]
constexpr std::array<DispatchRow, kShapeKindCount> kDispatchTable{{
  {&sphereOnSphere, &sphereOnPlane},
  {&planeOnSphere, &planeOnPlane},
}};

}  // namespace

std::optional<Contact> sphereOnSphere(const Shape& a, const Shape& b)
{
  const double radiusA = a.asSphere()->radius;
  const double radiusB = b.asSphere()->radius;
  const double radiusSum = radiusA + radiusB;

  const Coordinate positionA = a.getWorldPosition();
  const Vector3D difference{b.getWorldPosition() - positionA};

  const double distanceSquared = difference.squaredNorm();
  if (distanceSquared > radiusSum * radiusSum)
  {
    return std::nullopt;
  }

  const double distance = std::sqrt(distanceSquared);
  const Vector3D normal =
    distance > 0.0 ? Vector3D{difference / distance} : kFallbackNormal;
  const double penetration = radiusSum - distance;

  return Contact{.normal = normal,
                 .penetrationDepth = penetration,
                 .contactPoint =
                   Coordinate{positionA + normal * (radiusA - penetration)}};
}

std::optional<Contact> sphereOnPlane(const Shape& sphere, const Shape& plane)
{
  const double radius = sphere.asSphere()->radius;
  const Vector3D up = plane.getWorldUp();

  const Coordinate spherePosition = sphere.getWorldPosition();
  const double distance =
    Coordinate{spherePosition - plane.getWorldPosition()}.componentAlong(up);

  if (std::abs(distance) >= radius)
  {
    return std::nullopt;
  }

  // Resolve toward the side of the plane the center is on
  const Vector3D normal = distance >= 0.0 ? Vector3D{-up} : up;
  const double penetration = radius - std::abs(distance);
  return Contact{.normal = normal,
                 .penetrationDepth = penetration,
                 .contactPoint =
                   Coordinate{spherePosition + normal * penetration}};
}

std::optional<Contact> planeOnSphere(const Shape& plane, const Shape& sphere)
{
  std::optional<Contact> contact = sphereOnPlane(sphere, plane);
  if (contact)
  {
    contact->normal = Vector3D{-contact->normal};
  }
  return contact;
}

std::optional<Contact> planeOnPlane(const Shape& /* a */, const Shape& /* b */)
{
  return std::nullopt;
}

TestFunction dispatch(ShapeKind a, ShapeKind b)
{
  return kDispatchTable[static_cast<size_t>(a)][static_cast<size_t>(b)];
}

std::optional<Contact> test(const Shape& a, const Shape& b)
{
  return dispatch(a.getKind(), b.getKind())(a, b);
}

}  // namespace rbd_sim::NarrowPhase
