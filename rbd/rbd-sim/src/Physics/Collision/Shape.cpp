// Ticket: 0010_shape_variants

#include "rbd-sim/src/Physics/Collision/Shape.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

#include "rbd-sim/src/Environment/PhysicsSystem.hpp"
#include "rbd-sim/src/Physics/RigidBody/RigidBody.hpp"

namespace rbd_sim
{

Shape::Shape(const SphereGeometry& sphere, const Coordinate& center)
  : geometry_{sphere}, center_{center}
{
  if (!(sphere.radius >= 0.0) || !std::isfinite(sphere.radius))
  {
    throw std::invalid_argument("Sphere radius must be non-negative, got: " +
                                std::to_string(sphere.radius));
  }
}

Shape::Shape(const PlaneGeometry& plane, const Coordinate& center)
  : geometry_{PlaneGeometry{plane.up}}, center_{center}
{
  if (!plane.up.isFinite() || plane.up.isZero(0.0))
  {
    throw std::invalid_argument(
      "Plane up axis must be finite with non-zero length");
  }
  std::get<PlaneGeometry>(geometry_).up = Vector3D{plane.up.normalized()};
}

Shape::~Shape()
{
  if (system_ != nullptr)
  {
    system_->deregisterShape(*this);
  }
  if (body_ != nullptr)
  {
    body_->detachShape(*this);
    body_ = nullptr;
  }
}

Shape Shape::sphere(double radius, const Coordinate& center)
{
  return Shape{SphereGeometry{radius}, center};
}

Shape Shape::plane(const Vector3D& up, const Coordinate& center)
{
  return Shape{PlaneGeometry{up}, center};
}

ShapeKind Shape::getKind() const
{
  return std::holds_alternative<SphereGeometry>(geometry_) ? ShapeKind::Sphere
                                                           : ShapeKind::Plane;
}

void Shape::setCenter(const Coordinate& center)
{
  center_ = center;
  if (body_ != nullptr)
  {
    body_->resetCenterOfMass();
  }
}

Coordinate Shape::getWorldPosition() const
{
  if (body_ == nullptr)
  {
    return center_;
  }
  return Coordinate{body_->getPosition() + body_->getRotation() * center_};
}

Vector3D Shape::getWorldUp() const
{
  const PlaneGeometry* plane = asPlane();
  if (plane == nullptr)
  {
    throw std::logic_error("getWorldUp called on a non-plane shape");
  }
  if (body_ == nullptr)
  {
    return plane->up;
  }
  return Vector3D{body_->getRotation() * plane->up};
}

Vector3D Shape::computeInertia(double mass) const
{
  if (const SphereGeometry* sphere = asSphere())
  {
    const double moment = 0.4 * mass * sphere->radius * sphere->radius;
    return Vector3D{moment, moment, moment};
  }

  constexpr double kInfinite = std::numeric_limits<double>::infinity();
  return Vector3D{kInfinite, kInfinite, kInfinite};
}

bool Shape::isStatic() const
{
  return body_ == nullptr || !body_->isEnabled();
}

void Shape::attachTo(RigidBody& body)
{
  if (body_ == &body)
  {
    return;
  }
  if (body_ != nullptr)
  {
    body_->detachShape(*this);
  }

  body_ = &body;
  body.attachShape(*this);

  refreshRegistration();
}

void Shape::detach()
{
  if (body_ == nullptr)
  {
    return;
  }

  RigidBody* previous = body_;
  body_ = nullptr;
  previous->detachShape(*this);

  refreshRegistration();
}

void Shape::refreshRegistration()
{
  if (system_ != nullptr)
  {
    system_->refreshShape(*this);
  }
}

}  // namespace rbd_sim
