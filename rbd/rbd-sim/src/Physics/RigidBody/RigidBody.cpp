// Ticket: 0008_rigid_body_force_accumulation
// Ticket: 0009_rigid_body_inertia

#include "rbd-sim/src/Physics/RigidBody/RigidBody.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

#include <spdlog/spdlog.h>

#include "rbd-sim/src/Environment/PhysicsSystem.hpp"
#include "rbd-sim/src/Physics/Collision/Shape.hpp"
#include "rbd-sim/src/Physics/VectorMath.hpp"

namespace rbd_sim
{

RigidBody::RigidBody(double mass, const Coordinate& position)
  : mass_{kMinimumMass}, inverseMass_{1.0 / kMinimumMass}, position_{position}
{
  setMass(mass);
}

RigidBody::~RigidBody()
{
  // Detaching mutates shapes_, so work from a copy
  const std::vector<Shape*> attached = shapes_;
  for (Shape* shape : attached)
  {
    shape->detach();
  }

  if (system_ != nullptr)
  {
    system_->deregisterBody(*this);
  }
}

// ========== Mass properties ==========

void RigidBody::setMass(double mass)
{
  if (!(mass > 0.0) || !std::isfinite(mass))
  {
    throw std::invalid_argument("Mass must be positive, got: " +
                                std::to_string(mass));
  }

  if (mass < kMinimumMass)
  {
    spdlog::warn("RigidBody: mass {} below minimum, clamped to {}",
                 mass,
                 kMinimumMass);
    mass = kMinimumMass;
  }

  mass_ = mass;
  inverseMass_ = 1.0 / mass;
  resetInertiaTensor();
}

Coordinate RigidBody::getWorldCenterOfMass() const
{
  return Coordinate{position_ + rotation_ * centerOfMass_};
}

void RigidBody::setScale(const Vector3D& scale)
{
  if ((scale.array() < 0.0).any())
  {
    throw std::invalid_argument("Scale components must be non-negative");
  }
  scale_ = scale;
  resetInertiaTensor();
}

void RigidBody::resetInertiaTensor()
{
  if (!shapes_.empty())
  {
    inertiaTensor_ = shapes_.front()->computeInertia(mass_);
    return;
  }

  const double radius = (scale_.x() + scale_.y() + scale_.z()) / 3.0;
  const double moment = 0.4 * mass_ * radius * radius;
  inertiaTensor_ = Vector3D{moment, moment, moment};
}

void RigidBody::resetCenterOfMass()
{
  if (shapes_.empty())
  {
    centerOfMass_ = Coordinate{0.0, 0.0, 0.0};
    return;
  }

  Coordinate sum{0.0, 0.0, 0.0};
  for (const Shape* shape : shapes_)
  {
    sum += shape->getCenter();
  }
  centerOfMass_ = Coordinate{sum / static_cast<double>(shapes_.size())};
}

// ========== Resistance and flags ==========

void RigidBody::setDrag(double drag)
{
  if (drag < 0.0)
  {
    throw std::invalid_argument("Drag must be non-negative, got: " +
                                std::to_string(drag));
  }
  drag_ = drag;
}

void RigidBody::setAngularDrag(double drag)
{
  if (drag < 0.0)
  {
    throw std::invalid_argument("Angular drag must be non-negative, got: " +
                                std::to_string(drag));
  }
  angularDrag_ = drag;
}

void RigidBody::setSleepThreshold(double threshold)
{
  if (threshold < 0.0)
  {
    throw std::invalid_argument(
      "Sleep threshold must be non-negative, got: " + std::to_string(threshold));
  }
  sleepThreshold_ = threshold;
}

void RigidBody::setEnabled(bool enabled)
{
  if (enabled_ == enabled)
  {
    return;
  }
  enabled_ = enabled;

  // Shape mobility follows the body
  for (Shape* shape : shapes_)
  {
    shape->refreshRegistration();
  }
}

void RigidBody::setFixedTimeStep(double dt)
{
  if (!(dt > 0.0) || !std::isfinite(dt))
  {
    throw std::invalid_argument("Fixed time step must be positive, got: " +
                                std::to_string(dt));
  }
  fixedTimeStep_ = dt;
}

// ========== Kinematic state ==========

void RigidBody::setRotation(const Eigen::Quaterniond& rotation)
{
  rotation_ = rotation.normalized();
}

Vector3D RigidBody::getVelocity() const
{
  return Vector3D{momentum_ * inverseMass_};
}

void RigidBody::setVelocity(const Vector3D& velocity)
{
  momentum_ = Vector3D{velocity * mass_};
}

Vector3D RigidBody::getAngularVelocity() const
{
  return VectorMath::integrateMomentum(angularMomentum_, inertiaTensor_);
}

void RigidBody::setAngularVelocity(const Vector3D& angularVelocity)
{
  angularMomentum_ = VectorMath::deriveMomentum(angularVelocity, inertiaTensor_);
}

Eigen::Quaterniond RigidBody::getSpin() const
{
  return VectorMath::deriveSpin(getAngularVelocity(), rotation_);
}

double RigidBody::getKineticEnergy() const
{
  return 0.5 * momentum_.dot(getVelocity()) +
         0.5 * angularMomentum_.dot(getAngularVelocity());
}

// ========== Force accumulation ==========

void RigidBody::addForce(const Vector3D& force)
{
  force_ += force;
}

void RigidBody::addAcceleration(const Vector3D& acceleration)
{
  acceleration_ += acceleration;
}

void RigidBody::addTorque(const Vector3D& torque)
{
  torque_ += torque;
}

void RigidBody::addAngularAcceleration(const Vector3D& angularAcceleration)
{
  angularAcceleration_ += angularAcceleration;
}

void RigidBody::addImpulse(const Vector3D& impulse)
{
  force_ += impulse / fixedTimeStep_;
}

void RigidBody::addAngularImpulse(const Vector3D& angularImpulse)
{
  torque_ += angularImpulse / fixedTimeStep_;
}

void RigidBody::addForceAtPoint(const Vector3D& force,
                                const Coordinate& point,
                                ForceMode mode)
{
  const Vector3D leverArm{getWorldCenterOfMass() - point};
  const Vector3D torque{force.cross(leverArm)};

  switch (mode)
  {
    case ForceMode::Force:
      addForce(force);
      addTorque(torque);
      return;
    case ForceMode::Acceleration:
      addAcceleration(force);
      addAngularAcceleration(torque);
      return;
    case ForceMode::Impulse:
      addImpulse(force);
      addAngularImpulse(torque);
      return;
    case ForceMode::VelocityChange:
      addAcceleration(Vector3D{force / fixedTimeStep_});
      addAngularAcceleration(Vector3D{torque / fixedTimeStep_});
      return;
  }
  throw std::logic_error("Unrecognized force mode: " +
                         std::to_string(static_cast<int>(mode)));
}

void RigidBody::resetAccumulatedForces()
{
  force_.setZero();
  acceleration_.setZero();
  torque_.setZero();
  angularAcceleration_.setZero();
}

// ========== Attachments ==========

void RigidBody::attachShape(Shape& shape)
{
  if (std::find(shapes_.begin(), shapes_.end(), &shape) != shapes_.end())
  {
    return;
  }
  shapes_.push_back(&shape);
  resetInertiaTensor();
  resetCenterOfMass();
}

void RigidBody::detachShape(Shape& shape)
{
  auto it = std::find(shapes_.begin(), shapes_.end(), &shape);
  if (it == shapes_.end())
  {
    return;
  }
  shapes_.erase(it);
  resetInertiaTensor();
  resetCenterOfMass();
}

}  // namespace rbd_sim
