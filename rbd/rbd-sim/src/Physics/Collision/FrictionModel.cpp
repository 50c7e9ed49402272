// Ticket: 0014_surface_friction

#include "rbd-sim/src/Physics/Collision/FrictionModel.hpp"

#include <cmath>

#include "rbd-sim/src/Physics/RigidBody/RigidBody.hpp"
#include "rbd-sim/src/Physics/VectorMath.hpp"

namespace rbd_sim::FrictionModel
{

Result compute(const RigidBody& body,
               const Coordinate& contactPoint,
               double staticCoefficient,
               double kineticCoefficient,
               const Coordinate& gravity,
               double fixedTimeStep)
{
  const double threshold = body.getSleepThreshold() * body.getSleepThreshold();

  const Vector3D gravitationalForce =
    body.getSimulateGravity() ? Vector3D{gravity * body.getMass()}
                              : Vector3D::zero();

  const Vector3D contactToBody{body.getPosition() - contactPoint};
  const double angle = VectorMath::angleBetween(contactToBody, kDownAxis);

  Result result;
  result.normalForce = Vector3D{gravitationalForce * std::cos(angle)};

  const Vector3D effectiveForce{body.getMomentum() / fixedTimeStep +
                                gravitationalForce};
  const Vector3D direction = VectorMath::normalizedOrZero(effectiveForce);

  result.usedStaticCoefficient = effectiveForce.squaredNorm() < threshold;
  result.coefficient =
    result.usedStaticCoefficient ? staticCoefficient : kineticCoefficient;
  result.frictionForce =
    Vector3D{-result.coefficient * direction * result.normalForce.norm()};

  return result;
}

Result apply(RigidBody& body,
             const Coordinate& contactPoint,
             double staticCoefficient,
             double kineticCoefficient,
             const Coordinate& gravity,
             double fixedTimeStep)
{
  const Result result = compute(body,
                                contactPoint,
                                staticCoefficient,
                                kineticCoefficient,
                                gravity,
                                fixedTimeStep);
  body.addForce(result.frictionForce);
  body.addForce(result.normalForce);
  return result;
}

}  // namespace rbd_sim::FrictionModel
