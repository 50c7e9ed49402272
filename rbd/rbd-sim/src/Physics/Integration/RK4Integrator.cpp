// Ticket: 0016_rk4_integration

#include "rbd-sim/src/Physics/Integration/RK4Integrator.hpp"

#include "rbd-sim/src/Physics/RigidBody/RigidBody.hpp"
#include "rbd-sim/src/Physics/VectorMath.hpp"

namespace rbd_sim
{

Vector3D RK4Integrator::computeForce(const RigidBody& body,
                                     const Vector3D& momentum)
{
  return Vector3D{body.getAccumulatedForce() +
                  body.getAccumulatedAcceleration() * body.getMass() -
                  body.getDrag() * momentum};
}

Vector3D RK4Integrator::computeTorque(const RigidBody& body,
                                      const Vector3D& angularMomentum)
{
  return Vector3D{body.getAccumulatedTorque() +
                  body.getAccumulatedAngularAcceleration() * body.getMass() -
                  body.getAngularDrag() * angularMomentum};
}

RK4Integrator::Derivative RK4Integrator::evaluate(const RigidBody& body)
{
  Derivative output;
  output.velocity = body.getVelocity();
  output.spin = body.getSpin();
  output.force = computeForce(body, body.getMomentum());
  output.torque = computeTorque(body, body.getAngularMomentum());
  return output;
}

RK4Integrator::Derivative RK4Integrator::evaluate(const RigidBody& body,
                                                  const Derivative& previous,
                                                  double dt)
{
  const Vector3D momentum{body.getMomentum() + previous.force * dt};
  const Vector3D angularMomentum{body.getAngularMomentum() +
                                 previous.torque * dt};

  const Vector3D angularVelocity =
    VectorMath::integrateMomentum(angularMomentum, body.getInertiaTensor());

  Derivative output;
  output.velocity = VectorMath::integrateForce(momentum, body.getMass());
  output.spin = VectorMath::deriveSpin(angularVelocity, body.getRotation());
  output.force = computeForce(body, momentum);
  output.torque = computeTorque(body, angularMomentum);
  return output;
}

void RK4Integrator::step(RigidBody& body, double dt) const
{
  const Derivative k1 = evaluate(body);
  const Derivative k2 = evaluate(body, k1, dt * 0.5);
  const Derivative k3 = evaluate(body, k2, dt * 0.5);
  const Derivative k4 = evaluate(body, k3, dt);

  constexpr double kSixth = 1.0 / 6.0;

  const Vector3D velocity{
    kSixth * (k1.velocity + 2.0 * (k2.velocity + k3.velocity) + k4.velocity)};
  const Vector3D force{
    kSixth * (k1.force + 2.0 * (k2.force + k3.force) + k4.force)};
  const Vector3D torque{
    kSixth * (k1.torque + 2.0 * (k2.torque + k3.torque) + k4.torque)};

  const Eigen::Quaterniond middle =
    VectorMath::scaleQuaternion(VectorMath::addQuaternions(k2.spin, k3.spin), 2.0);
  const Eigen::Quaterniond spin = VectorMath::scaleQuaternion(
    VectorMath::addQuaternions(VectorMath::addQuaternions(k1.spin, middle), k4.spin),
    kSixth);

  body.setPosition(Coordinate{body.getPosition() + velocity * dt});
  body.setRotation(VectorMath::addQuaternions(
    body.getRotation(), VectorMath::scaleQuaternion(spin, dt)));
  body.setMomentum(Vector3D{body.getMomentum() + force * dt});
  body.setAngularMomentum(Vector3D{body.getAngularMomentum() + torque * dt});
}

}  // namespace rbd_sim
