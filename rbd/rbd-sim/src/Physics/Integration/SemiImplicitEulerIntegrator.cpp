// Ticket: 0017_semi_implicit_euler

#include "rbd-sim/src/Physics/Integration/SemiImplicitEulerIntegrator.hpp"

#include "rbd-sim/src/Physics/Integration/RK4Integrator.hpp"
#include "rbd-sim/src/Physics/RigidBody/RigidBody.hpp"
#include "rbd-sim/src/Physics/VectorMath.hpp"

namespace rbd_sim
{

void SemiImplicitEulerIntegrator::step(RigidBody& body, double dt) const
{
  // ===== Momenta =====

  const Vector3D force = RK4Integrator::computeForce(body, body.getMomentum());
  const Vector3D torque =
    RK4Integrator::computeTorque(body, body.getAngularMomentum());

  body.setMomentum(Vector3D{body.getMomentum() + force * dt});
  body.setAngularMomentum(Vector3D{body.getAngularMomentum() + torque * dt});

  // ===== Position and orientation from the updated velocities =====

  body.setPosition(Coordinate{body.getPosition() + body.getVelocity() * dt});

  // Q_new = Q_old + Q̇ dt, renormalized by setRotation
  body.setRotation(VectorMath::addQuaternions(
    body.getRotation(), VectorMath::scaleQuaternion(body.getSpin(), dt)));
}

}  // namespace rbd_sim
