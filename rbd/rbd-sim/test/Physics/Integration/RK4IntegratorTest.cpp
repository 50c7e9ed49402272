// Ticket: 0016_rk4_integration

#include <gtest/gtest.h>
#include <Eigen/Geometry>
#include <cmath>

#include "rbd-sim/src/Physics/Collision/Shape.hpp"
#include "rbd-sim/src/Physics/Integration/RK4Integrator.hpp"
#include "rbd-sim/src/Physics/RigidBody/RigidBody.hpp"

using namespace rbd_sim;

namespace
{

void integrate(const Integrator& integrator,
               RigidBody& body,
               double dt,
               int steps)
{
  for (int i = 0; i < steps; ++i)
  {
    integrator.step(body, dt);
  }
}

}  // anonymous namespace

// ============================================================================
// Linear motion
// ============================================================================

TEST(RK4IntegratorTest, step_ConstantAccelerationMatchesClosedForm)
{
  RigidBody body{2.0, Coordinate{0.0, 10.0, 0.0}};
  body.setVelocity(Vector3D{3.0, 0.0, 0.0});
  body.addAcceleration(Vector3D{0.0, -10.0, 0.0});

  const RK4Integrator integrator;
  integrate(integrator, body, 0.01, 100);

  // x = x0 + v0 t + ½ a t², v = v0 + a t at t = 1
  EXPECT_NEAR(3.0, body.getPosition().x(), 1e-9);
  EXPECT_NEAR(5.0, body.getPosition().y(), 1e-9);
  EXPECT_NEAR(3.0, body.getVelocity().x(), 1e-9);
  EXPECT_NEAR(-10.0, body.getVelocity().y(), 1e-9);
}

TEST(RK4IntegratorTest, step_ForceScalesWithInverseMass)
{
  RigidBody body{4.0};
  body.addForce(Vector3D{8.0, 0.0, 0.0});

  const RK4Integrator integrator;
  integrate(integrator, body, 0.1, 10);

  // a = 2, t = 1
  EXPECT_NEAR(2.0, body.getVelocity().x(), 1e-9);
  EXPECT_NEAR(1.0, body.getPosition().x(), 1e-9);
  EXPECT_NEAR(8.0, body.getMomentum().x(), 1e-9);
}

TEST(RK4IntegratorTest, step_LinearDragDecaysExponentially)
{
  RigidBody body{1.0};
  body.setVelocity(Vector3D{1.0, 0.0, 0.0});
  body.setDrag(0.5);

  const RK4Integrator integrator;
  integrate(integrator, body, 0.01, 200);

  // p(t) = p0 e^{-k t}, x(t) = (p0 / k m)(1 - e^{-k t}) at t = 2
  EXPECT_NEAR(std::exp(-1.0), body.getMomentum().x(), 1e-8);
  EXPECT_NEAR(2.0 * (1.0 - std::exp(-1.0)), body.getPosition().x(), 1e-6);
}

TEST(RK4IntegratorTest, step_AtRestWithoutForcesStaysPut)
{
  RigidBody body{1.0, Coordinate{1.0, 2.0, 3.0}};

  const RK4Integrator integrator;
  integrate(integrator, body, 0.02, 50);

  EXPECT_DOUBLE_EQ(1.0, body.getPosition().x());
  EXPECT_DOUBLE_EQ(2.0, body.getPosition().y());
  EXPECT_DOUBLE_EQ(3.0, body.getPosition().z());
  EXPECT_TRUE(body.getRotation().isApprox(Eigen::Quaterniond::Identity()));
}

// ============================================================================
// Angular motion
// ============================================================================

TEST(RK4IntegratorTest, step_ConstantSpinRotatesAboutAxis)
{
  RigidBody body{5.0};
  Shape sphere{SphereGeometry{1.0}};
  sphere.attachTo(body);
  body.setAngularVelocity(Vector3D{0.0, 0.0, 1.0});

  const RK4Integrator integrator;
  integrate(integrator, body, 0.01, 100);

  // One radian about +Z
  const Eigen::Vector3d rotated = body.getRotation() * Eigen::Vector3d::UnitX();
  EXPECT_NEAR(std::cos(1.0), rotated.x(), 1e-4);
  EXPECT_NEAR(std::sin(1.0), rotated.y(), 1e-4);
  EXPECT_NEAR(0.0, rotated.z(), 1e-12);
  EXPECT_NEAR(1.0, body.getRotation().norm(), 1e-12);
}

TEST(RK4IntegratorTest, step_TorqueAccumulatesAngularMomentum)
{
  RigidBody body{5.0};
  Shape sphere{SphereGeometry{1.0}};
  sphere.attachTo(body);
  body.addTorque(Vector3D{0.0, 0.0, 2.0});

  const RK4Integrator integrator;
  integrate(integrator, body, 0.1, 10);

  EXPECT_NEAR(2.0, body.getAngularMomentum().z(), 1e-9);
  // I = 2
  EXPECT_NEAR(1.0, body.getAngularVelocity().z(), 1e-9);
}

TEST(RK4IntegratorTest, step_AngularAccelerationScaledByMass)
{
  RigidBody body{5.0};
  Shape sphere{SphereGeometry{1.0}};
  sphere.attachTo(body);
  body.addAngularAcceleration(Vector3D{1.0, 0.0, 0.0});

  const RK4Integrator integrator;
  integrate(integrator, body, 0.1, 10);

  EXPECT_NEAR(5.0, body.getAngularMomentum().x(), 1e-9);
}

TEST(RK4IntegratorTest, step_AngularDragDecays)
{
  RigidBody body{5.0};
  Shape sphere{SphereGeometry{1.0}};
  sphere.attachTo(body);
  body.setAngularMomentum(Vector3D{0.0, 4.0, 0.0});
  body.setAngularDrag(1.0);

  const RK4Integrator integrator;
  integrate(integrator, body, 0.01, 100);

  EXPECT_NEAR(4.0 * std::exp(-1.0), body.getAngularMomentum().y(), 1e-8);
}

// ============================================================================
// Stage evaluation
// ============================================================================

TEST(RK4IntegratorTest, evaluate_FirstStageUsesCurrentState)
{
  RigidBody body{2.0};
  body.setVelocity(Vector3D{1.0, 2.0, 3.0});
  body.addForce(Vector3D{4.0, 0.0, 0.0});
  body.addAcceleration(Vector3D{0.0, 1.0, 0.0});

  const RK4Integrator::Derivative derivative = RK4Integrator::evaluate(body);

  EXPECT_DOUBLE_EQ(1.0, derivative.velocity.x());
  EXPECT_DOUBLE_EQ(3.0, derivative.velocity.z());
  EXPECT_DOUBLE_EQ(4.0, derivative.force.x());
  EXPECT_DOUBLE_EQ(2.0, derivative.force.y());
  EXPECT_TRUE(derivative.torque.isZero());
}

TEST(RK4IntegratorTest, evaluate_LaterStagePerturbsMomentum)
{
  RigidBody body{2.0};
  body.addForce(Vector3D{4.0, 0.0, 0.0});

  const RK4Integrator::Derivative first = RK4Integrator::evaluate(body);
  const RK4Integrator::Derivative second =
    RK4Integrator::evaluate(body, first, 0.5);

  // p = 0 + 4 * 0.5, v = p / m
  EXPECT_DOUBLE_EQ(1.0, second.velocity.x());
  // The body itself is untouched
  EXPECT_TRUE(body.getMomentum().isZero());
}
