// Ticket: 0013_impulse_collision_response
// Ticket: 0015_contact_events

#include <gtest/gtest.h>
#include <cmath>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <vector>

#include "rbd-sim/src/Physics/Collision/CollisionResponse.hpp"
#include "rbd-sim/src/Physics/Collision/NarrowPhase.hpp"
#include "rbd-sim/src/Physics/Collision/Shape.hpp"
#include "rbd-sim/src/Physics/RigidBody/RigidBody.hpp"

using namespace rbd_sim;

namespace
{

constexpr double kTolerance = 1e-9;

ShapeHandle makeHandle(Mobility mobility, ShapeKind kind, uint32_t index)
{
  return ShapeHandle{.mobility = mobility,
                     .kind = kind,
                     .slot = SlotHandle{.index = index, .generation = 0}};
}

const PhysicsMaterial kFrictionlessElastic{0.0, 0.0, 1.0};

/**
 * @brief Two unit-mass spheres of radius 1, A at the origin and B on +X
 */
class SpherePairTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    sphereA.attachTo(bodyA);
    sphereB.attachTo(bodyB);
    sphereA.setMaterial(kFrictionlessElastic);
    sphereB.setMaterial(kFrictionlessElastic);
    bodyA.setSimulateGravity(false);
    bodyB.setSimulateGravity(false);
  }

  ShapePair pair()
  {
    return ShapePair{sphereA, handleA, sphereB, handleB};
  }

  std::optional<Contact> detect() const
  {
    return NarrowPhase::test(sphereA, sphereB);
  }

  Vector3D totalMomentum() const
  {
    return Vector3D{bodyA.getMomentum() + bodyB.getMomentum()};
  }

  RigidBody bodyA{1.0, Coordinate{0.0, 0.0, 0.0}};
  RigidBody bodyB{1.0, Coordinate{1.5, 0.0, 0.0}};
  Shape sphereA{SphereGeometry{1.0}};
  Shape sphereB{SphereGeometry{1.0}};
  ShapeHandle handleA{makeHandle(Mobility::Dynamic, ShapeKind::Sphere, 0)};
  ShapeHandle handleB{makeHandle(Mobility::Dynamic, ShapeKind::Sphere, 1)};
  std::vector<ContactEvent> events;
  ResponseContext context{.gravity = Coordinate{0.0, 0.0, 0.0},
                          .fixedTimeStep = 0.02,
                          .events = &events};
};

/**
 * @brief Unit-mass sphere of radius 1 half a radius into a static ground plane
 */
class GroundContactTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    sphere.attachTo(body);
    ground.setMaterial(PhysicsMaterial{0.0, 0.0, 0.5});
  }

  ShapePair pair()
  {
    return ShapePair{sphere, sphereHandle, ground, groundHandle};
  }

  RigidBody body{1.0, Coordinate{0.0, 0.5, 0.0}};
  Shape sphere{SphereGeometry{1.0}};
  Shape ground{PlaneGeometry{Vector3D{0.0, 1.0, 0.0}}};
  ShapeHandle sphereHandle{
    makeHandle(Mobility::Dynamic, ShapeKind::Sphere, 0)};
  ShapeHandle groundHandle{makeHandle(Mobility::Static, ShapeKind::Plane, 0)};
  std::vector<ContactEvent> events;
  ResponseContext context{.events = &events};
};

}  // anonymous namespace

// ============================================================================
// Dynamic vs dynamic
// ============================================================================

TEST_F(SpherePairTest, impulseResponse_ConservesMomentumHeadOn)
{
  bodyA.setVelocity(Vector3D{1.0, 0.0, 0.0});
  bodyB.setVelocity(Vector3D{-1.0, 0.0, 0.0});
  const Vector3D before = totalMomentum();

  const std::optional<Contact> contact = detect();
  ASSERT_TRUE(contact.has_value());
  CollisionResponse::impulseResponse(sphereA, sphereB, *contact, true, context);

  const Vector3D after = totalMomentum();
  EXPECT_NEAR(before.x(), after.x(), kTolerance);
  EXPECT_NEAR(before.y(), after.y(), kTolerance);
  EXPECT_NEAR(before.z(), after.z(), kTolerance);

  // Equal masses swap velocities
  EXPECT_NEAR(-1.0, bodyA.getVelocity().x(), kTolerance);
  EXPECT_NEAR(1.0, bodyB.getVelocity().x(), kTolerance);
}

TEST_F(SpherePairTest, impulseResponse_ConservesMomentumWithBodyAtRest)
{
  bodyA.setVelocity(Vector3D{2.0, 0.0, 0.0});
  const Vector3D before = totalMomentum();

  const std::optional<Contact> contact = detect();
  ASSERT_TRUE(contact.has_value());
  CollisionResponse::impulseResponse(sphereA, sphereB, *contact, true, context);

  const Vector3D after = totalMomentum();
  EXPECT_NEAR(before.x(), after.x(), kTolerance);
  EXPECT_NEAR(0.0, bodyA.getVelocity().norm(), kTolerance);
  EXPECT_NEAR(2.0, bodyB.getVelocity().x(), kTolerance);
}

TEST_F(SpherePairTest, impulseResponse_RelativeNormalSpeedDoesNotGrow)
{
  const PhysicsMaterial lossy{0.0, 0.0, 0.5};
  sphereA.setMaterial(lossy);
  sphereB.setMaterial(lossy);
  bodyA.setVelocity(Vector3D{1.0, 0.0, 0.0});
  bodyB.setVelocity(Vector3D{-1.0, 0.0, 0.0});

  const std::optional<Contact> contact = detect();
  ASSERT_TRUE(contact.has_value());
  const Vector3D normal = contact->normal;
  const double before =
    std::abs((bodyA.getVelocity() - bodyB.getVelocity()).dot(normal));

  CollisionResponse::impulseResponse(sphereA, sphereB, *contact, true, context);

  const double after =
    std::abs((bodyA.getVelocity() - bodyB.getVelocity()).dot(normal));
  EXPECT_LE(after, before + kTolerance);
  EXPECT_NEAR(1.0, after, kTolerance);
}

TEST_F(SpherePairTest, impulseResponse_SeparatesOverlappingSpheres)
{
  bodyA.setVelocity(Vector3D{1.0, 0.0, 0.0});
  bodyB.setVelocity(Vector3D{-1.0, 0.0, 0.0});

  CollisionResponse::resolve(pair(), detect(), context);

  const double distance = (bodyB.getPosition() - bodyA.getPosition()).norm();
  EXPECT_GE(distance, 2.0 - kTolerance);

  // Half the 0.5 penetration on each side, applied once
  EXPECT_NEAR(-0.25, bodyA.getPosition().x(), kTolerance);
  EXPECT_NEAR(1.75, bodyB.getPosition().x(), kTolerance);
}

TEST_F(SpherePairTest, respond_InitialContactMarksBothTouching)
{
  CollisionResponse::resolve(pair(), detect(), context);

  EXPECT_TRUE(sphereA.isTouching(handleB));
  EXPECT_TRUE(sphereB.isTouching(handleA));
  ASSERT_EQ(1U, events.size());
  EXPECT_EQ(ContactEvent::Type::Begin, events[0].type);
  EXPECT_EQ(handleA, events[0].a);
  EXPECT_EQ(handleB, events[0].b);
}

TEST_F(SpherePairTest, respond_ContinuedContactSkipsCorrection)
{
  sphereA.startTouching(handleB);
  sphereB.startTouching(handleA);
  bodyA.setVelocity(Vector3D{1.0, 0.0, 0.0});

  const std::optional<Contact> contact = detect();
  ASSERT_TRUE(contact.has_value());
  CollisionResponse::respond(pair(), *contact, context);

  EXPECT_DOUBLE_EQ(0.0, bodyA.getPosition().x());
  EXPECT_DOUBLE_EQ(1.5, bodyB.getPosition().x());
  EXPECT_DOUBLE_EQ(1.0, bodyA.getVelocity().x());
  EXPECT_TRUE(bodyB.getMomentum().isZero());
  EXPECT_TRUE(events.empty());
}

// ============================================================================
// Dynamic vs static
// ============================================================================

TEST_F(GroundContactTest, staticResponse_ReflectsAndScalesMomentum)
{
  body.setVelocity(Vector3D{0.0, -2.0, 0.0});
  body.setAngularMomentum(Vector3D{1.0, 0.0, 0.0});

  CollisionResponse::resolve(
    pair(), NarrowPhase::test(sphere, ground), context);

  // Pushed out along the plane normal by the 0.5 penetration
  EXPECT_NEAR(1.0, body.getPosition().y(), kTolerance);
  // Reflected and scaled by the ground's restitution
  EXPECT_NEAR(1.0, body.getVelocity().y(), kTolerance);
  EXPECT_NEAR(0.5, body.getAngularMomentum().x(), kTolerance);
}

TEST_F(GroundContactTest, staticResponse_StaticShapeUnchanged)
{
  body.setVelocity(Vector3D{0.0, -2.0, 0.0});
  const Coordinate groundBefore = ground.getWorldPosition();

  CollisionResponse::resolve(
    pair(), NarrowPhase::test(sphere, ground), context);

  EXPECT_EQ(nullptr, ground.getRigidBody());
  EXPECT_TRUE(ground.getWorldPosition().isApprox(groundBefore));
  EXPECT_TRUE(ground.isTouching(sphereHandle));
}

TEST_F(GroundContactTest, staticResponse_AppliesNormalForce)
{
  CollisionResponse::resolve(
    pair(), NarrowPhase::test(sphere, ground), context);

  // Frictionless ground: only the normal force m g remains
  EXPECT_NEAR(9.80665, body.getAccumulatedForce().y(), kTolerance);
  EXPECT_NEAR(0.0, body.getAccumulatedForce().x(), kTolerance);
}

TEST_F(GroundContactTest, staticResponse_StaticShapeFirstInPair)
{
  body.setVelocity(Vector3D{0.0, -2.0, 0.0});

  CollisionResponse::resolve(
    ShapePair{ground, groundHandle, sphere, sphereHandle},
    NarrowPhase::test(ground, sphere),
    context);

  EXPECT_NEAR(1.0, body.getPosition().y(), kTolerance);
  EXPECT_NEAR(1.0, body.getVelocity().y(), kTolerance);
}

TEST_F(GroundContactTest, respond_ContinuedContactAppliesFrictionOnly)
{
  const std::optional<Contact> contact = NarrowPhase::test(sphere, ground);
  ASSERT_TRUE(contact.has_value());
  sphere.startTouching(groundHandle);
  ground.startTouching(sphereHandle);
  body.setVelocity(Vector3D{0.0, -2.0, 0.0});

  CollisionResponse::respond(pair(), *contact, context);

  EXPECT_DOUBLE_EQ(0.5, body.getPosition().y());
  EXPECT_DOUBLE_EQ(-2.0, body.getVelocity().y());
  EXPECT_FALSE(body.getAccumulatedForce().isZero());
}

TEST_F(GroundContactTest, respond_BothStaticThrows)
{
  body.setEnabled(false);
  const std::optional<Contact> contact = NarrowPhase::test(sphere, ground);
  ASSERT_TRUE(contact.has_value());

  EXPECT_THROW(CollisionResponse::respond(pair(), *contact, context),
               std::logic_error);
}

// ============================================================================
// Not colliding
// ============================================================================

TEST_F(GroundContactTest, notColliding_ClearsTouchingAndQueuesEnd)
{
  sphere.startTouching(groundHandle);
  ground.startTouching(sphereHandle);
  body.setPosition(Coordinate{0.0, 5.0, 0.0});
  body.setVelocity(Vector3D{0.0, 3.0, 0.0});

  CollisionResponse::resolve(
    pair(), NarrowPhase::test(sphere, ground), context);

  EXPECT_FALSE(sphere.isTouching(groundHandle));
  EXPECT_FALSE(ground.isTouching(sphereHandle));
  ASSERT_EQ(1U, events.size());
  EXPECT_EQ(ContactEvent::Type::End, events[0].type);

  // Bodies are never modified when not colliding
  EXPECT_DOUBLE_EQ(5.0, body.getPosition().y());
  EXPECT_DOUBLE_EQ(3.0, body.getVelocity().y());
  EXPECT_TRUE(body.getAccumulatedForce().isZero());
}

TEST_F(GroundContactTest, notColliding_IsIdempotent)
{
  CollisionResponse::notColliding(pair(), context);
  CollisionResponse::notColliding(pair(), context);

  EXPECT_TRUE(events.empty());
  EXPECT_TRUE(sphere.getTouching().empty());
  EXPECT_TRUE(ground.getTouching().empty());
}

TEST_F(GroundContactTest, notColliding_ClearsOneSidedMembership)
{
  ground.startTouching(sphereHandle);

  CollisionResponse::notColliding(pair(), context);
  CollisionResponse::notColliding(pair(), context);

  EXPECT_FALSE(ground.isTouching(sphereHandle));
  EXPECT_EQ(1U, events.size());
}

TEST_F(SpherePairTest, resolve_SeparatedSpheresEndContactOnce)
{
  bodyB.setPosition(Coordinate{3.0, 0.0, 0.0});
  bodyA.setVelocity(Vector3D{-1.0, 0.0, 0.0});
  bodyB.setVelocity(Vector3D{1.0, 0.5, 0.0});
  sphereA.startTouching(handleB);
  sphereB.startTouching(handleA);

  CollisionResponse::resolve(pair(), detect(), context);
  CollisionResponse::resolve(pair(), detect(), context);

  EXPECT_TRUE(sphereA.getTouching().empty());
  EXPECT_TRUE(sphereB.getTouching().empty());
  ASSERT_EQ(1U, events.size());
  EXPECT_EQ(ContactEvent::Type::End, events[0].type);
  EXPECT_EQ(handleA, events[0].a);
  EXPECT_EQ(handleB, events[0].b);

  EXPECT_DOUBLE_EQ(0.0, bodyA.getPosition().x());
  EXPECT_DOUBLE_EQ(3.0, bodyB.getPosition().x());
  EXPECT_DOUBLE_EQ(-1.0, bodyA.getMomentum().x());
  EXPECT_DOUBLE_EQ(1.0, bodyB.getMomentum().x());
  EXPECT_DOUBLE_EQ(0.5, bodyB.getMomentum().y());
  EXPECT_TRUE(bodyA.getAccumulatedForce().isZero());
  EXPECT_TRUE(bodyB.getAccumulatedForce().isZero());
  EXPECT_TRUE(bodyA.getAccumulatedTorque().isZero());
  EXPECT_TRUE(bodyB.getAccumulatedTorque().isZero());
}

TEST(CollisionResponseTest, resolve_WithoutEventSink)
{
  RigidBody body{1.0, Coordinate{0.0, 0.5, 0.0}};
  Shape sphere{SphereGeometry{1.0}};
  sphere.attachTo(body);
  Shape ground{PlaneGeometry{}};
  const ShapeHandle sphereHandle =
    makeHandle(Mobility::Dynamic, ShapeKind::Sphere, 0);
  const ShapeHandle groundHandle =
    makeHandle(Mobility::Static, ShapeKind::Plane, 0);

  CollisionResponse::resolve(ShapePair{sphere, sphereHandle, ground, groundHandle},
                             NarrowPhase::test(sphere, ground),
                             ResponseContext{});

  EXPECT_TRUE(sphere.isTouching(groundHandle));
}
