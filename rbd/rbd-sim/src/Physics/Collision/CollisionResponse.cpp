// Ticket: 0013_impulse_collision_response
// Ticket: 0015_contact_events

#include "rbd-sim/src/Physics/Collision/CollisionResponse.hpp"

#include <stdexcept>

#include <spdlog/spdlog.h>

#include "rbd-sim/src/Physics/Collision/FrictionModel.hpp"
#include "rbd-sim/src/Physics/Collision/Shape.hpp"
#include "rbd-sim/src/Physics/RigidBody/RigidBody.hpp"
#include "rbd-sim/src/Physics/VectorMath.hpp"

namespace rbd_sim::CollisionResponse
{

namespace
{

void pushEvent(const ResponseContext& context,
               ContactEvent::Type type,
               const ShapePair& pair)
{
  if (context.events != nullptr)
  {
    context.events->push_back(
      ContactEvent{.type = type, .a = pair.handleA, .b = pair.handleB});
  }
}

}  // namespace

// ========== Position correction ==========

void correctDynamicPosition(RigidBody& a,
                            RigidBody& b,
                            const Vector3D& normal,
                            double penetration)
{
  const Vector3D correction{normal * (penetration * 0.5)};
  a.setPosition(Coordinate{a.getPosition() - correction});
  b.setPosition(Coordinate{b.getPosition() + correction});
}

void correctStaticPosition(RigidBody& body,
                           const Vector3D& normal,
                           double penetration)
{
  body.setPosition(Coordinate{body.getPosition() - normal * penetration});
}

// ========== Momentum exchange ==========

void correctLinearMotion(RigidBody& a,
                         RigidBody& b,
                         const SurfaceResponse& surfaceA,
                         const SurfaceResponse& surfaceB,
                         const Vector3D& normal)
{
  const double massA = a.getMass();
  const double massB = b.getMass();
  const Vector3D momentumA = a.getMomentum();
  const Vector3D momentumB = b.getMomentum();
  const Vector3D velocityA = a.getVelocity();
  const Vector3D velocityB = b.getVelocity();

  const Vector3D v1{surfaceA.restitution *
                    (momentumA + 2.0 * momentumB - massB * velocityA) /
                    (massA + massB)};
  const Vector3D v2{surfaceB.restitution * (velocityA - velocityB) + v1};

  Vector3D directionA =
    VectorMath::normalizedOrZero(VectorMath::reflect(velocityA, Vector3D{-normal}));
  if (directionA.isZero())
  {
    directionA = Vector3D{-normal};
  }

  Vector3D directionB =
    VectorMath::normalizedOrZero(VectorMath::reflect(velocityB, normal));
  if (directionB.isZero())
  {
    directionB = normal;
  }

  a.setVelocity(Vector3D{directionA * v1.norm()});
  b.setVelocity(Vector3D{directionB * v2.norm()});
}

void correctAngularMotion(RigidBody& a,
                          RigidBody& b,
                          const SurfaceResponse& surfaceA,
                          const SurfaceResponse& surfaceB,
                          const Vector3D& normal)
{
  const Vector3D& inertiaA = a.getInertiaTensor();
  const Vector3D& inertiaB = b.getInertiaTensor();
  const Vector3D momentumA = a.getAngularMomentum();
  const Vector3D momentumB = b.getAngularMomentum();
  const Vector3D velocityA = a.getAngularVelocity();
  const Vector3D velocityB = b.getAngularVelocity();

  const Vector3D exchanged{
    surfaceA.restitution *
    (momentumA + 2.0 * momentumB -
     VectorMath::deriveMomentum(velocityA, inertiaB))};
  const Vector3D v1 =
    VectorMath::integrateMomentum(exchanged, Vector3D{inertiaA + inertiaB});
  const Vector3D v2{surfaceB.restitution * (velocityA - velocityB) + v1};

  const Vector3D directionA = VectorMath::normalizedOrZero(
    VectorMath::reflect(Vector3D{-momentumA}, normal));
  const Vector3D directionB = VectorMath::normalizedOrZero(
    VectorMath::reflect(Vector3D{-momentumB}, normal));

  a.setAngularVelocity(Vector3D{directionA * v1.norm()});
  b.setAngularVelocity(Vector3D{directionB * v2.norm()});
}

// ========== Pair resolution ==========

void staticResponse(Shape& dynamic,
                    const Shape& stationary,
                    const Vector3D& normal,
                    const Contact& contact,
                    bool initialContact,
                    const ResponseContext& context)
{
  RigidBody& body = *dynamic.getRigidBody();

  const PhysicsMaterial* self = dynamic.getMaterial();
  const PhysicsMaterial* other = stationary.getMaterial();
  const double staticFriction = combinedStaticFriction(self, other);
  const double kineticFriction = combinedKineticFriction(self, other);
  const double restitution = combinedRestitution(self, other);

  if (initialContact)
  {
    correctStaticPosition(body, normal, contact.penetrationDepth);

    body.setMomentum(
      Vector3D{VectorMath::reflect(body.getMomentum(), normal) * restitution});
    body.setAngularMomentum(Vector3D{
      VectorMath::reflect(body.getAngularMomentum(), normal) * restitution});
  }

  FrictionModel::apply(body,
                       contact.contactPoint,
                       staticFriction,
                       kineticFriction,
                       context.gravity,
                       context.fixedTimeStep);
}

void impulseResponse(Shape& a,
                     Shape& b,
                     const Contact& contact,
                     bool initialContact,
                     const ResponseContext& context)
{
  RigidBody& bodyA = *a.getRigidBody();
  RigidBody& bodyB = *b.getRigidBody();

  const CombinedMaterial surfaces = combine(a.getMaterial(), b.getMaterial());

  if (initialContact)
  {
    correctDynamicPosition(
      bodyA, bodyB, contact.normal, contact.penetrationDepth);
    correctLinearMotion(
      bodyA, bodyB, surfaces.lhs, surfaces.rhs, contact.normal);
    correctAngularMotion(
      bodyA, bodyB, surfaces.lhs, surfaces.rhs, contact.normal);
  }

  FrictionModel::apply(bodyA,
                       contact.contactPoint,
                       surfaces.lhs.staticFriction,
                       surfaces.lhs.kineticFriction,
                       context.gravity,
                       context.fixedTimeStep);
  FrictionModel::apply(bodyB,
                       contact.contactPoint,
                       surfaces.rhs.staticFriction,
                       surfaces.rhs.kineticFriction,
                       context.gravity,
                       context.fixedTimeStep);
}

void respond(const ShapePair& pair,
             const Contact& contact,
             const ResponseContext& context)
{
  const bool staticA = pair.a.isStatic();
  const bool staticB = pair.b.isStatic();
  if (staticA && staticB)
  {
    spdlog::warn("CollisionResponse: response requested between two static shapes");
    throw std::logic_error("Cannot resolve a contact between two static shapes");
  }

  const bool initialContact =
    !pair.a.isTouching(pair.handleB) && !pair.b.isTouching(pair.handleA);

  if (!staticA && !staticB)
  {
    impulseResponse(pair.a, pair.b, contact, initialContact, context);
  }
  else if (!staticA)
  {
    staticResponse(
      pair.a, pair.b, contact.normal, contact, initialContact, context);
  }
  else
  {
    staticResponse(pair.b,
                   pair.a,
                   Vector3D{-contact.normal},
                   contact,
                   initialContact,
                   context);
  }

  if (initialContact)
  {
    pair.a.startTouching(pair.handleB);
    pair.b.startTouching(pair.handleA);
    pushEvent(context, ContactEvent::Type::Begin, pair);
    spdlog::debug("CollisionResponse: contact begin, depth {} at ({}, {}, {})",
                  contact.penetrationDepth,
                  contact.contactPoint.x(),
                  contact.contactPoint.y(),
                  contact.contactPoint.z());
  }
}

void notColliding(const ShapePair& pair, const ResponseContext& context)
{
  const bool wasTouching =
    pair.a.isTouching(pair.handleB) || pair.b.isTouching(pair.handleA);
  if (!wasTouching)
  {
    return;
  }

  pair.a.stopTouching(pair.handleB);
  pair.b.stopTouching(pair.handleA);
  pushEvent(context, ContactEvent::Type::End, pair);
  spdlog::debug("CollisionResponse: contact end");
}

void resolve(const ShapePair& pair,
             const std::optional<Contact>& contact,
             const ResponseContext& context)
{
  if (contact)
  {
    respond(pair, *contact, context);
  }
  else
  {
    notColliding(pair, context);
  }
}

}  // namespace rbd_sim::CollisionResponse
