// Ticket: 0013_impulse_collision_response
// Ticket: 0015_contact_events

#ifndef RBD_SIM_PHYSICS_COLLISION_COLLISION_RESPONSE_HPP
#define RBD_SIM_PHYSICS_COLLISION_COLLISION_RESPONSE_HPP

#include <optional>
#include <vector>

#include "rbd-sim/src/DataTypes/Coordinate.hpp"
#include "rbd-sim/src/Physics/Collision/Contact.hpp"
#include "rbd-sim/src/Physics/Collision/ContactEvent.hpp"
#include "rbd-sim/src/Physics/Collision/ShapeHandle.hpp"
#include "rbd-sim/src/Physics/Material/PhysicsMaterial.hpp"

namespace rbd_sim
{

class RigidBody;
class Shape;

/**
 * @brief Two shapes under test, with the handles their touching sets use
 */
struct ShapePair
{
  Shape& a;
  ShapeHandle handleA;
  Shape& b;
  ShapeHandle handleB;
};

/**
 * @brief Values from the owning system that every response reads
 */
struct ResponseContext
{
  Coordinate gravity{0.0, -9.80665, 0.0};
  double fixedTimeStep{0.02};
  /// Receives Begin/End transitions; may be null
  std::vector<ContactEvent>* events{nullptr};
};

/**
 * @brief Stateless impulse-based collision response.
 *
 * Each shape pair moves through a small state machine keyed by mutual
 * touching-set membership:
 *
 * - Initial contact (not yet touching): full position correction and
 *   momentum exchange, then both shapes are marked as touching.
 * - Continued contact (already touching): friction only.
 * - No contact: touching membership is cleared on both sides.
 *
 * Pairs are resolved by mobility:
 *
 * - Dynamic vs dynamic: each body is moved half the penetration apart along
 *   the normal and momenta are exchanged with the restitution-scaled
 *   conservation formula
 *
 *     v1 = e_A (p_A + 2 p_B - m_B v_A) / (m_A + m_B)
 *     v2 = e_B (v_A - v_B) + v1
 *
 *   with A leaving along v_A reflected about -n and B along v_B reflected
 *   about n. The angular exchange uses the same formula with the diagonal
 *   inertia tensors in place of the masses.
 * - Dynamic vs static: the static side has infinite mass. The dynamic body is
 *   moved the full penetration out and its momentum and angular momentum are
 *   reflected about the normal and scaled by the combined restitution.
 * - Static vs static: a programming error.
 *
 * Friction (FrictionModel) is applied to every dynamic body of the pair on
 * both initial and continued contact.
 *
 * @ticket 0013_impulse_collision_response
 */
namespace CollisionResponse
{

/**
 * @brief Separate two dynamic bodies: each moves half the penetration
 *        along ∓normal
 */
void correctDynamicPosition(RigidBody& a,
                            RigidBody& b,
                            const Vector3D& normal,
                            double penetration);

/**
 * @brief Move a dynamic body the full penetration along -normal
 */
void correctStaticPosition(RigidBody& body,
                           const Vector3D& normal,
                           double penetration);

/**
 * @brief Restitution-scaled linear momentum exchange between two bodies
 *
 * A body with zero velocity has no reflection direction; it leaves along
 * -normal (A) or +normal (B).
 */
void correctLinearMotion(RigidBody& a,
                         RigidBody& b,
                         const SurfaceResponse& surfaceA,
                         const SurfaceResponse& surfaceB,
                         const Vector3D& normal);

/**
 * @brief Restitution-scaled angular exchange between two bodies
 *
 * Axes with zero or infinite inertia contribute nothing.
 */
void correctAngularMotion(RigidBody& a,
                          RigidBody& b,
                          const SurfaceResponse& surfaceA,
                          const SurfaceResponse& surfaceB,
                          const Vector3D& normal);

/**
 * @brief Resolve a contact between a dynamic and a static shape
 *
 * @param dynamic Shape with an enabled rigid body
 * @param stationary Static shape
 * @param normal Unit vector from the dynamic shape toward the static one
 * @param contact Penetration and contact point
 * @param initialContact Whether position and momentum are corrected
 */
void staticResponse(Shape& dynamic,
                    const Shape& stationary,
                    const Vector3D& normal,
                    const Contact& contact,
                    bool initialContact,
                    const ResponseContext& context);

/**
 * @brief Resolve a contact between two dynamic shapes
 */
void impulseResponse(Shape& a,
                     Shape& b,
                     const Contact& contact,
                     bool initialContact,
                     const ResponseContext& context);

/**
 * @brief Run the contact state machine for a colliding pair
 *
 * @throws std::logic_error if both shapes are static
 */
void respond(const ShapePair& pair,
             const Contact& contact,
             const ResponseContext& context);

/**
 * @brief Clear touching membership for a pair that no longer collides
 *
 * Queues an End event when the shapes were touching. Never touches either body.
 */
void notColliding(const ShapePair& pair, const ResponseContext& context);

/**
 * @brief respond() when a contact is present, notColliding() otherwise
 */
void resolve(const ShapePair& pair,
             const std::optional<Contact>& contact,
             const ResponseContext& context);

}  // namespace CollisionResponse

}  // namespace rbd_sim

#endif  // RBD_SIM_PHYSICS_COLLISION_COLLISION_RESPONSE_HPP
