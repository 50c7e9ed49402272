// Ticket: 0012_narrow_phase

#ifndef RBD_SIM_PHYSICS_COLLISION_NARROW_PHASE_HPP
#define RBD_SIM_PHYSICS_COLLISION_NARROW_PHASE_HPP

#include <optional>

#include "rbd-sim/src/Physics/Collision/Contact.hpp"
#include "rbd-sim/src/Physics/Collision/Shape.hpp"

namespace rbd_sim
{

/**
 * @brief Pairwise intersection tests for the shape variants.
 *
 * Each test is a pure function of the two shapes' world state. Dispatch goes
 * through a table indexed by the (kind of A, kind of B) pair; the returned
 * Contact is always expressed in argument order.
 *
 * @ticket 0012_narrow_phase
 */
namespace NarrowPhase
{

/// Normal used when two sphere centers coincide
inline const Vector3D kFallbackNormal{0.0, 0.0, 1.0};

using TestFunction = std::optional<Contact> (*)(const Shape&, const Shape&);

/**
 * @brief Sphere A against sphere B
 *
 * Collides when |B - A|² <= (rA + rB)². normal = (B - A) / |B - A|
 * (kFallbackNormal when the centers coincide), penetration = rA + rB - |B - A|,
 * contact point = A + normal (rA - penetration).
 */
[[nodiscard]] std::optional<Contact> sphereOnSphere(const Shape& a,
                                                    const Shape& b);

/**
 * @brief Sphere against plane
 *
 * d = sphere · up - plane · up; collides when |d| < r. normal = -up when
 * d >= 0 and +up behind the plane, penetration = r - |d|,
 * contact point = sphere + normal · penetration.
 */
[[nodiscard]] std::optional<Contact> sphereOnPlane(const Shape& sphere,
                                                   const Shape& plane);

/**
 * @brief Plane against sphere: sphereOnPlane with the normal reversed
 */
[[nodiscard]] std::optional<Contact> planeOnSphere(const Shape& plane,
                                                   const Shape& sphere);

/**
 * @brief Plane against plane: never produces a contact
 */
[[nodiscard]] std::optional<Contact> planeOnPlane(const Shape& a,
                                                  const Shape& b);

/**
 * @brief Look up the test for a kind pair
 */
[[nodiscard]] TestFunction dispatch(ShapeKind a, ShapeKind b);

/**
 * @brief Test any two shapes through the dispatch table
 */
[[nodiscard]] std::optional<Contact> test(const Shape& a, const Shape& b);

}  // namespace NarrowPhase

}  // namespace rbd_sim

#endif  // RBD_SIM_PHYSICS_COLLISION_NARROW_PHASE_HPP
