// Ticket: 0003_vector_math_layer

#ifndef RBD_SIM_PHYSICS_VECTOR_MATH_HPP
#define RBD_SIM_PHYSICS_VECTOR_MATH_HPP

#include <Eigen/Geometry>

#include "rbd-sim/src/DataTypes/Vector3D.hpp"

namespace rbd_sim
{

/**
 * @brief Minimal explicit vector and quaternion arithmetic.
 *
 * Component-wise operations are free functions rather than operator
 * overloads so that call sites state which product they mean. Quaternion
 * addition and scaling treat the quaternion as a plain 4-vector in Eigen's
 * (x, y, z, w) coefficient order.
 *
 * All functions are pure and deterministic.
 */
namespace VectorMath
{

/// Vectors shorter than this are treated as zero when normalizing
inline constexpr double kNormalizeEpsilon = 1e-5;

/**
 * @brief Component-wise product a ⊙ b
 */
[[nodiscard]] Vector3D multiply(const Vector3D& a, const Vector3D& b);

/**
 * @brief Component-wise quotient a ⊘ b
 *
 * Axes whose divisor is exactly zero yield zero instead of infinity.
 */
[[nodiscard]] Vector3D divide(const Vector3D& a, const Vector3D& b);

/**
 * @brief Component-wise quaternion sum (not a rotation composition)
 */
[[nodiscard]] Eigen::Quaterniond addQuaternions(const Eigen::Quaterniond& a,
                                                const Eigen::Quaterniond& b);

/**
 * @brief Component-wise quaternion scaling (not a rotation)
 */
[[nodiscard]] Eigen::Quaterniond scaleQuaternion(const Eigen::Quaterniond& q,
                                                 double scale);

/**
 * @brief Reflect a vector about a plane with the given unit normal
 *
 * reflect(v, n) = v - 2 (v · n) n
 */
[[nodiscard]] Vector3D reflect(const Vector3D& v, const Vector3D& normal);

/**
 * @brief Unit vector along v, or the zero vector when |v| < kNormalizeEpsilon
 */
[[nodiscard]] Vector3D normalizedOrZero(const Vector3D& v);

/**
 * @brief Unsigned angle between two vectors [rad]
 *
 * @return Angle in [0, π]; zero when either vector is degenerate
 */
[[nodiscard]] double angleBetween(const Vector3D& a, const Vector3D& b);

/**
 * @brief Derivative of position from momentum: p / m
 */
[[nodiscard]] Vector3D integrateForce(const Vector3D& momentum, double mass);

/**
 * @brief Angular velocity from angular momentum and a diagonal inertia tensor
 *
 * Axes with zero or infinite inertia contribute zero angular velocity.
 */
[[nodiscard]] Vector3D integrateMomentum(const Vector3D& angularMomentum,
                                         const Vector3D& inertia);

/**
 * @brief Angular momentum from angular velocity and a diagonal inertia tensor
 *
 * Axes with infinite inertia contribute zero angular momentum.
 */
[[nodiscard]] Vector3D deriveMomentum(const Vector3D& angularVelocity,
                                      const Vector3D& inertia);

/**
 * @brief Quaternion derivative Q̇ = ½ [0, ω] ⊗ Q
 *
 * @param angularVelocity World-frame angular velocity ω [rad/s]
 * @param orientation Current orientation Q
 * @return Q̇ stored as a (non-unit) quaternion
 */
[[nodiscard]] Eigen::Quaterniond deriveSpin(const Vector3D& angularVelocity,
                                            const Eigen::Quaterniond& orientation);

}  // namespace VectorMath

}  // namespace rbd_sim

#endif  // RBD_SIM_PHYSICS_VECTOR_MATH_HPP
