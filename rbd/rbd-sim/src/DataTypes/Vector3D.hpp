// Ticket: 0002_vector_datatypes
// Generic 3D vector wrapper

#ifndef RBD_SIM_DATATYPES_VECTOR3D_HPP
#define RBD_SIM_DATATYPES_VECTOR3D_HPP

#include "rbd-sim/src/DataTypes/Vec3DBase.hpp"

namespace rbd_sim
{

/**
 * @brief Generic 3D vector type
 *
 * Used for directions and rates: momentum, forces, torques, normals,
 * diagonal inertia tensors and scale factors. For positions prefer
 * Coordinate.
 *
 * Memory footprint: 24 bytes (same as Eigen::Vector3d)
 */
struct Vector3D final : detail::Vec3DBase<Vector3D>
{
  using Vec3DBase::Vec3DBase;
  using Vec3DBase::operator=;

  template <typename OtherDerived>
  // NOLINTNEXTLINE(google-explicit-constructor)
  Vector3D(const Eigen::MatrixBase<OtherDerived>& other) : Vec3DBase{other}
  {
  }

  Vector3D(const Vector3D&) = default;
  Vector3D(Vector3D&&) noexcept = default;
  Vector3D& operator=(const Vector3D&) = default;
  Vector3D& operator=(Vector3D&&) noexcept = default;
  ~Vector3D() = default;
};

}  // namespace rbd_sim

#endif  // RBD_SIM_DATATYPES_VECTOR3D_HPP
