// Ticket: 0002_vector_datatypes

#ifndef RBD_SIM_DATATYPES_COORDINATE_HPP
#define RBD_SIM_DATATYPES_COORDINATE_HPP

#include "rbd-sim/src/DataTypes/Vec3DBase.hpp"

namespace rbd_sim
{

/**
 * @brief A point in world or body-local space [m]
 *
 * Used for body positions, shape center offsets, contact points and the
 * gravity vector. Inherits the full Eigen::Vector3d interface.
 */
struct Coordinate final : detail::Vec3DBase<Coordinate>
{
  using Vec3DBase::Vec3DBase;
  using Vec3DBase::operator=;

  template <typename OtherDerived>
  // NOLINTNEXTLINE(google-explicit-constructor)
  Coordinate(const Eigen::MatrixBase<OtherDerived>& other) : Vec3DBase{other}
  {
  }

  Coordinate(const Coordinate&) = default;
  Coordinate(Coordinate&&) noexcept = default;
  Coordinate& operator=(const Coordinate&) = default;
  Coordinate& operator=(Coordinate&&) noexcept = default;
  ~Coordinate() = default;
};

}  // namespace rbd_sim

#endif  // RBD_SIM_DATATYPES_COORDINATE_HPP
