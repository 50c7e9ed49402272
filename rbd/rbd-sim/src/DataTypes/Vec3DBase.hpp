// Ticket: 0002_vector_datatypes

#ifndef RBD_SIM_DATATYPES_VEC3D_BASE_HPP
#define RBD_SIM_DATATYPES_VEC3D_BASE_HPP

// NOLINTBEGIN(bugprone-crtp-constructor-accessibility)

#include <Eigen/Dense>

namespace rbd_sim::detail
{

/**
 * @brief Shared storage and contact-geometry helpers for Coordinate and
 *        Vector3D
 *
 * Both strong types are an Eigen::Vector3d underneath, so Eigen expressions
 * convert into either one implicitly. The helpers below return the derived
 * type so a Coordinate stays a Coordinate through a projection.
 *
 * @tparam Derived Coordinate or Vector3D
 */
template <typename Derived>
class Vec3DBase : public Eigen::Vector3d
{
public:
  Vec3DBase() : Eigen::Vector3d{0.0, 0.0, 0.0}
  {
  }

  Vec3DBase(double x, double y, double z) : Eigen::Vector3d{x, y, z}
  {
  }

  template <typename OtherDerived>
  // NOLINTNEXTLINE(google-explicit-constructor)
  Vec3DBase(const Eigen::MatrixBase<OtherDerived>& other)
    : Eigen::Vector3d{other}
  {
  }

  template <typename OtherDerived>
  Vec3DBase& operator=(const Eigen::MatrixBase<OtherDerived>& other)
  {
    this->Eigen::Vector3d::operator=(other);
    return *this;
  }

  [[nodiscard]] static Derived zero()
  {
    return Derived{0.0, 0.0, 0.0};
  }

  /// Signed length along a unit axis
  [[nodiscard]] double componentAlong(const Eigen::Vector3d& axis) const
  {
    return this->dot(axis);
  }

  /// Part of this vector parallel to a unit axis
  [[nodiscard]] Derived projectedOnto(const Eigen::Vector3d& axis) const
  {
    return Derived{axis * componentAlong(axis)};
  }

  /// False if any component is NaN or infinite
  [[nodiscard]] bool isFinite() const
  {
    return this->allFinite();
  }

  /// |v| < length, compared without a square root
  [[nodiscard]] bool isShorterThan(double length) const
  {
    return this->squaredNorm() < length * length;
  }

  Vec3DBase(const Vec3DBase&) = default;
  Vec3DBase(Vec3DBase&&) noexcept = default;
  Vec3DBase& operator=(const Vec3DBase&) = default;
  Vec3DBase& operator=(Vec3DBase&&) noexcept = default;
  ~Vec3DBase() = default;
};

}  // namespace rbd_sim::detail

// NOLINTEND(bugprone-crtp-constructor-accessibility)

#endif  // RBD_SIM_DATATYPES_VEC3D_BASE_HPP
