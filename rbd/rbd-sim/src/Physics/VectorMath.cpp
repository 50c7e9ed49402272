// Ticket: 0003_vector_math_layer

#include "rbd-sim/src/Physics/VectorMath.hpp"

#include <algorithm>
#include <cmath>

namespace rbd_sim::VectorMath
{

namespace
{

double finiteOrZero(double value)
{
  return std::isfinite(value) ? value : 0.0;
}

}  // namespace

Vector3D multiply(const Vector3D& a, const Vector3D& b)
{
  return Vector3D{a.cwiseProduct(b)};
}

Vector3D divide(const Vector3D& a, const Vector3D& b)
{
  Vector3D result;
  for (Eigen::Index i = 0; i < 3; ++i)
  {
    result[i] = (b[i] == 0.0) ? 0.0 : a[i] / b[i];
  }
  return result;
}

Eigen::Quaterniond addQuaternions(const Eigen::Quaterniond& a,
                                  const Eigen::Quaterniond& b)
{
  Eigen::Quaterniond result;
  result.coeffs() = a.coeffs() + b.coeffs();
  return result;
}

Eigen::Quaterniond scaleQuaternion(const Eigen::Quaterniond& q, double scale)
{
  Eigen::Quaterniond result;
  result.coeffs() = q.coeffs() * scale;
  return result;
}

Vector3D reflect(const Vector3D& v, const Vector3D& normal)
{
  return Vector3D{v - 2.0 * v.projectedOnto(normal)};
}

Vector3D normalizedOrZero(const Vector3D& v)
{
  if (v.isShorterThan(kNormalizeEpsilon))
  {
    return Vector3D::zero();
  }
  return Vector3D{v / v.norm()};
}

double angleBetween(const Vector3D& a, const Vector3D& b)
{
  const double denominator = a.norm() * b.norm();
  if (denominator < 1e-15)
  {
    return 0.0;
  }
  const double cosine = std::clamp(a.dot(b) / denominator, -1.0, 1.0);
  return std::acos(cosine);
}

Vector3D integrateForce(const Vector3D& momentum, double mass)
{
  return Vector3D{momentum / mass};
}

Vector3D integrateMomentum(const Vector3D& angularMomentum,
                           const Vector3D& inertia)
{
  Vector3D omega = divide(angularMomentum, inertia);
  for (Eigen::Index i = 0; i < 3; ++i)
  {
    omega[i] = finiteOrZero(omega[i]);
  }
  return omega;
}

Vector3D deriveMomentum(const Vector3D& angularVelocity, const Vector3D& inertia)
{
  Vector3D momentum;
  for (Eigen::Index i = 0; i < 3; ++i)
  {
    momentum[i] =
      std::isfinite(inertia[i]) ? angularVelocity[i] * inertia[i] : 0.0;
  }
  return momentum;
}

Eigen::Quaterniond deriveSpin(const Vector3D& angularVelocity,
                              const Eigen::Quaterniond& orientation)
{
  const Eigen::Quaterniond omega{
    0.0, angularVelocity.x(), angularVelocity.y(), angularVelocity.z()};
  return scaleQuaternion(omega * orientation, 0.5);
}

}  // namespace rbd_sim::VectorMath
