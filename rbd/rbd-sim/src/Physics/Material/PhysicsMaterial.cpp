// Ticket: 0006_material_combination

#include "rbd-sim/src/Physics/Material/PhysicsMaterial.hpp"

#include <algorithm>
#include <stdexcept>

namespace rbd_sim
{

std::string toString(CombineRule rule)
{
  switch (rule)
  {
    case CombineRule::Average:
      return "Average";
    case CombineRule::Multiply:
      return "Multiply";
    case CombineRule::Maximum:
      return "Maximum";
    case CombineRule::Minimum:
      return "Minimum";
  }
  return "Unknown";
}

double combineCoefficients(double lhs, double rhs, CombineRule rule)
{
  switch (rule)
  {
    case CombineRule::Average:
      return (lhs + rhs) / 2.0;
    case CombineRule::Multiply:
      return lhs * rhs;
    case CombineRule::Maximum:
      return std::max(lhs, rhs);
    case CombineRule::Minimum:
      return std::min(lhs, rhs);
  }
  throw std::logic_error(
    "Unrecognized combine rule: " +
    std::to_string(static_cast<int>(rule)));
}

PhysicsMaterial::PhysicsMaterial(double kineticFriction,
                                 double staticFriction,
                                 double restitution,
                                 CombineRule frictionRule,
                                 CombineRule restitutionRule)
  : frictionRule_{frictionRule}, restitutionRule_{restitutionRule}
{
  setKineticFriction(kineticFriction);
  setStaticFriction(staticFriction);
  setRestitution(restitution);
}

void PhysicsMaterial::setKineticFriction(double mu)
{
  if (mu < 0.0)
  {
    throw std::invalid_argument(
      "Kinetic friction must be non-negative, got: " + std::to_string(mu));
  }
  kineticFriction_ = mu;
}

void PhysicsMaterial::setStaticFriction(double mu)
{
  if (mu < 0.0)
  {
    throw std::invalid_argument(
      "Static friction must be non-negative, got: " + std::to_string(mu));
  }
  staticFriction_ = mu;
}

void PhysicsMaterial::setRestitution(double e)
{
  if (e < 0.0 || e > 1.0)
  {
    throw std::invalid_argument(
      "Coefficient of restitution must be in [0, 1], got: " +
      std::to_string(e));
  }
  restitution_ = e;
}

SurfaceResponse PhysicsMaterial::respondTo(const PhysicsMaterial* other) const
{
  if (other == nullptr)
  {
    return SurfaceResponse{.kineticFriction = kineticFriction_,
                           .staticFriction = staticFriction_,
                           .restitution = restitution_};
  }

  return SurfaceResponse{
    .kineticFriction = combineCoefficients(
      kineticFriction_, other->kineticFriction_, frictionRule_),
    .staticFriction = combineCoefficients(
      staticFriction_, other->staticFriction_, frictionRule_),
    .restitution =
      combineCoefficients(restitution_, other->restitution_, restitutionRule_)};
}

CombinedMaterial combine(const PhysicsMaterial* lhs, const PhysicsMaterial* rhs)
{
  if (lhs != nullptr)
  {
    const SurfaceResponse a = lhs->respondTo(rhs);
    const SurfaceResponse b = (rhs != nullptr) ? rhs->respondTo(lhs) : a;
    return CombinedMaterial{.lhs = a, .rhs = b};
  }

  if (rhs != nullptr)
  {
    const CombinedMaterial swapped = combine(rhs, lhs);
    return CombinedMaterial{.lhs = swapped.rhs, .rhs = swapped.lhs};
  }

  return CombinedMaterial{};
}

double combinedKineticFriction(const PhysicsMaterial* self,
                               const PhysicsMaterial* other)
{
  if (self != nullptr)
  {
    return self->respondTo(other).kineticFriction;
  }
  return (other != nullptr) ? other->getKineticFriction() : 0.0;
}

double combinedStaticFriction(const PhysicsMaterial* self,
                              const PhysicsMaterial* other)
{
  if (self != nullptr)
  {
    return self->respondTo(other).staticFriction;
  }
  return (other != nullptr) ? other->getStaticFriction() : 0.0;
}

double combinedRestitution(const PhysicsMaterial* self,
                           const PhysicsMaterial* other)
{
  if (self != nullptr)
  {
    return self->respondTo(other).restitution;
  }
  return (other != nullptr) ? other->getRestitution() : 1.0;
}

}  // namespace rbd_sim
