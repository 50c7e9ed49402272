// Ticket: 0006_material_combination

#ifndef RBD_SIM_PHYSICS_MATERIAL_PHYSICS_MATERIAL_HPP
#define RBD_SIM_PHYSICS_MATERIAL_PHYSICS_MATERIAL_HPP

#include <cstdint>
#include <string>

namespace rbd_sim
{

/**
 * @brief How two surface coefficients are merged into one
 */
enum class CombineRule : uint8_t
{
  Average,
  Multiply,
  Maximum,
  Minimum
};

[[nodiscard]] std::string toString(CombineRule rule);

/**
 * @brief Combine two raw coefficients under a rule
 *
 * @throws std::logic_error for an unrecognized rule value
 */
[[nodiscard]] double combineCoefficients(double lhs,
                                         double rhs,
                                         CombineRule rule);

/**
 * @brief Coefficients one side of a contact responds with after combination
 */
struct SurfaceResponse
{
  double kineticFriction{0.0};
  double staticFriction{0.0};
  double restitution{1.0};
};

/**
 * @brief Per-side result of combining the two materials of a contact
 */
struct CombinedMaterial
{
  SurfaceResponse lhs;
  SurfaceResponse rhs;
};

/**
 * @brief Friction and restitution properties of a surface.
 *
 * Combination is directional: each side merges its own coefficient with the
 * other side's raw coefficient using its own rule, so two surfaces in
 * contact may respond with different coefficients.
 *
 * Defaults: kinetic 0.5, static 0.5, restitution 0.5, both rules Average.
 *
 * @ticket 0006_material_combination
 */
class PhysicsMaterial
{
public:
  PhysicsMaterial() = default;

  /**
   * @throws std::invalid_argument if a coefficient is out of range
   */
  PhysicsMaterial(double kineticFriction,
                  double staticFriction,
                  double restitution,
                  CombineRule frictionRule = CombineRule::Average,
                  CombineRule restitutionRule = CombineRule::Average);

  [[nodiscard]] double getKineticFriction() const
  {
    return kineticFriction_;
  }
  [[nodiscard]] double getStaticFriction() const
  {
    return staticFriction_;
  }
  [[nodiscard]] double getRestitution() const
  {
    return restitution_;
  }
  [[nodiscard]] CombineRule getFrictionRule() const
  {
    return frictionRule_;
  }
  [[nodiscard]] CombineRule getRestitutionRule() const
  {
    return restitutionRule_;
  }

  /**
   * @param mu Kinetic friction coefficient [0, inf)
   * @throws std::invalid_argument if mu < 0
   */
  void setKineticFriction(double mu);

  /**
   * @param mu Static friction coefficient [0, inf)
   * @throws std::invalid_argument if mu < 0
   */
  void setStaticFriction(double mu);

  /**
   * @param e Coefficient of restitution [0, 1]
   * @throws std::invalid_argument if e not in [0, 1]
   */
  void setRestitution(double e);

  void setFrictionRule(CombineRule rule)
  {
    frictionRule_ = rule;
  }
  void setRestitutionRule(CombineRule rule)
  {
    restitutionRule_ = rule;
  }

  /**
   * @brief This surface's response against another surface
   *
   * @param other The opposing surface, or nullptr to use this surface's raw
   *        coefficients
   */
  [[nodiscard]] SurfaceResponse respondTo(const PhysicsMaterial* other) const;

  bool operator==(const PhysicsMaterial&) const = default;

private:
  double kineticFriction_{0.5};
  double staticFriction_{0.5};
  double restitution_{0.5};
  CombineRule frictionRule_{CombineRule::Average};
  CombineRule restitutionRule_{CombineRule::Average};
};

/**
 * @brief Combine the (possibly absent) materials of both sides of a contact
 *
 * Both present: each side responds to the other. One present: both sides use
 * that material's raw coefficients. None present: restitution 1, no friction.
 */
[[nodiscard]] CombinedMaterial combine(const PhysicsMaterial* lhs,
                                       const PhysicsMaterial* rhs);

/// Kinetic friction `self` responds with; 0 when both are absent
[[nodiscard]] double combinedKineticFriction(const PhysicsMaterial* self,
                                             const PhysicsMaterial* other);

/// Static friction `self` responds with; 0 when both are absent
[[nodiscard]] double combinedStaticFriction(const PhysicsMaterial* self,
                                            const PhysicsMaterial* other);

/// Restitution `self` responds with; 1 when both are absent
[[nodiscard]] double combinedRestitution(const PhysicsMaterial* self,
                                         const PhysicsMaterial* other);

}  // namespace rbd_sim

#endif  // RBD_SIM_PHYSICS_MATERIAL_PHYSICS_MATERIAL_HPP
