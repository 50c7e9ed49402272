// Ticket: 0007_material_provider

#ifndef RBD_SIM_PHYSICS_MATERIAL_MATERIAL_PROVIDER_HPP
#define RBD_SIM_PHYSICS_MATERIAL_MATERIAL_PROVIDER_HPP

#include <optional>
#include <string>

#include "rbd-sim/src/Physics/Material/PhysicsMaterial.hpp"

namespace rbd_sim
{

/**
 * @brief Lookup of surface materials by identifier
 *
 * Shapes that name a material identifier resolve it once, when they are
 * registered with a PhysicsSystem.
 */
class MaterialProvider
{
public:
  virtual ~MaterialProvider() = default;

  /**
   * @return The material registered under the identifier, or std::nullopt
   */
  [[nodiscard]] virtual std::optional<PhysicsMaterial> lookup(
    const std::string& identifier) const = 0;

protected:
  MaterialProvider() = default;
  MaterialProvider(const MaterialProvider&) = default;
  MaterialProvider& operator=(const MaterialProvider&) = default;
  MaterialProvider(MaterialProvider&&) noexcept = default;
  MaterialProvider& operator=(MaterialProvider&&) noexcept = default;
};

}  // namespace rbd_sim

#endif  // RBD_SIM_PHYSICS_MATERIAL_MATERIAL_PROVIDER_HPP
