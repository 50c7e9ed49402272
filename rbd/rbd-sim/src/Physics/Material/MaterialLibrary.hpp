// Ticket: 0007_material_provider

#ifndef RBD_SIM_PHYSICS_MATERIAL_MATERIAL_LIBRARY_HPP
#define RBD_SIM_PHYSICS_MATERIAL_MATERIAL_LIBRARY_HPP

#include <cstddef>
#include <string>
#include <unordered_map>

#include "rbd-sim/src/Physics/Material/MaterialProvider.hpp"

namespace rbd_sim
{

/**
 * @brief In-memory MaterialProvider keyed by identifier
 */
class MaterialLibrary final : public MaterialProvider
{
public:
  MaterialLibrary() = default;

  /**
   * @brief Add or replace the material stored under an identifier
   *
   * @throws std::invalid_argument if the identifier is empty
   */
  void addMaterial(const std::string& identifier,
                   const PhysicsMaterial& material);

  /**
   * @return true if a material was removed
   */
  bool removeMaterial(const std::string& identifier);

  [[nodiscard]] bool contains(const std::string& identifier) const;

  [[nodiscard]] size_t size() const
  {
    return materials_.size();
  }

  [[nodiscard]] std::optional<PhysicsMaterial> lookup(
    const std::string& identifier) const override;

private:
  std::unordered_map<std::string, PhysicsMaterial> materials_;
};

}  // namespace rbd_sim

#endif  // RBD_SIM_PHYSICS_MATERIAL_MATERIAL_LIBRARY_HPP
