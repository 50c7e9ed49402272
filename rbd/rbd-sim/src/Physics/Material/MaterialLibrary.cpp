// Ticket: 0007_material_provider

#include "rbd-sim/src/Physics/Material/MaterialLibrary.hpp"

#include <stdexcept>

#include <spdlog/spdlog.h>

namespace rbd_sim
{

void MaterialLibrary::addMaterial(const std::string& identifier,
                                  const PhysicsMaterial& material)
{
  if (identifier.empty())
  {
    throw std::invalid_argument("Material identifier must not be empty");
  }

  const auto [it, inserted] = materials_.insert_or_assign(identifier, material);
  if (!inserted)
  {
    spdlog::debug("MaterialLibrary: replaced material '{}'", it->first);
  }
}

bool MaterialLibrary::removeMaterial(const std::string& identifier)
{
  return materials_.erase(identifier) > 0;
}

bool MaterialLibrary::contains(const std::string& identifier) const
{
  return materials_.contains(identifier);
}

std::optional<PhysicsMaterial> MaterialLibrary::lookup(
  const std::string& identifier) const
{
  auto it = materials_.find(identifier);
  if (it == materials_.end())
  {
    return std::nullopt;
  }
  return it->second;
}

}  // namespace rbd_sim
