// Ticket: 0007_material_provider

#include <gtest/gtest.h>
#include <stdexcept>

#include "rbd-sim/src/Physics/Material/MaterialLibrary.hpp"

using namespace rbd_sim;

TEST(MaterialLibraryTest, lookup_MissingReturnsNullopt)
{
  const MaterialLibrary library;
  EXPECT_FALSE(library.lookup("ice").has_value());
}

TEST(MaterialLibraryTest, addMaterial_LookupReturnsCopy)
{
  MaterialLibrary library;
  library.addMaterial("rubber", PhysicsMaterial{0.8, 1.0, 0.9});

  const std::optional<PhysicsMaterial> rubber = library.lookup("rubber");
  ASSERT_TRUE(rubber.has_value());
  EXPECT_DOUBLE_EQ(0.8, rubber->getKineticFriction());
  EXPECT_DOUBLE_EQ(1.0, rubber->getStaticFriction());
  EXPECT_DOUBLE_EQ(0.9, rubber->getRestitution());
  EXPECT_TRUE(library.contains("rubber"));
  EXPECT_EQ(1u, library.size());
}

TEST(MaterialLibraryTest, addMaterial_ReplacesExisting)
{
  MaterialLibrary library;
  library.addMaterial("steel", PhysicsMaterial{0.4, 0.6, 0.5});
  library.addMaterial("steel", PhysicsMaterial{0.1, 0.2, 0.3});

  EXPECT_EQ(1u, library.size());
  EXPECT_DOUBLE_EQ(0.1, library.lookup("steel")->getKineticFriction());
}

TEST(MaterialLibraryTest, addMaterial_EmptyIdentifierThrows)
{
  MaterialLibrary library;
  EXPECT_THROW(library.addMaterial("", PhysicsMaterial{}), std::invalid_argument);
}

TEST(MaterialLibraryTest, removeMaterial)
{
  MaterialLibrary library;
  library.addMaterial("wood", PhysicsMaterial{});

  EXPECT_TRUE(library.removeMaterial("wood"));
  EXPECT_FALSE(library.removeMaterial("wood"));
  EXPECT_FALSE(library.contains("wood"));
}

TEST(MaterialLibraryTest, usableThroughProviderInterface)
{
  MaterialLibrary library;
  library.addMaterial("ice", PhysicsMaterial{0.02, 0.05, 0.1});

  const MaterialProvider& provider = library;
  ASSERT_TRUE(provider.lookup("ice").has_value());
  EXPECT_DOUBLE_EQ(0.02, provider.lookup("ice")->getKineticFriction());
}
