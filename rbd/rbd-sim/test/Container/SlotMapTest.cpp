// Ticket: 0005_generational_arena

#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "rbd-sim/src/Container/SlotMap.hpp"

using namespace rbd_sim;

namespace
{

// Non-hashable, non-comparable payload
struct Payload
{
  std::vector<int> data;
};

}  // anonymous namespace

// ============================================================================
// Insertion and lookup
// ============================================================================

TEST(SlotMapTest, insert_FindReturnsValue)
{
  SlotMap<std::string> map;
  const SlotHandle handle = map.insert("alpha");

  ASSERT_NE(nullptr, map.find(handle));
  EXPECT_EQ("alpha", *map.find(handle));
  EXPECT_TRUE(map.contains(handle));
  EXPECT_EQ(1u, map.size());
}

TEST(SlotMapTest, defaultHandle_IsNullAndNotContained)
{
  SlotMap<int> map;
  map.insert(1);

  const SlotHandle handle{};
  EXPECT_TRUE(handle.isNull());
  EXPECT_FALSE(map.contains(handle));
  EXPECT_EQ(nullptr, map.find(handle));
}

TEST(SlotMapTest, storesNonHashableValues)
{
  SlotMap<Payload> map;
  const SlotHandle handle = map.insert(Payload{{1, 2, 3}});

  ASSERT_NE(nullptr, map.find(handle));
  EXPECT_EQ(3u, map.find(handle)->data.size());
}

// ============================================================================
// Removal
// ============================================================================

TEST(SlotMapTest, erase_InvalidatesHandle)
{
  SlotMap<int> map;
  const SlotHandle handle = map.insert(7);

  EXPECT_TRUE(map.erase(handle));
  EXPECT_FALSE(map.contains(handle));
  EXPECT_EQ(nullptr, map.find(handle));
  EXPECT_TRUE(map.empty());
}

TEST(SlotMapTest, erase_StaleHandleIsNoOp)
{
  SlotMap<int> map;
  const SlotHandle handle = map.insert(7);
  ASSERT_TRUE(map.erase(handle));

  EXPECT_FALSE(map.erase(handle));
  EXPECT_EQ(0u, map.size());
}

TEST(SlotMapTest, reusedSlot_OldHandleStaysStale)
{
  SlotMap<int> map;
  const SlotHandle first = map.insert(1);
  ASSERT_TRUE(map.erase(first));

  const SlotHandle second = map.insert(2);
  EXPECT_EQ(first.index, second.index);
  EXPECT_NE(first.generation, second.generation);

  EXPECT_EQ(nullptr, map.find(first));
  ASSERT_NE(nullptr, map.find(second));
  EXPECT_EQ(2, *map.find(second));
}

TEST(SlotMapTest, erase_LastValueFillsHoleAndKeepsHandle)
{
  SlotMap<int> map;
  const SlotHandle a = map.insert(10);
  const SlotHandle b = map.insert(20);
  const SlotHandle c = map.insert(30);

  ASSERT_TRUE(map.erase(a));

  // Dense order after swap-and-pop: 30, 20
  ASSERT_EQ(2u, map.size());
  EXPECT_EQ(30, map[0]);
  EXPECT_EQ(20, map[1]);

  ASSERT_NE(nullptr, map.find(b));
  ASSERT_NE(nullptr, map.find(c));
  EXPECT_EQ(20, *map.find(b));
  EXPECT_EQ(30, *map.find(c));
  EXPECT_EQ(c, map.handleAt(0));
  EXPECT_EQ(b, map.handleAt(1));
}

// ============================================================================
// Iteration
// ============================================================================

TEST(SlotMapTest, iteration_FollowsInsertionOrder)
{
  SlotMap<int> map;
  for (int i = 0; i < 5; ++i)
  {
    map.insert(i);
  }

  std::vector<int> visited;
  for (int value : map)
  {
    visited.push_back(value);
  }
  EXPECT_EQ((std::vector<int>{0, 1, 2, 3, 4}), visited);
}

TEST(SlotMapTest, clear_InvalidatesEveryHandle)
{
  SlotMap<int> map;
  const SlotHandle a = map.insert(1);
  const SlotHandle b = map.insert(2);

  map.clear();

  EXPECT_TRUE(map.empty());
  EXPECT_FALSE(map.contains(a));
  EXPECT_FALSE(map.contains(b));

  const SlotHandle c = map.insert(3);
  EXPECT_TRUE(map.contains(c));
  EXPECT_EQ(1u, map.size());
}
