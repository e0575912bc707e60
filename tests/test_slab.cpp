#include <gtest/gtest.h>

#include <memory>
#include <string>

#include "core/slab.hpp"

using namespace ferry;

// --- SlabTest ---

TEST(SlabTest, InsertAndGet) {
  Slab<std::string> slab;

  auto a = slab.insert("a");
  auto b = slab.insert("b");

  EXPECT_NE(a, b);
  EXPECT_EQ(slab.size(), 2u);
  ASSERT_NE(slab.get(a), nullptr);
  EXPECT_EQ(*slab.get(a), "a");
  EXPECT_EQ(*slab.get(b), "b");
}

TEST(SlabTest, RemoveFreesKey) {
  Slab<std::string> slab;

  auto a = slab.insert("a");
  slab.insert("b");

  EXPECT_EQ(slab.remove(a), "a");
  EXPECT_FALSE(slab.contains(a));
  EXPECT_EQ(slab.get(a), nullptr);
  EXPECT_EQ(slab.size(), 1u);

  // 释放的键会被复用
  EXPECT_EQ(slab.vacant_key(), a);
  EXPECT_EQ(slab.insert("c"), a);
  EXPECT_EQ(*slab.get(a), "c");
}

TEST(SlabTest, RemoveMissingThrows) {
  Slab<int> slab;

  EXPECT_THROW(slab.remove(3), std::out_of_range);

  auto key = slab.insert(1);
  slab.remove(key);
  EXPECT_THROW(slab.remove(key), std::out_of_range);
}

TEST(SlabTest, MoveOnlyValues) {
  Slab<std::unique_ptr<int>> slab;

  auto key = slab.insert(std::make_unique<int>(42));
  int* raw = slab.get(key)->get();

  // Growing the slab doesn't move the pointee
  for (int i = 0; i < 100; ++i) {
    slab.insert(std::make_unique<int>(i));
  }
  EXPECT_EQ(slab.get(key)->get(), raw);
  EXPECT_EQ(*slab.remove(key), 42);
}

TEST(SlabTest, ForEachAndClear) {
  Slab<int> slab;
  slab.insert(1);
  auto two = slab.insert(2);
  slab.insert(3);
  slab.remove(two);

  int sum = 0;
  std::size_t visited = 0;
  slab.for_each([&](std::size_t, int& value) {
    sum += value;
    ++visited;
  });
  EXPECT_EQ(sum, 4);
  EXPECT_EQ(visited, 2u);

  slab.clear();
  EXPECT_TRUE(slab.empty());
  EXPECT_EQ(slab.vacant_key(), 0u);
}
