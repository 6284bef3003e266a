#include <algorithm>
#include <iterator>
#include <memory>
#include <utility>
#include <ranges>
#include <vector>

#include "gtest/gtest.h"
#include "intpart/partitioner.hpp"
#include "intpart/partitions.hpp"

namespace {

using parts_t = std::vector<std::size_t>;

static_assert(std::input_iterator<decltype(std::declval<intpart::partitioner<intpart::partitions>&>().begin())>);
static_assert(std::ranges::input_range<intpart::partitioner<intpart::partitions>>);

TEST(Partitioner, range_for) {
  std::vector<parts_t> seen;
  for (auto&& p : intpart::partitioner(intpart::partitions(5)))
    seen.emplace_back(p.begin(), p.end());

  std::vector<parts_t> expected = {
    {1, 1, 1, 1, 1}, {1, 1, 1, 2}, {1, 1, 3}, {1, 2, 2}, {1, 4}, {2, 3}, {5},
  };
  EXPECT_EQ(expected, seen);
}

TEST(Partitioner, count) {
  intpart::partitioner parts(intpart::partitions(12));
  EXPECT_EQ(77u, parts.count());
  EXPECT_EQ(77, std::ranges::distance(parts));
}

TEST(Partitioner, algorithms) {
  intpart::partitioner parts(intpart::partitions(10));
  auto odd_only = std::ranges::count_if(parts, [](auto&& p) {
    return std::ranges::all_of(p, [](std::size_t v) { return v % 2 == 1; });
  });
  // Euler: as many partitions into odd parts as into distinct parts
  intpart::partitioner again(intpart::partitions(10));
  auto distinct = std::ranges::count_if(again, [](auto&& p) {
    return std::ranges::adjacent_find(p) == p.end();
  });
  EXPECT_EQ(10, odd_only);
  EXPECT_EQ(odd_only, distinct);
}

TEST(Partitioner, shared_source) {
  auto gen = std::make_shared<intpart::partitions>(3);
  gen->next();
  intpart::partitioner parts(gen);
  auto it = parts.begin();
  ASSERT_NE(it, parts.end());
  EXPECT_EQ(parts_t({1, 2}), parts_t((*it).begin(), (*it).end()));
  ++it;
  ++it;
  EXPECT_EQ(it, parts.end());
  EXPECT_TRUE(gen->exhausted());
}

TEST(Partitioner, zero) {
  intpart::partitioner parts(intpart::partitions(0));
  auto it = parts.begin();
  ASSERT_NE(it, parts.end());
  EXPECT_TRUE((*it).empty());
  ++it;
  EXPECT_EQ(it, parts.end());
}

} // namespace
