#include <algorithm>
#include <stdexcept>
#include <vector>

#include "gtest/gtest.h"
#include "intpart/configuration.hpp"
#include "intpart/partition_count.hpp"

namespace {

TEST(PartitionCount, small) {
  std::vector<std::uint64_t> expected = {1, 1, 2, 3, 5, 7, 11, 15, 22, 30, 42};
  EXPECT_EQ(expected, intpart::partition_counts(10));
  EXPECT_EQ(1u, intpart::partition_count(0));
  EXPECT_EQ(204226u, intpart::partition_count(50));
}

TEST(PartitionCount, large) {
  EXPECT_EQ(190569292u, intpart::partition_count(100));
  EXPECT_EQ(3972999029388u, intpart::partition_count(200));
}

TEST(PartitionCount, increasing) {
  auto p = intpart::partition_counts(intpart::Static::max_countable_n());
  ASSERT_EQ(intpart::Static::max_countable_n() + 1, p.size());
  EXPECT_TRUE(std::ranges::is_sorted(p));
  EXPECT_TRUE(std::adjacent_find(p.begin() + 1, p.end()) == p.end());
}

TEST(PartitionCount, overflow) {
  EXPECT_THROW(intpart::partition_count(intpart::Static::max_countable_n() + 1), std::overflow_error);
  EXPECT_THROW(intpart::partition_counts(1000), std::overflow_error);
}

} // namespace
