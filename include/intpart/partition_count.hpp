#ifndef INTPART_PARTITION_COUNT_HPP_
#define INTPART_PARTITION_COUNT_HPP_

#include <cstddef>
#include <cstdint>
#include <vector>

namespace intpart {

// p(0) .. p(max_n) (OEIS A000041) by Euler's pentagonal number recurrence.
// Throws std::overflow_error if max_n > Static::max_countable_n().
std::vector<std::uint64_t> partition_counts(std::size_t max_n);

// number of partitions of n
std::uint64_t partition_count(std::size_t n);

} // namespace intpart

#endif // INTPART_PARTITION_COUNT_HPP_
