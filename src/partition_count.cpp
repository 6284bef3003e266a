#include <stdexcept>
#include <string>

#include "intpart/configuration.hpp"
#include "intpart/partition_count.hpp"

namespace intpart {

std::vector<std::uint64_t> partition_counts(std::size_t max_n) {
  if (max_n > Static::max_countable_n())
    throw std::overflow_error("partition_count: p(" + std::to_string(max_n) + ") does not fit in 64 bits");

  std::vector<std::uint64_t> p(max_n + 1, 0);
  p[0] = 1;

  // unsigned arithmetic wraps mod 2^64; every p[m] fits, so the alternating
  // sum comes out exact even when a partial sum does not
  for (std::size_t m = 1; m <= max_n; ++m) {
    std::uint64_t acc = 0;
    for (std::size_t j = 1;; ++j) {
      const auto g1 = j * (3 * j - 1) / 2;
      if (g1 > m)
        break;
      const auto g2 = g1 + j;
      std::uint64_t term = p[m - g1];
      if (g2 <= m)
        term += p[m - g2];
      if (j % 2 == 1)
        acc += term;
      else
        acc -= term;
    }
    p[m] = acc;
  }
  return p;
}

std::uint64_t partition_count(std::size_t n) {
  return partition_counts(n).back();
}

} // namespace intpart
