#ifndef INTPART_UTIL_HPP_
#define INTPART_UTIL_HPP_

#include <cstddef>
#include <ranges>
#include <sstream>
#include <string>

namespace intpart {

#define IPT_DISALLOW_COPY_ASSIGN(x)  x& operator = (const x&) = delete; \
                                     x(const x&) = delete;

namespace util {

// true if parts is a non-decreasing sequence of positive integers summing to n
template <std::ranges::input_range R>
constexpr bool is_partition_of(R&& parts, std::size_t n) {
  std::size_t sum = 0;
  std::size_t prev = 1;
  for (auto&& p : parts) {
    if (p < prev)
      return false;
    if (p > n - sum)
      return false;
    sum += p;
    prev = p;
  }
  return sum == n;
}

template <std::ranges::input_range R>
std::string format_partition(R&& parts) {
  std::ostringstream oss;
  oss << '[';
  bool first = true;
  for (auto&& p : parts) {
    if (!first) oss << ", ";
    oss << p;
    first = false;
  }
  oss << ']';
  return oss.str();
}

} // namespace util
} // namespace intpart

#endif // INTPART_UTIL_HPP_
