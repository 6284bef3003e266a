#ifndef INTPART_CONFIGURATION_HPP__
#define INTPART_CONFIGURATION_HPP__

#include <cstddef>
#include <cstdint>
#include <limits>

namespace intpart {

namespace Static {
  // largest n a generator accepts; keeps 2*x and x+y inside std::size_t
  constexpr inline std::size_t max_n()             { return std::numeric_limits<std::size_t>::max()/2; }
  // p(416) is the last partition number that fits in 64 bits
  constexpr inline std::size_t max_countable_n()   { return 416;                                          }
  constexpr inline std::uint64_t default_n()       { return 10;                                           }
} // namespace Static

} // namespace intpart

#endif // INTPART_CONFIGURATION_HPP__
