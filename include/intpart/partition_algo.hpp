#ifndef INTPART_PARTITION_ALGO_HPP__
#define INTPART_PARTITION_ALGO_HPP__

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>

namespace intpart {
namespace partition {

// pull based source of integer partitions
// next() hands out a view into storage owned by the source, valid until the
// following call to next()
struct partition_algo {
  using value_type = std::size_t;
  using view_type = std::span<const value_type>;

  virtual std::optional<view_type> next() = 0;
  virtual std::uint64_t count() const = 0;
  virtual ~partition_algo() = default;
};

} // namespace partition
} // namespace intpart

#endif // INTPART_PARTITION_ALGO_HPP__
