#ifndef INTPART_PARTITIONS_HPP_
#define INTPART_PARTITIONS_HPP_

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <variant>
#include <vector>

#include "intpart/partition_algo.hpp"
#include "intpart/util.hpp"

namespace intpart {

// Enumerates the partitions of n in ascending-composition order using
// Kelleher's accelerated algorithm: constant amortized time per partition,
// one working buffer of n+1 entries reused for the whole enumeration.
//
//   intpart::partitions gen(4);
//   while (auto p = gen.next()) { ... }   // [1,1,1,1] [1,1,2] [1,3] [2,2] [4]
//
// The span returned by next() aliases the working buffer and is invalidated
// by the next call to next(). Use next_copy() to get an owned partition.
class partitions final : public partition::partition_algo {
  // nothing pending, resettle from the boundary k
  struct outer {};
  // last step split the remainder into a[k] = x, a[l] = y
  struct inner {
    value_type x;
    value_type l;
  };
  using phase_t = std::variant<outer, inner>;

public:
  // throws std::out_of_range if n > Static::max_n()
  explicit partitions(std::size_t n);

  // same as partitions(n), but takes over buffer instead of allocating;
  // buffer only reallocates if its capacity is below n+1
  static partitions recycle(std::size_t n, std::vector<value_type> buffer);

  partitions(partitions&& rhs) noexcept;
  partitions& operator=(partitions&& rhs) noexcept;
  IPT_DISALLOW_COPY_ASSIGN(partitions)
  ~partitions() override = default;

  // advances by one partition, std::nullopt once all have been produced
  std::optional<view_type> next() override;
  std::optional<std::vector<value_type>> next_copy();

  // number of partitions of size(), throws std::overflow_error past 64 bits
  std::uint64_t count() const override;

  std::size_t size() const noexcept { return n_; }
  bool exhausted() const noexcept;

  // hands the working buffer back to the caller, contents are unspecified
  [[nodiscard]] std::vector<value_type> end() &&;

private:
  partitions(std::size_t n, std::vector<value_type>&& buffer);

  view_type settle(value_type x);
  view_type split(value_type x, value_type l);

  std::size_t n_;
  std::vector<value_type> a_;
  value_type k_;
  value_type y_;
  phase_t phase_;
};

} // namespace intpart

#endif // INTPART_PARTITIONS_HPP_
