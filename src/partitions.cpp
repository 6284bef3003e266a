#include <stdexcept>
#include <string>
#include <utility>
#include <glog/logging.h>

#include "intpart/configuration.hpp"
#include "intpart/partition_count.hpp"
#include "intpart/partitions.hpp"

namespace intpart {

namespace {

std::size_t checked_n(std::size_t n) {
  if (n > Static::max_n())
    throw std::out_of_range("partitions: n = " + std::to_string(n) + " exceeds supported maximum "
                            + std::to_string(Static::max_n()));
  return n;
}

} // namespace

partitions::partitions(std::size_t n)
  : partitions(n, std::vector<value_type>{})
{}

partitions::partitions(std::size_t n, std::vector<value_type>&& buffer)
  : n_{checked_n(n)}
  , a_{std::move(buffer)}
  , k_{n == 0 ? 0u : 1u}
  , y_{n == 0 ? 0u : n - 1}
  , phase_{outer{}}
{
  const auto cap = a_.capacity();
  a_.clear();
  a_.resize(n + 1, 0);
  if (cap != 0 && cap < n + 1)
    VLOG(1) << "partitions(" << n << "): recycled buffer grown from capacity " << cap;
}

partitions partitions::recycle(std::size_t n, std::vector<value_type> buffer) {
  return partitions(n, std::move(buffer));
}

partitions::partitions(partitions&& rhs) noexcept
  : n_{rhs.n_}
  , a_{std::move(rhs.a_)}
  , k_{std::exchange(rhs.k_, 0)}
  , y_{std::exchange(rhs.y_, 0)}
  , phase_{std::exchange(rhs.phase_, outer{})}
{
  rhs.a_.clear();
}

partitions& partitions::operator=(partitions&& rhs) noexcept {
  if (this != &rhs) {
    n_ = rhs.n_;
    a_ = std::move(rhs.a_);
    k_ = std::exchange(rhs.k_, 0);
    y_ = std::exchange(rhs.y_, 0);
    phase_ = std::exchange(rhs.phase_, outer{});
    rhs.a_.clear();
  }
  return *this;
}

bool partitions::exhausted() const noexcept {
  return std::holds_alternative<outer>(phase_) && k_ == 0 && a_.size() != 1;
}

// a[k] absorbs the whole remainder; y carries x+y-1 into the next step
partitions::view_type partitions::settle(value_type x) {
  a_[k_] = x + y_;
  y_ = x + y_ - 1;
  return view_type(a_.data(), k_ + 1);
}

partitions::view_type partitions::split(value_type x, value_type l) {
  a_[k_] = x;
  a_[l] = y_;
  phase_ = inner{x, l};
  return view_type(a_.data(), k_ + 2);
}

std::optional<partitions::view_type> partitions::next() {
  if (auto* in = std::get_if<inner>(&phase_)) {
    const auto x = in->x + 1;
    const auto l = in->l;
    --y_;

    if (x <= y_)
      return split(x, l);

    phase_ = outer{};
    return settle(x);
  }

  if (k_ == 0) {
    // n == 0 has exactly one partition, the empty one
    if (a_.size() == 1) {
      a_.pop_back();
      return view_type{};
    }
    VLOG(2) << "partitions(" << n_ << "): exhausted";
    return std::nullopt;
  }

  --k_;
  const auto x = a_[k_] + 1;

  while (2 * x <= y_) {
    a_[k_] = x;
    y_ -= x;
    ++k_;
  }

  const auto l = k_ + 1;

  if (x <= y_)
    return split(x, l);

  return settle(x);
}

std::optional<std::vector<partitions::value_type>> partitions::next_copy() {
  auto p = next();
  if (!p)
    return std::nullopt;
  return std::vector<value_type>(p->begin(), p->end());
}

std::uint64_t partitions::count() const {
  return partition_count(n_);
}

std::vector<partitions::value_type> partitions::end() && {
  k_ = 0;
  y_ = 0;
  phase_ = outer{};
  return std::move(a_);
}

} // namespace intpart
