#ifndef INTPART_PARTITIONER_HPP__
#define INTPART_PARTITIONER_HPP__

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <memory>
#include <optional>
#include <utility>

#include "intpart/concepts.hpp"

namespace intpart {

// partitioner : single pass range over the partitions a source produces
// algo: pull based source, e.g. intpart::partitions
//
//   for (auto&& p : intpart::partitioner(intpart::partitions(5))) { ... }
template <kncpt::PartitionSource PartitionAlgoType>
class partitioner {
  using view_type = typename PartitionAlgoType::view_type;

  std::shared_ptr<PartitionAlgoType> algo;

  class partition_iterator {
    std::shared_ptr<PartitionAlgoType> m_algo;
    std::optional<view_type> m_state;

    public:
    using iterator_concept = std::input_iterator_tag;
    using value_type = view_type;
    using difference_type = std::ptrdiff_t;

    partition_iterator() = default;
    explicit partition_iterator(std::shared_ptr<PartitionAlgoType> algo)
    : m_algo{std::move(algo)}
    , m_state{m_algo->next()}
    {}

    partition_iterator& operator ++ () {
      m_state = m_algo->next();
      return *this;
    }
    void operator ++ (int) { ++*this; }

    value_type operator * () const { return *m_state; }

    friend bool operator == (const partition_iterator& it, std::default_sentinel_t) { return !it.m_state.has_value(); }
  };

  public:
  explicit partitioner(PartitionAlgoType&& part_algo)
  : algo{std::make_shared<PartitionAlgoType>(std::move(part_algo))}
  {}
  explicit partitioner(std::shared_ptr<PartitionAlgoType> part_algo)
  : algo{std::move(part_algo)}
  {}

  // pulls the first partition, call once
  decltype(auto) begin() { return partition_iterator(algo); }
  constexpr std::default_sentinel_t end() const noexcept { return std::default_sentinel; }
  std::uint64_t count() const { return algo->count(); }
};

} // namespace intpart
#endif // INTPART_PARTITIONER_HPP__
