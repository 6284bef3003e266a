#ifndef INTPART_CONCEPTS_HPP_
#define INTPART_CONCEPTS_HPP_

#include <concepts>
#include <cstdint>
#include <optional>
#include <type_traits>

#include "intpart/partition_algo.hpp"

namespace intpart {
namespace kncpt {

template <typename T>
concept PartitionSource = std::is_base_of_v<partition::partition_algo, T> &&
  requires (T& algo, const T& calgo) {
    typename T::view_type;
    { algo.next() } -> std::same_as<std::optional<typename T::view_type>>;
    { calgo.count() } -> std::convertible_to<std::uint64_t>;
  };

} // namespace kncpt
} // namespace intpart

#endif // INTPART_CONCEPTS_HPP_
