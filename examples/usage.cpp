#include <algorithm>
#include <iostream>
#include <ranges>
#include <vector>
#include <glog/logging.h>

#include "intpart/partitioner.hpp"
#include "intpart/partitions.hpp"
#include "intpart/util.hpp"

using namespace intpart;

int main(int argc, const char* const argv[])
{
  google::InitGoogleLogging(argv[0]);

  // pull interface, views alias the generator's buffer
  partitions gen(6);
  while (auto p = gen.next())
    std::cerr << util::format_partition(*p) << std::endl;

  // same buffer, no new allocation for a smaller n
  auto buf = std::move(gen).end();
  auto again = partitions::recycle(5, std::move(buf));

  // owned copies outlive the next step
  std::vector<std::vector<std::size_t>> kept;
  while (auto p = again.next_copy())
    if (p->size() == 2)
      kept.emplace_back(std::move(*p));
  std::cerr << "two part partitions of 5: " << kept.size() << std::endl;

  // range interface
  partitioner parts(partitions(8));
  auto distinct = std::ranges::count_if(parts, [](auto&& p) {
    return std::ranges::adjacent_find(p) == p.end();
  });
  std::cerr << "partitions of 8 into distinct parts: " << distinct
            << " of " << parts.count() << std::endl;

  return 0;
}
