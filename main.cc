#include <chrono>
#include <cstdint>
#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <gflags/gflags.h>
#include <glog/logging.h>

#include "spdlog/spdlog.h"

#include "intpart/configuration.hpp"
#include "intpart/partition_count.hpp"
#include "intpart/partitions.hpp"
#include "intpart/util.hpp"

using namespace std::chrono;

DEFINE_uint64(n, intpart::Static::default_n(), "integer to partition");
DEFINE_bool(print, true, "write every partition to stdout, one per line");
DEFINE_uint64(recycle_from, 0, "enumerate the partitions of this value first and reuse its buffer for --n");
DEFINE_bool(verify, false, "check every partition and the total against p(n)");

namespace {

struct run_result {
  std::uint64_t produced = 0;
  std::uint64_t invalid = 0;
};

run_result enumerate(intpart::partitions& gen, bool print, bool verify) {
  run_result res;
  while (auto p = gen.next()) {
    ++res.produced;
    if (verify && !intpart::util::is_partition_of(*p, gen.size())) {
      LOG(ERROR) << "not a partition of " << gen.size() << ": " << intpart::util::format_partition(*p);
      ++res.invalid;
    }
    if (print)
      std::cout << intpart::util::format_partition(*p) << '\n';
  }
  return res;
}

} // namespace

int main(int argc, char* argv[])
{
  gflags::SetUsageMessage("enumerate the integer partitions of n\n"
                          "usage: intpart --n=<n> [--print] [--recycle_from=<m>] [--verify]");
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);

  try {
    std::optional<intpart::partitions> gen;

    if (FLAGS_recycle_from > 0) {
      intpart::partitions warmup(FLAGS_recycle_from);
      auto res = enumerate(warmup, false, false);
      spdlog::info("warm up: {} partitions of {}", res.produced, FLAGS_recycle_from);
      gen.emplace(intpart::partitions::recycle(FLAGS_n, std::move(warmup).end()));
    } else {
      gen.emplace(FLAGS_n);
    }

    auto start = steady_clock::now();
    auto res = enumerate(*gen, FLAGS_print, FLAGS_verify);
    std::cout << std::flush;
    auto elapsed = duration_cast<microseconds>(steady_clock::now() - start).count();

    spdlog::info("n = {}: {} partitions in {} us", FLAGS_n, res.produced, elapsed);

    if (FLAGS_verify) {
      if (res.invalid != 0) {
        LOG(ERROR) << res.invalid << " invalid partitions of " << FLAGS_n;
        return 1;
      }
      if (FLAGS_n <= intpart::Static::max_countable_n()) {
        auto expected = gen->count();
        if (expected != res.produced) {
          LOG(ERROR) << "expected p(" << FLAGS_n << ") = " << expected << ", produced " << res.produced;
          return 1;
        }
        spdlog::info("verified against p({}) = {}", FLAGS_n, expected);
      } else {
        spdlog::warn("p({}) exceeds 64 bits, total not verified", FLAGS_n);
      }
    }
  } catch (std::exception& e) {
    LOG(ERROR) << "intpart: " << e.what();
    return 1;
  }

  return 0;
}
