#pragma once

#include <cstdint>
#include <vector>

#include "benchmark/benchmark.h"
#include "randhash/data.hpp"

/// Sizes n = 2^k of the inputs, for k in {12, 14, ..., 20}.
inline constexpr int64_t kMinSize = int64_t{1} << 12;
inline constexpr int64_t kMaxSize = int64_t{1} << 20;
inline constexpr int kSizeMultiplier = 4;

inline auto AmendArgs(int argc, char* argv[]) {
  std::vector<char*> new_argv(argv, argv + argc);
  new_argv.push_back(const_cast<char*>("--benchmark_counters_tabular=true"));
  new_argv.push_back(const_cast<char*>("--benchmark_out_format=json"));
  return new_argv;
}

/// Main that fills the input caches up front, so the first benchmark of each
/// size does not pay for generating its input.
#define RANDHASH_BENCHMARK_MAIN(cache_keys, cache_updates)              \
  int main(int argc, char** argv) {                                     \
    for (int64_t n = kMinSize; n <= kMaxSize; n *= kSizeMultiplier) {   \
      if (cache_keys) {                                                 \
        GetKeys<uint32_t>(n);                                           \
        GetKeys<uint64_t>(n);                                           \
      }                                                                 \
      if (cache_updates) GetUpdates(n);                                 \
    }                                                                   \
                                                                        \
    auto new_argv = AmendArgs(argc, argv);                              \
    argc = static_cast<int>(new_argv.size());                           \
    ::benchmark::Initialize(&argc, new_argv.data());                    \
    if (::benchmark::ReportUnrecognizedArguments(argc, argv)) return 1; \
    ::benchmark::RunSpecifiedBenchmarks();                              \
    ::benchmark::Shutdown();                                            \
    return 0;                                                           \
  }
