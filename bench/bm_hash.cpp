#include <cstddef>
#include <cstdint>

#include "benchmark/benchmark.h"
#include "randhash/benchmark.hpp"
#include "randhash/data.hpp"
#include "randhash/hash.hpp"
#include "randhash/random_utils.hpp"

template <typename HashFn, typename Key>
void BM_Hash(benchmark::State& state) {
  const auto& keys = GetKeys<Key>(state.range(0));
  randhash::RandomSource rng(kBenchSeed);
  const HashFn hash_fn(20, rng);
  for (auto _ : state) {
    for (const auto& key : keys) {
      ::benchmark::DoNotOptimize(hash_fn(key));
    }
    ::benchmark::ClobberMemory();
  }

  const auto num_items = static_cast<int64_t>(state.iterations() * keys.size());
  state.SetItemsProcessed(num_items);
  state.SetBytesProcessed(num_items * static_cast<int64_t>(sizeof(Key)));
  state.counters["item_size"] = sizeof(Key);
}

#define BENCHMARK_HASH(hashfn, key)       \
  BENCHMARK_TEMPLATE(BM_Hash, hashfn, key) \
      ->RangeMultiplier(kSizeMultiplier)   \
      ->Range(kMinSize, kMaxSize)

BENCHMARK_HASH(randhash::MultiplyShiftHash<uint32_t>, uint32_t);
BENCHMARK_HASH(randhash::MultiplyShiftHash<uint64_t>, uint64_t);
BENCHMARK_HASH(randhash::FourWiseHash<uint32_t>, uint32_t);
BENCHMARK_HASH(randhash::FourWiseHash<uint64_t>, uint64_t);

RANDHASH_BENCHMARK_MAIN(true, false);
