#include <cstddef>
#include <cstdint>
#include <vector>

#include "benchmark/benchmark.h"
#include "fks/perfect_set.hpp"
#include "hwc/chained_table.hpp"
#include "randhash/benchmark.hpp"
#include "randhash/data.hpp"
#include "randhash/random_utils.hpp"

using Set = randhash::PerfectSet<uint64_t>;
using Table = randhash::ChainedTable<uint64_t>;

Table BuildTable(const std::vector<uint64_t>& keys, randhash::RandomSource& rng) {
  Table table(keys.size(), rng);
  for (const auto key : keys) table.Insert(key, 1);
  return table;
}

void BM_PerfectSetBuild(benchmark::State& state) {
  const auto& keys = GetKeys<uint64_t>(state.range(0));
  randhash::RandomSource rng(kBenchSeed);
  size_t outer_attempts = 0;
  size_t slots = 0;
  for (auto _ : state) {
    Set set(keys, rng);
    ::benchmark::DoNotOptimize(set);
    outer_attempts += set.OuterAttempts();
    slots = set.NumSlots();
  }

  state.SetItemsProcessed(static_cast<int64_t>(state.iterations() * keys.size()));
  state.counters["outer_attempts"] =
      static_cast<double>(outer_attempts) / state.iterations();
  state.counters["slots_per_key"] =
      static_cast<double>(slots) / static_cast<double>(keys.size());
}

void BM_PerfectSetContains(benchmark::State& state) {
  const auto& keys = GetKeys<uint64_t>(state.range(0));
  randhash::RandomSource rng(kBenchSeed);
  const Set set(keys, rng);
  for (auto _ : state) {
    size_t found = 0;
    for (const auto key : keys) found += set.Contains(key);
    ::benchmark::DoNotOptimize(found);
  }
  state.SetItemsProcessed(static_cast<int64_t>(state.iterations() * keys.size()));
}

void BM_ChainedTableBuild(benchmark::State& state) {
  const auto& keys = GetKeys<uint64_t>(state.range(0));
  randhash::RandomSource rng(kBenchSeed);
  for (auto _ : state) {
    Table table = BuildTable(keys, rng);
    ::benchmark::DoNotOptimize(table);
  }
  state.SetItemsProcessed(static_cast<int64_t>(state.iterations() * keys.size()));
}

void BM_ChainedTableQuery(benchmark::State& state) {
  const auto& keys = GetKeys<uint64_t>(state.range(0));
  randhash::RandomSource rng(kBenchSeed);
  const Table table = BuildTable(keys, rng);
  for (auto _ : state) {
    size_t found = 0;
    for (const auto key : keys) found += table.Contains(key);
    ::benchmark::DoNotOptimize(found);
  }
  state.SetItemsProcessed(static_cast<int64_t>(state.iterations() * keys.size()));
  state.counters["longest_chain"] = table.LongestChain();
}

BENCHMARK(BM_PerfectSetBuild)
    ->RangeMultiplier(kSizeMultiplier)
    ->Range(kMinSize, kMaxSize);
BENCHMARK(BM_PerfectSetContains)
    ->RangeMultiplier(kSizeMultiplier)
    ->Range(kMinSize, kMaxSize);
BENCHMARK(BM_ChainedTableBuild)
    ->RangeMultiplier(kSizeMultiplier)
    ->Range(kMinSize, kMaxSize);
BENCHMARK(BM_ChainedTableQuery)
    ->RangeMultiplier(kSizeMultiplier)
    ->Range(kMinSize, kMaxSize);

RANDHASH_BENCHMARK_MAIN(true, false);
