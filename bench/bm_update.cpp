#include <cstddef>
#include <cstdint>
#include <type_traits>

#include "benchmark/benchmark.h"
#include "cs/norm_sketch.hpp"
#include "hwc/chained_table.hpp"
#include "randhash/benchmark.hpp"
#include "randhash/data.hpp"
#include "randhash/random_utils.hpp"

/// Counters of the sketch, independent of the stream length.
constexpr size_t kSketchCounters = 1024;

using Table = randhash::ChainedTable<uint64_t>;
using Sketch = randhash::NormSketch<uint64_t>;

void Apply(Table& table, const Update& update) {
  table.Insert(update.key, update.delta);
}
void Apply(Sketch& sketch, const Update& update) {
  sketch.Update(update.key, update.delta);
}

randhash::Value Norm(const Table& table) { return table.Norm(); }
randhash::Value Norm(const Sketch& sketch) { return sketch.Estimate(); }

/// Drive the same update stream of n = 2^k updates into a structure.
template <typename Structure>
void BM_Update(benchmark::State& state) {
  const size_t n = state.range(0);
  const auto& updates = GetUpdates(n);
  const size_t capacity = std::is_same_v<Structure, Table> ? n : kSketchCounters;
  randhash::RandomSource rng(kBenchSeed);
  randhash::Value norm = 0;
  for (auto _ : state) {
    Structure structure(capacity, rng);
    for (const auto& update : updates) {
      Apply(structure, update);
    }
    ::benchmark::DoNotOptimize(structure);
    ::benchmark::ClobberMemory();

    state.PauseTiming();
    norm = Norm(structure);
    if constexpr (std::is_same_v<Structure, Table>) {
      state.counters["longest_chain"] = structure.LongestChain();
    }
    state.ResumeTiming();
  }

  state.SetItemsProcessed(static_cast<int64_t>(state.iterations() * n));
  state.counters["norm"] = static_cast<double>(norm);
}

BENCHMARK_TEMPLATE(BM_Update, Table)
    ->RangeMultiplier(kSizeMultiplier)
    ->Range(kMinSize, kMaxSize);
BENCHMARK_TEMPLATE(BM_Update, Sketch)
    ->RangeMultiplier(kSizeMultiplier)
    ->Range(kMinSize, kMaxSize);

RANDHASH_BENCHMARK_MAIN(false, true);
