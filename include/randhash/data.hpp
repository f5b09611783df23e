#pragma once

#include <cstddef>
#include <cstdint>
#include <random>
#include <unordered_map>
#include <vector>

#include "randhash/types.hpp"

/// Seed of every randomized choice in the benchmarks.
inline constexpr uint64_t kBenchSeed = 42;

/// One element of an update stream: add delta to the value of key.
struct Update {
  uint64_t key;
  randhash::Value delta;
};

/// @return the keys 1..n.
template <typename Key>
const std::vector<Key>& GetKeys(size_t n) {
  static std::unordered_map<size_t, std::vector<Key>> cache;
  auto& keys = cache[n];
  if (keys.empty()) {
    keys.reserve(n);
    for (size_t i = 1; i <= n; ++i) keys.push_back(static_cast<Key>(i));
  }
  return keys;
}

/// @return n updates with keys drawn from [0, n) and deltas from [-8, 8].
inline const std::vector<Update>& GetUpdates(size_t n) {
  static std::unordered_map<size_t, std::vector<Update>> cache;
  auto& updates = cache[n];
  if (updates.empty()) {
    std::mt19937_64 gen(kBenchSeed);
    std::uniform_int_distribution<uint64_t> key_dist(0, n - 1);
    std::uniform_int_distribution<randhash::Value> delta_dist(-8, 8);
    updates.reserve(n);
    for (size_t i = 0; i < n; ++i) {
      updates.push_back({key_dist(gen), delta_dist(gen)});
    }
  }
  return updates;
}
