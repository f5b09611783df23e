#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

#include "randhash/hash.hpp"
#include "randhash/helpers.hpp"
#include "randhash/random_utils.hpp"
#include "randhash/types.hpp"

namespace randhash {

/// Count Sketch estimating the squared norm F2 of a stream of updates.
///
/// The sketch was introduced in the paper
///   Charikar, Moses, Kevin Chen, and Martin Farach-Colton. "Finding frequent
///   items in data streams." International Colloquium on Automata, Languages,
///   and Programming. Berlin, Heidelberg: Springer Berlin Heidelberg, 2002.
///
/// This is a single row of r counters. An update (k, delta) adds
/// g(k) * delta to counter h(k), where (h, g) come from one FourWiseHash.
/// The sum of the squared counters is an unbiased estimate of F2 since the
/// 4-wise independence of g cancels the cross terms in expectation. The
/// variance is at most 2 F2^2 / r.
///
/// The sketch is linear, so updates commute and sketches sharing a hash can
/// be merged.
///
/// @tparam Key the key type, uint32_t or uint64_t.
template <typename Key = uint64_t>
class NormSketch {
 public:
  /// Create an empty sketch with r counters, r a power of 2.
  explicit NormSketch(size_t r)
      : NormSketch(r, random_utils::ThreadSource()) {}

  template <typename Rng>
  NormSketch(size_t r, Rng& rng) : hash_(CounterBits(r), rng), counters_(r) {}

  void Update(Key key, Value delta) {
    const auto [h, sign] = hash_(key);
    counters_[h] += sign * delta;
  }

  /// @return the estimate of the sum of squared frequencies.
  Value Estimate() const noexcept {
    Value estimate = 0;
    for (const Value c : counters_) estimate += c * c;
    return estimate;
  }

  /// @return the estimate of the aggregated value of key.
  Value Frequency(Key key) const {
    const auto [h, sign] = hash_(key);
    return sign * counters_[h];
  }

  /// Add the counters of other, which must use the same hash.
  void Merge(const NormSketch& other) {
    if (hash_ != other.hash_ || counters_.size() != other.counters_.size()) {
      throw std::invalid_argument("cannot merge sketches with different hashes");
    }
    for (size_t i = 0; i < counters_.size(); ++i) {
      counters_[i] += other.counters_[i];
    }
  }

  void Clear() noexcept { std::fill(counters_.begin(), counters_.end(), 0); }

  std::span<const Value> Counters() const noexcept { return counters_; }
  size_t NumCounters() const noexcept { return counters_.size(); }
  const FourWiseHash<Key>& hash() const noexcept { return hash_; }

 private:
  FourWiseHash<Key> hash_;
  std::vector<Value> counters_;

  static uint32_t CounterBits(size_t r) {
    if (!detail::IsPowerOfTwo(r) ||
        detail::FloorLog2(r) > FourWiseHash<Key>::kMaxBits) {
      throw std::invalid_argument(
          "number of counters must be a power of 2 and <= 2^" +
          std::to_string(FourWiseHash<Key>::kMaxBits) + ": " +
          std::to_string(r));
    }
    return detail::FloorLog2(r);
  }
};

}  // namespace randhash
