#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "randhash/hash.hpp"
#include "randhash/helpers.hpp"
#include "randhash/random_utils.hpp"
#include "randhash/types.hpp"

namespace randhash {

/// Hashing with chaining (HwC) as an additive key-value map.
///
/// Every bucket is an unordered vector of (key, value) pairs. Inserting a key
/// that is already present adds the value to the stored one, so the table
/// holds the aggregated frequency vector of an update stream and Norm()
/// returns its exact squared norm F2.
///
/// Buckets are selected by a MultiplyShiftHash with l = log2(m) bits, so the
/// expected cost of Insert and Query is O(1 + n / m).
///
/// @tparam Key the key type, uint32_t or uint64_t.
template <typename Key = uint64_t>
class ChainedTable {
 public:
  using Entry = std::pair<Key, Value>;

  /// Create an empty table with m buckets, m a power of 2 and at least 2.
  explicit ChainedTable(size_t m)
      : ChainedTable(m, random_utils::ThreadSource()) {}

  template <typename Rng>
  ChainedTable(size_t m, Rng& rng)
      : hash_(BucketBits(m), rng), buckets_(m) {}

  /// Add value to the aggregate stored for key.
  void Insert(Key key, Value value) {
    auto& bucket = buckets_[hash_(key)];
    for (auto& [k, v] : bucket) {
      if (k == key) {
        v += value;
        return;
      }
    }
    bucket.emplace_back(key, value);
    ++size_;
  }

  /// @return the aggregated value of key, or nullopt if it was never
  /// inserted.
  std::optional<Value> Query(Key key) const noexcept {
    for (const auto& [k, v] : buckets_[hash_(key)]) {
      if (k == key) return v;
    }
    return std::nullopt;
  }

  bool Contains(Key key) const noexcept { return Query(key).has_value(); }

  /// @return the sum of the squared aggregated values.
  Value Norm() const noexcept {
    Value norm = 0;
    for (const auto& bucket : buckets_) {
      for (const auto& [k, v] : bucket) norm += v * v;
    }
    return norm;
  }

  /// @return the number of entries in the fullest bucket.
  size_t LongestChain() const noexcept {
    size_t longest = 0;
    for (const auto& bucket : buckets_) {
      longest = std::max(longest, bucket.size());
    }
    return longest;
  }

  /// Number of distinct keys.
  size_t Size() const noexcept { return size_; }
  size_t NumBuckets() const noexcept { return buckets_.size(); }
  double LoadFactor() const noexcept {
    return static_cast<double>(size_) / static_cast<double>(buckets_.size());
  }

  const MultiplyShiftHash<Key>& hash() const noexcept { return hash_; }

 private:
  MultiplyShiftHash<Key> hash_;
  std::vector<std::vector<Entry>> buckets_;
  size_t size_ = 0;

  static uint32_t BucketBits(size_t m) {
    if (m < 2 || !detail::IsPowerOfTwo(m)) {
      throw std::invalid_argument(
          "number of buckets must be a power of 2 and >= 2: " +
          std::to_string(m));
    }
    return detail::FloorLog2(m);
  }
};

}  // namespace randhash
