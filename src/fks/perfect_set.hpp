#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

#include "randhash/hash.hpp"
#include "randhash/helpers.hpp"
#include "randhash/random_utils.hpp"

namespace randhash {

/// Thrown when a randomized construction runs out of retries.
struct ConstructionFailure : std::runtime_error {
  explicit ConstructionFailure(const std::string& what)
      : std::runtime_error(what) {}
};

/// Static set with O(1) worst case lookups, using two-level perfect hashing.
///
/// The scheme was introduced in the paper
///   Fredman, Michael L., Janos Komlos, and Endre Szemeredi. "Storing a sparse
///   table with O(1) worst case access time." Journal of the ACM 31.3 (1984).
///
/// An outer MultiplyShiftHash spreads the N keys over m = 8N buckets and is
/// redrawn until the sum of squared bucket sizes is at most m. Each non-empty
/// bucket with c keys then gets a sub-table of 4c^2 slots and its own inner
/// hash, redrawn until the bucket's keys land in distinct slots. Both redraws
/// succeed with probability >= 1/2, and both are capped.
///
/// All sub-tables live in one flat slot array. A parallel occupancy bitmap
/// marks the filled slots, so every key value, including 0, can be stored.
///
/// @tparam Key the key type, uint32_t or uint64_t.
template <typename Key = uint64_t>
class PerfectSet {
 public:
  /// The hash functions are c-universal with c = 2.
  static constexpr size_t kC = 2;
  static constexpr size_t kMaxOuterAttempts = 64;
  static constexpr size_t kMaxInnerAttempts = 64;

  /// Build the set from distinct keys.
  explicit PerfectSet(std::span<const Key> keys)
      : PerfectSet(keys, random_utils::ThreadSource()) {}

  /// Build the set from distinct keys, drawing all hashes from rng.
  ///
  /// @throws std::invalid_argument if keys contains duplicates.
  /// @throws ConstructionFailure if a retry cap is exceeded.
  template <typename Rng>
  PerfectSet(std::span<const Key> keys, Rng& rng)
      : outer_(OuterBits(keys.size()), rng), size_(keys.size()) {
    const std::vector<size_t> counts = Distribute(keys, rng);
    Build(keys, counts, rng);
  }

  /// @return true iff key was part of the input.
  bool Contains(Key key) const noexcept {
    const auto& sub_table = buckets_[outer_(key)];
    if (!sub_table) return false;
    const size_t slot = sub_table->offset + sub_table->hash(key);
    return occupied_[slot] && slots_[slot] == key;
  }

  size_t Size() const noexcept { return size_; }
  size_t NumBuckets() const noexcept { return buckets_.size(); }
  /// Total number of slots over all sub-tables. Expected O(N).
  size_t NumSlots() const noexcept { return slots_.size(); }
  /// Number of outer hashes drawn before the bucket sizes were acceptable.
  size_t OuterAttempts() const noexcept { return outer_attempts_; }
  /// Number of inner hashes drawn over all sub-tables.
  size_t InnerAttempts() const noexcept { return inner_attempts_; }

 private:
  /// Second level of the scheme: a region of the slot array and its hash.
  struct SubTable {
    size_t offset;
    MultiplyShiftHash<Key> hash;
  };

  MultiplyShiftHash<Key> outer_;
  size_t size_;
  std::vector<std::optional<SubTable>> buckets_;
  std::vector<Key> slots_;
  std::vector<bool> occupied_;
  size_t outer_attempts_ = 0;
  size_t inner_attempts_ = 0;

  static uint32_t OuterBits(size_t n) {
    const uint64_t m = detail::CeilPowerOfTwo(std::max<uint64_t>(4 * kC * n, 2));
    return detail::FloorLog2(m);
  }

  /// Draw outer hashes until the sum of squared bucket sizes is at most m.
  /// @return the number of keys in every outer bucket.
  template <typename Rng>
  std::vector<size_t> Distribute(std::span<const Key> keys, Rng& rng) {
    const size_t m = size_t{1} << outer_.l();
    std::vector<size_t> counts(m);
    while (true) {
      ++outer_attempts_;
      std::fill(counts.begin(), counts.end(), 0);
      for (const Key key : keys) ++counts[outer_(key)];

      uint64_t sum_of_squares = 0;
      for (const size_t c : counts) sum_of_squares += uint64_t{c} * c;
      if (sum_of_squares <= m) return counts;

      if (outer_attempts_ == kMaxOuterAttempts) {
        CheckDistinct(keys);
        throw ConstructionFailure(
            "outer hash exceeded the collision budget " +
            std::to_string(kMaxOuterAttempts) + " times for " +
            std::to_string(keys.size()) + " keys");
      }
      outer_ = MultiplyShiftHash<Key>(outer_.l(), rng);
    }
  }

  /// Group the keys by outer bucket and build a sub-table for each
  /// non-empty bucket.
  template <typename Rng>
  void Build(std::span<const Key> keys, const std::vector<size_t>& counts,
             Rng& rng) {
    const size_t m = counts.size();
    // starts[i] is the first index of bucket i in grouped.
    std::vector<size_t> starts(m + 1, 0);
    size_t num_slots = 0;
    for (size_t i = 0; i < m; ++i) {
      starts[i + 1] = starts[i] + counts[i];
      num_slots += SubTableSize(counts[i]);
    }
    std::vector<Key> grouped(keys.size());
    std::vector<size_t> next(starts.begin(), starts.end() - 1);
    for (const Key key : keys) grouped[next[outer_(key)]++] = key;

    buckets_.assign(m, std::nullopt);
    slots_.assign(num_slots, Key{0});
    occupied_.assign(num_slots, false);

    size_t offset = 0;
    for (size_t i = 0; i < m; ++i) {
      if (counts[i] == 0) continue;
      const size_t size = SubTableSize(counts[i]);
      const std::span<const Key> bucket(grouped.data() + starts[i], counts[i]);
      buckets_[i] = BuildSubTable(bucket, offset, size, rng);
      offset += size;
    }
  }

  /// Slots of a sub-table holding c keys: 2 * kC * c^2 rounded up to a power
  /// of 2, or 0 for an empty bucket.
  static size_t SubTableSize(size_t c) {
    if (c == 0) return 0;
    return detail::CeilPowerOfTwo(2 * kC * c * c);
  }

  template <typename Rng>
  SubTable BuildSubTable(std::span<const Key> bucket, size_t offset,
                         size_t size, Rng& rng) {
    const uint32_t l = detail::FloorLog2(size);
    for (size_t attempt = 1; attempt <= kMaxInnerAttempts; ++attempt) {
      ++inner_attempts_;
      MultiplyShiftHash<Key> hash(l, rng);
      if (Place(bucket, offset, size, hash)) return SubTable{offset, hash};
    }
    throw ConstructionFailure("sub-table of " + std::to_string(size) +
                              " slots collided " +
                              std::to_string(kMaxInnerAttempts) +
                              " times for " + std::to_string(bucket.size()) +
                              " keys");
  }

  /// Try to store every key of the bucket in its own slot.
  /// @return false on a slot collision.
  bool Place(std::span<const Key> bucket, size_t offset, size_t size,
             const MultiplyShiftHash<Key>& hash) {
    std::fill(occupied_.begin() + offset, occupied_.begin() + offset + size,
              false);
    for (const Key key : bucket) {
      const size_t slot = offset + hash(key);
      if (occupied_[slot]) {
        // Equal keys always collide, whatever the hash.
        if (slots_[slot] == key) {
          throw std::invalid_argument("duplicate key: " + std::to_string(key));
        }
        return false;
      }
      occupied_[slot] = true;
      slots_[slot] = key;
    }
    return true;
  }

  static void CheckDistinct(std::span<const Key> keys) {
    std::vector<Key> sorted(keys.begin(), keys.end());
    std::sort(sorted.begin(), sorted.end());
    const auto it = std::adjacent_find(sorted.begin(), sorted.end());
    if (it != sorted.end()) {
      throw std::invalid_argument("duplicate key: " + std::to_string(*it));
    }
  }
};

}  // namespace randhash
