#pragma once

#include <cstdint>
#include <random>
#include <stdexcept>
#include <string>

namespace randhash {

/// Source of uniform 64 bit integers.
///
/// Every hash draws its parameters from an object with this interface, so
/// callers can inject their own (e.g. seeded or deterministic) source.
class RandomSource {
 public:
  /// Seeded from std::random_device.
  RandomSource() : gen_(std::random_device{}()) {}

  /// Seeded explicitly, for reproducible runs.
  explicit RandomSource(uint64_t seed) : gen_(seed) {}

  /// @return a uniform integer from the closed-open range [lo, hi).
  uint64_t Uniform(uint64_t lo, uint64_t hi) {
    if (lo >= hi) {
      throw std::invalid_argument("empty range [" + std::to_string(lo) +
                                  ", " + std::to_string(hi) + ")");
    }
    std::uniform_int_distribution<uint64_t> dist(lo, hi - 1);
    return dist(gen_);
  }

 private:
  std::mt19937_64 gen_;
};

namespace random_utils {

/// Default source for callers that do not care about reproducibility.
inline RandomSource& ThreadSource() {
  static thread_local RandomSource source;
  return source;
}

}  // namespace random_utils
}  // namespace randhash
