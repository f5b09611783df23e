#pragma once

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <stdexcept>
#include <string>
#include <utility>

#include "randhash/compiler.hpp"
#include "randhash/types.hpp"

namespace randhash {

namespace detail {

/// Exponent q of the Mersenne prime p = 2^q - 1 used by FourWiseHash.
inline constexpr uint32_t kMersenneExponent = 61;
inline constexpr uint64_t kMersennePrime =
    (uint64_t{1} << kMersenneExponent) - 1;

/// x mod p for p = 2^61 - 1, valid for x < 2^124.
///
/// Since 2^61 = 1 (mod p), x = hi * 2^61 + lo is congruent to hi + lo, so the
/// reduction is a fold of the high bits onto the low bits followed by a
/// single conditional subtraction.
RANDHASH_INLINE constexpr uint64_t MersenneMod61(__uint128_t x) {
  const uint64_t lo = static_cast<uint64_t>(x) & kMersennePrime;
  const uint64_t hi = static_cast<uint64_t>(x >> kMersenneExponent);
  uint64_t s = lo + hi;
  s = (s & kMersennePrime) + (s >> kMersenneExponent);
  return s >= kMersennePrime ? s - kMersennePrime : s;
}

/// Draw a uniform integer over all w bits of Key.
template <typename Key, typename Rng>
Key DrawBits(Rng& rng) {
  constexpr uint64_t kHalf = uint64_t{1} << 32;
  if constexpr (sizeof(Key) == 4) {
    return static_cast<Key>(rng.Uniform(0, kHalf));
  } else {
    const uint64_t hi = rng.Uniform(0, kHalf);
    return static_cast<Key>((hi << 32) | rng.Uniform(0, kHalf));
  }
}

}  // namespace detail

/// Multiply-shift hashing from w bit keys to l bit indices.
///
/// h(x) = ((a * x + b) mod 2^w) >> (w - l), with a odd. This family is
/// 2-universal, i.e. Pr[h(x) = h(y)] <= 2 / 2^l for x != y.
///
/// See Section 3.3 of
///   Thorup, Mikkel. "High speed hashing for integers and strings."
///   arXiv preprint arXiv:1504.06804 (2015).
///
/// @tparam Key the key type, uint32_t or uint64_t.
template <typename Key = uint64_t>
class MultiplyShiftHash {
  static_assert(detail::is_key_v<Key>, "Key must be uint32_t or uint64_t");

 public:
  static constexpr uint32_t kKeyBits = detail::key_bits_v<Key>;

  /// Draw a random member of the family with l output bits.
  template <typename Rng>
  MultiplyShiftHash(uint32_t l, Rng& rng)
      : MultiplyShiftHash{l, detail::DrawBits<Key>(rng),
                          detail::DrawBits<Key>(rng)} {}

  /// Construct from explicit parameters. The lowest bit of a is forced to 1.
  MultiplyShiftHash(uint32_t l, Key a, Key b) : l_(l), a_(a | 1), b_(b) {
    if (l < 1 || l > kKeyBits) {
      throw std::invalid_argument("l must be in [1, " +
                                  std::to_string(kKeyBits) +
                                  "]: " + std::to_string(l));
    }
  }

  /// @return the index of x in [0, 2^l).
  RANDHASH_INLINE size_t Hash(Key x) const noexcept {
    return static_cast<Key>(a_ * x + b_) >> (kKeyBits - l_);
  }

  RANDHASH_INLINE size_t operator()(Key x) const noexcept { return Hash(x); }

  uint32_t l() const noexcept { return l_; }
  Key a() const noexcept { return a_; }
  Key b() const noexcept { return b_; }

  bool operator==(const MultiplyShiftHash&) const = default;

 private:
  uint32_t l_;
  Key a_;
  Key b_;
};

/// 4-wise independent hashing from keys to an (index, sign) pair.
///
/// Evaluates the degree 3 polynomial k = a x^3 + b x^2 + c x + d over the
/// field of the Mersenne prime p = 2^61 - 1 and splits the result as
/// suggested in "Small Summaries for Big Data": the lowest bit of k
/// determines the sign g, the next l bits determine the index h.
///
///   Cormode, Graham, and Ke Yi. Small summaries for big data. Cambridge
///   University Press, 2020.
///
/// @tparam Key the key type, uint32_t or uint64_t. Keys must be < p.
template <typename Key = uint64_t>
class FourWiseHash {
  static_assert(detail::is_key_v<Key>, "Key must be uint32_t or uint64_t");

 public:
  static constexpr uint64_t kPrime = detail::kMersennePrime;
  /// 2^l must not exceed p / 2.
  static constexpr uint32_t kMaxBits = detail::kMersenneExponent - 1;

  /// Draw a random member of the family with l index bits.
  template <typename Rng>
  FourWiseHash(uint32_t l, Rng& rng)
      : FourWiseHash{l, rng.Uniform(1, kPrime), rng.Uniform(1, kPrime),
                     rng.Uniform(1, kPrime), rng.Uniform(1, kPrime)} {}

  /// Construct from explicit coefficients, each in [1, p).
  FourWiseHash(uint32_t l, uint64_t a, uint64_t b, uint64_t c, uint64_t d)
      : l_(l),
        mask_(l <= kMaxBits ? (uint64_t{1} << l) - 1 : 0),
        a_(a),
        b_(b),
        c_(c),
        d_(d) {
    if (l > kMaxBits) {
      throw std::invalid_argument("l must be <= " + std::to_string(kMaxBits) +
                                  ": " + std::to_string(l));
    }
    for (const uint64_t coefficient : {a, b, c, d}) {
      if (coefficient == 0 || coefficient >= kPrime) {
        throw std::invalid_argument("coefficient out of range [1, p): " +
                                    std::to_string(coefficient));
      }
    }
  }

  /// @return the pair (h, g) with h in [0, 2^l) and g in {-1, +1}.
  RANDHASH_INLINE std::pair<size_t, Value> Hash(Key x) const {
    const uint64_t k = Polynomial(x);
    const auto h = static_cast<size_t>((k >> 1) & mask_);
    // Map the lowest bit to a sign: 0 -> -1, 1 -> +1
    const Value g = static_cast<Value>(k & 1) * 2 - 1;
    return {h, g};
  }

  RANDHASH_INLINE std::pair<size_t, Value> operator()(Key x) const {
    return Hash(x);
  }

  size_t Index(Key x) const { return Hash(x).first; }
  Value Sign(Key x) const { return Hash(x).second; }

  uint32_t l() const noexcept { return l_; }

  bool operator==(const FourWiseHash&) const = default;

 private:
  uint32_t l_;
  uint64_t mask_;
  uint64_t a_;
  uint64_t b_;
  uint64_t c_;
  uint64_t d_;

  /// Horner evaluation of the polynomial, reduced mod p after every step.
  RANDHASH_INLINE uint64_t Polynomial(Key x) const {
    if constexpr (sizeof(Key) == 8) {
      if (RANDHASH_UNLIKELY(x >= kPrime)) {
        throw std::out_of_range("key must be < 2^61 - 1: " +
                                std::to_string(x));
      }
    }
    const auto y = static_cast<__uint128_t>(x);
    uint64_t k = detail::MersenneMod61(a_ * y + b_);
    k = detail::MersenneMod61(k * y + c_);
    return detail::MersenneMod61(k * y + d_);
  }
};

}  // namespace randhash
