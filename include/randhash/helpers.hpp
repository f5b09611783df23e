#pragma once

#include <cstddef>
#include <cstdint>

namespace randhash::detail {

/// @return true if x is a (non-zero) power of 2.
constexpr bool IsPowerOfTwo(uint64_t x) { return x != 0 && (x & (x - 1)) == 0; }

/// @return floor(log2(x)) for x > 0.
constexpr uint32_t FloorLog2(uint64_t x) {
  return 63 - static_cast<uint32_t>(__builtin_clzll(x));
}

/// @return the smallest power of 2 that is >= x, and at least 1.
constexpr uint64_t CeilPowerOfTwo(uint64_t x) {
  if (x <= 1) return 1;
  return uint64_t{1} << (FloorLog2(x - 1) + 1);
}

}  // namespace randhash::detail
