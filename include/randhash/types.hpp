#pragma once

#include <cstdint>
#include <type_traits>

namespace randhash {

/// Signed type for values, aggregated sums and sketch counters.
using Value = int64_t;

namespace detail {

/// SFINAE helper struct to check if type T is a supported key type.
template <typename T>
struct is_key : std::false_type {};

/// Keys are fixed-width unsigned integers of 32 or 64 bits.
template <>
struct is_key<uint32_t> : std::true_type {};

template <>
struct is_key<uint64_t> : std::true_type {};

/// Helper template to simplify usage C++17 style.
template <typename T>
inline constexpr bool is_key_v = is_key<T>::value;

/// Number of bits w of the key type.
template <typename Key>
inline constexpr uint32_t key_bits_v = sizeof(Key) * 8;

}  // namespace detail
}  // namespace randhash
