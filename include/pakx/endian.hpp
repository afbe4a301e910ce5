#pragma once

#include <bit>
#include <cstdint>
#include <cstring>

namespace pakx {

// C++20-compatible byteswap (C++23 has std::byteswap)
namespace detail {

inline constexpr uint32_t byteswap(uint32_t value) noexcept {
  return ((value & 0x000000FFu) << 24) | ((value & 0x0000FF00u) << 8) |
         ((value & 0x00FF0000u) >> 8) | ((value & 0xFF000000u) >> 24);
}

} // namespace detail

inline constexpr bool is_big_endian() noexcept {
  return std::endian::native == std::endian::big;
}

// Convert little-endian to host byte order
inline constexpr uint32_t letoh32(uint32_t value) noexcept {
  if constexpr (is_big_endian()) {
    return detail::byteswap(value);
  }
  return value;
}

// Convert host byte order to little-endian
inline constexpr uint32_t htole32(uint32_t value) noexcept {
  if constexpr (is_big_endian()) {
    return detail::byteswap(value);
  }
  return value;
}

// Read a little-endian u32 from unaligned storage
inline uint32_t loadLE32(const uint8_t *src) noexcept {
  uint32_t value;
  std::memcpy(&value, src, 4);
  return letoh32(value);
}

// Write a little-endian u32 to unaligned storage
inline void storeLE32(uint8_t *dst, uint32_t value) noexcept {
  uint32_t le = htole32(value);
  std::memcpy(dst, &le, 4);
}

} // namespace pakx
