#pragma once

#include <bit>

#include <cstddef>
#include <cstdint>
#include <cstring>

namespace ch10io::detail {

// Platform endianness detection
inline constexpr bool is_little_endian = (std::endian::native == std::endian::little);
inline constexpr bool is_big_endian = (std::endian::native == std::endian::big);

static_assert(is_little_endian || is_big_endian, "Mixed endianness not supported");

// Byte swap operations (constexpr for compile-time use)
constexpr uint16_t byteswap16(uint16_t value) noexcept {
    return __builtin_bswap16(value);
}

constexpr uint32_t byteswap32(uint32_t value) noexcept {
    return __builtin_bswap32(value);
}

// Chapter 10 stores every multi-byte field little-endian
constexpr uint16_t host_to_le16(uint16_t value) noexcept {
    if constexpr (is_little_endian) {
        return value;
    } else {
        return byteswap16(value);
    }
}

constexpr uint32_t host_to_le32(uint32_t value) noexcept {
    if constexpr (is_little_endian) {
        return value;
    } else {
        return byteswap32(value);
    }
}

constexpr uint16_t le_to_host16(uint16_t value) noexcept {
    return host_to_le16(value); // Same operation
}

constexpr uint32_t le_to_host32(uint32_t value) noexcept {
    return host_to_le32(value); // Same operation
}

/**
 * @brief Endian-safe buffer read/write helpers
 *
 * All functions use std::memcpy for alignment safety; callers are responsible
 * for bounds checking.
 */
inline uint16_t read_le16(const uint8_t* buffer, size_t offset) noexcept {
    uint16_t value;
    std::memcpy(&value, buffer + offset, sizeof(value));
    return le_to_host16(value);
}

inline uint32_t read_le32(const uint8_t* buffer, size_t offset) noexcept {
    uint32_t value;
    std::memcpy(&value, buffer + offset, sizeof(value));
    return le_to_host32(value);
}

inline void write_le16(uint8_t* buffer, size_t offset, uint16_t value) noexcept {
    value = host_to_le16(value);
    std::memcpy(buffer + offset, &value, sizeof(value));
}

inline void write_le32(uint8_t* buffer, size_t offset, uint32_t value) noexcept {
    value = host_to_le32(value);
    std::memcpy(buffer + offset, &value, sizeof(value));
}

} // namespace ch10io::detail
