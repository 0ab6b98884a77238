#pragma once

#include <span>

#include <cstddef>
#include <cstdint>

namespace ch10io::detail {

/**
 * @brief 16-bit word-sum checksum used by the primary and secondary headers
 *
 * Sums the buffer as consecutive little-endian 16-bit words. An odd trailing
 * byte is zero-extended. Arithmetic wraps at 16 bits.
 *
 * @param bytes Bytes covered by the checksum
 * @return Truncated sum
 */
constexpr uint16_t sum16(std::span<const uint8_t> bytes) noexcept {
    uint16_t sum = 0;
    size_t i = 0;
    for (; i + 1 < bytes.size(); i += 2) {
        sum = static_cast<uint16_t>(sum + (bytes[i] | (bytes[i + 1] << 8)));
    }
    if (i < bytes.size()) {
        sum = static_cast<uint16_t>(sum + bytes[i]);
    }
    return sum;
}

} // namespace ch10io::detail
