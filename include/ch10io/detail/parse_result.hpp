#pragma once

#include "../expected.hpp"
#include "parse_error.hpp"

namespace ch10io {

/**
 * @brief Result type for header decoding
 *
 * Alias for expected<T, ParseError>.
 *
 * Usage:
 * @code
 *   auto result = PacketHeader::decode(bytes);
 *   if (result.has_value()) {
 *       auto channel = result->channel_id();
 *   } else {
 *       std::cerr << result.error().message() << "\n";
 *   }
 * @endcode
 *
 * @tparam T The decoded value type
 */
template <typename T>
using ParseResult = expected<T, ParseError>;

/**
 * @brief Factory function for creating parse errors
 *
 * @param code The validation error code
 * @param bytes The raw bytes that failed to decode
 * @return unexpected<ParseError> suitable for returning from decode functions
 */
inline auto make_parse_error(ValidationError code, std::span<const uint8_t> bytes) noexcept {
    return unexpected(ParseError{.code = code, .raw_bytes = bytes});
}

} // namespace ch10io
