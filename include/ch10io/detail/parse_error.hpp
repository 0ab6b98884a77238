#pragma once

#include <span>

#include <cstdint>

#include "../status.hpp"
#include "../types.hpp"

namespace ch10io {

/**
 * @brief Error information from a failed header decode
 *
 * Carries the precise validation failure plus the bytes that were examined.
 * Every decode failure surfaces from the stream as Status::format_error.
 *
 * This is a trivially copyable type (span is just pointer + size).
 */
struct ParseError {
    ValidationError code;               ///< The validation error that occurred
    std::span<const uint8_t> raw_bytes; ///< Bytes examined by the decoder

    /**
     * @brief Get a human-readable error message
     * @return Static string describing the validation error
     */
    [[nodiscard]] const char* message() const noexcept { return validation_error_string(code); }

    /// Status reported for this error by stream operations
    [[nodiscard]] Status status() const noexcept { return Status::format_error; }
};

} // namespace ch10io
