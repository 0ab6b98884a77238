// Copyright (c) 2025 Michael Smith
// SPDX-License-Identifier: MIT

#pragma once

#include <cstdint>

namespace ch10io {

/**
 * @brief Result codes shared by every stream operation
 *
 * Grouped by how a caller is expected to react:
 * - boundary (end_of_file, beginning_of_file): normal termination of a walk
 * - structural (format_error): current read failed, stream still usable
 * - truncation (short_read): payload extends past the end of the source
 * - resource (everything else): stop using the stream for this operation
 */
enum class Status : uint8_t {
    ok = 0,
    end_of_file,       ///< No further packet at the cursor
    beginning_of_file, ///< No packet before the anchor
    format_error,      ///< Bad sync, checksum, or inconsistent lengths
    short_read,        ///< Fewer payload bytes available than declared
    not_found,         ///< File does not exist
    access_denied,     ///< Permission failure on open
    invalid_handle,    ///< Stream is not open
    open_error,        ///< Open failed for another reason
    already_open,      ///< open() called on an open stream
    wrong_file_mode,   ///< Operation not valid for the mode the stream was opened with
    read_error,        ///< Underlying read failed
    seek_error,        ///< Underlying seek failed
    close_error,       ///< Underlying close failed
    no_current_header, ///< read_data() without a successfully decoded header
    unsupported        ///< Mode or operation not supported by this stream
};

constexpr const char* status_string(Status status) noexcept {
    switch (status) {
        case Status::ok:
            return "ok";
        case Status::end_of_file:
            return "end_of_file";
        case Status::beginning_of_file:
            return "beginning_of_file";
        case Status::format_error:
            return "format_error";
        case Status::short_read:
            return "short_read";
        case Status::not_found:
            return "not_found";
        case Status::access_denied:
            return "access_denied";
        case Status::invalid_handle:
            return "invalid_handle";
        case Status::open_error:
            return "open_error";
        case Status::already_open:
            return "already_open";
        case Status::wrong_file_mode:
            return "wrong_file_mode";
        case Status::read_error:
            return "read_error";
        case Status::seek_error:
            return "seek_error";
        case Status::close_error:
            return "close_error";
        case Status::no_current_header:
            return "no_current_header";
        case Status::unsupported:
            return "unsupported";
    }
    return "unknown";
}

constexpr bool is_boundary(Status status) noexcept {
    return status == Status::end_of_file || status == Status::beginning_of_file;
}

} // namespace ch10io
