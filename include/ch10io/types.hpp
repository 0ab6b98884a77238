// Copyright (c) 2025 Michael Smith
// SPDX-License-Identifier: MIT

#pragma once

#include <cstddef>
#include <cstdint>

namespace ch10io {

// Packet boundary marker (first two bytes of every packet, little-endian)
inline constexpr uint16_t packet_sync = 0xEB25;

// Header sizes in bytes
inline constexpr size_t primary_header_size = 24;
inline constexpr size_t secondary_header_size = 12;
inline constexpr size_t max_header_size = primary_header_size + secondary_header_size;

// Checksum coverage: everything in front of the checksum field
inline constexpr size_t primary_checksum_offset = 22;
inline constexpr size_t secondary_checksum_offset = 10;

// Default bound for backward resynchronization scans. Chapter 10 caps most
// packets at 512 KiB, so one window always covers a full packet.
inline constexpr uint32_t default_scan_window_bytes = 1024 * 1024;

// Data file open mode
enum class FileMode : uint8_t {
    closed = 0,
    read = 1,                ///< Open an existing file for reading
    overwrite = 2,           ///< Create a new file or overwrite an existing file
    append = 3,              ///< Append data to the end of an existing file
    read_in_order = 4,       ///< Open an existing file for reading in time order
    read_network_stream = 5, ///< Open network data stream
};

constexpr const char* file_mode_string(FileMode mode) noexcept {
    switch (mode) {
        case FileMode::closed:
            return "closed";
        case FileMode::read:
            return "read";
        case FileMode::overwrite:
            return "overwrite";
        case FileMode::append:
            return "append";
        case FileMode::read_in_order:
            return "read_in_order";
        case FileMode::read_network_stream:
            return "read_network_stream";
    }
    return "unknown";
}

constexpr bool is_read_mode(FileMode mode) noexcept {
    return mode == FileMode::read || mode == FileMode::read_in_order;
}

constexpr bool is_write_mode(FileMode mode) noexcept {
    return mode == FileMode::overwrite || mode == FileMode::append;
}

// PacketFlags bit layout
namespace flag_bits {
inline constexpr uint8_t secondary_header = 0x80;
inline constexpr uint8_t ipts_time_source = 0x40;
inline constexpr uint8_t rtc_sync_error = 0x20;
inline constexpr uint8_t data_overflow = 0x10;
inline constexpr uint8_t time_format_mask = 0x0C;
inline constexpr uint8_t time_format_shift = 2;
inline constexpr uint8_t checksum_type_mask = 0x03;
} // namespace flag_bits

// Time format carried in the secondary header (PacketFlags bits 3-2)
enum class SecondaryTimeFormat : uint8_t {
    ch4_binary = 0, ///< IRIG 106 Chapter 4 binary weighted time
    ieee_1588 = 1,  ///< IEEE-1588 seconds / nanoseconds
    ertc = 2,       ///< 64-bit extended relative time counter
    reserved = 3
};

// Packet body checksum kind (PacketFlags bits 1-0)
enum class DataChecksumType : uint8_t {
    none = 0,
    sum8 = 1,
    sum16 = 2,
    sum32 = 3
};

// Validation error codes for header decoding
enum class ValidationError : uint8_t {
    none = 0,                    // No error, header is valid
    buffer_too_small,            // Fewer bytes than the header requires
    bad_sync,                    // Sync field is not 0xEB25
    header_checksum_mismatch,    // Primary header checksum failed
    secondary_checksum_mismatch, // Secondary header checksum failed
    length_mismatch,             // PacketLen smaller than header + DataLen
};

constexpr const char* validation_error_string(ValidationError err) noexcept {
    switch (err) {
        case ValidationError::none:
            return "No error";
        case ValidationError::buffer_too_small:
            return "Buffer too small for packet header";
        case ValidationError::bad_sync:
            return "Sync pattern mismatch";
        case ValidationError::header_checksum_mismatch:
            return "Primary header checksum mismatch";
        case ValidationError::secondary_checksum_mismatch:
            return "Secondary header checksum mismatch";
        case ValidationError::length_mismatch:
            return "Packet length smaller than header plus data length";
    }
    return "Unknown error";
}

} // namespace ch10io
