// Copyright (c) 2025 Michael Smith
// SPDX-License-Identifier: MIT

#pragma once

#include <array>
#include <optional>
#include <span>

#include <cstddef>
#include <cstdint>

#include "data_type.hpp"
#include "detail/checksum.hpp"
#include "detail/endian.hpp"
#include "detail/parse_result.hpp"
#include "types.hpp"

namespace ch10io {

/**
 * @brief Fixed 24-byte primary header fields, host byte order
 */
struct PrimaryHeader {
    uint16_t sync{packet_sync};
    uint16_t channel_id{0};
    uint32_t packet_length{0};
    uint32_t data_length{0};
    uint8_t header_version{0};
    uint8_t sequence_number{0};
    uint8_t packet_flags{0};
    uint8_t data_type{0};
    std::array<uint8_t, 6> rel_time{};
    uint16_t checksum{0};

    bool operator==(const PrimaryHeader&) const = default;
};

/**
 * @brief Optional 12-byte secondary header fields, host byte order
 *
 * Interpretation of time[] depends on PacketFlags bits 3-2.
 */
struct SecondaryHeader {
    std::array<uint32_t, 2> time{};
    uint16_t reserved{0};
    uint16_t checksum{0};

    bool operator==(const SecondaryHeader&) const = default;
};

/**
 * @brief Decoded Chapter 10 packet header
 *
 * A primary header plus an explicit optional secondary header. The secondary
 * header exists if and only if PacketFlags bit 7 is set; the constructor keeps
 * the flag bit and the optional in agreement.
 *
 * On-disk layout (little-endian, packed):
 * @code
 *  0  Sync        u16      12  HdrVer      u8       24  Time[0]     u32
 *  2  ChID        u16      13  SeqNum      u8       28  Time[1]     u32
 *  4  PacketLen   u32      14  PacketFlags u8       32  Reserved    u16
 *  8  DataLen     u32      15  DataType    u8       34  SecChecksum u16
 *                          16  RefTime     u8[6]
 *                          22  Checksum    u16
 * @endcode
 *
 * Example usage:
 * @code
 * auto result = ch10io::PacketHeader::decode(bytes);
 * if (result) {
 *     std::cout << result->channel_id() << " " << result->data_type_name() << "\n";
 * }
 * @endcode
 */
class PacketHeader {
public:
    PacketHeader() = default;

    PacketHeader(const PrimaryHeader& primary, std::optional<SecondaryHeader> secondary) noexcept
        : primary_(primary),
          secondary_(secondary) {
        if (secondary_) {
            primary_.packet_flags |= flag_bits::secondary_header;
        } else {
            primary_.packet_flags &= static_cast<uint8_t>(~flag_bits::secondary_header);
        }
    }

    /**
     * @brief Decode and validate a header from raw bytes
     *
     * Validation order: primary size, sync, primary checksum, then (only when
     * the secondary flag is set) secondary size and checksum, then length
     * consistency. Bytes past offset 24 are never touched when the flag is clear.
     *
     * @param bytes Bytes starting at a packet boundary
     * @return Decoded header, or ParseError describing the first failed check
     */
    [[nodiscard]] static ParseResult<PacketHeader>
    decode(std::span<const uint8_t> bytes) noexcept {
        if (bytes.size() < primary_header_size) {
            return make_parse_error(ValidationError::buffer_too_small, bytes);
        }

        const uint8_t* p = bytes.data();
        auto primary_bytes = bytes.first(primary_header_size);

        PrimaryHeader primary;
        primary.sync = detail::read_le16(p, 0);
        if (primary.sync != packet_sync) {
            return make_parse_error(ValidationError::bad_sync, primary_bytes);
        }

        primary.checksum = detail::read_le16(p, primary_checksum_offset);
        if (detail::sum16(bytes.first(primary_checksum_offset)) != primary.checksum) {
            return make_parse_error(ValidationError::header_checksum_mismatch, primary_bytes);
        }

        primary.channel_id = detail::read_le16(p, 2);
        primary.packet_length = detail::read_le32(p, 4);
        primary.data_length = detail::read_le32(p, 8);
        primary.header_version = p[12];
        primary.sequence_number = p[13];
        primary.packet_flags = p[14];
        primary.data_type = p[15];
        for (size_t i = 0; i < primary.rel_time.size(); ++i) {
            primary.rel_time[i] = p[16 + i];
        }

        std::optional<SecondaryHeader> secondary;
        if (primary.packet_flags & flag_bits::secondary_header) {
            if (bytes.size() < max_header_size) {
                return make_parse_error(ValidationError::buffer_too_small, bytes);
            }

            auto sec_bytes = bytes.subspan(primary_header_size, secondary_header_size);
            const uint8_t* s = sec_bytes.data();

            SecondaryHeader sec;
            sec.checksum = detail::read_le16(s, secondary_checksum_offset);
            if (detail::sum16(sec_bytes.first(secondary_checksum_offset)) != sec.checksum) {
                return make_parse_error(ValidationError::secondary_checksum_mismatch,
                                        bytes.first(max_header_size));
            }
            sec.time[0] = detail::read_le32(s, 0);
            sec.time[1] = detail::read_le32(s, 4);
            sec.reserved = detail::read_le16(s, 8);
            secondary = sec;
        }

        PacketHeader header(primary, secondary);
        if (static_cast<uint64_t>(header.packet_length()) <
            header.header_length() + static_cast<uint64_t>(header.data_length())) {
            return make_parse_error(ValidationError::length_mismatch,
                                    bytes.first(header.header_length()));
        }

        return header;
    }

    /**
     * @brief Build a self-consistent header
     *
     * Sets the sync pattern, matches the secondary flag to the optional, and
     * computes both checksums. Other fields are taken as given.
     */
    [[nodiscard]] static PacketHeader build(PrimaryHeader primary,
                                            std::optional<SecondaryHeader> secondary = {}) noexcept {
        primary.sync = packet_sync;
        PacketHeader header(primary, secondary);
        header.update_checksums();
        return header;
    }

    /**
     * @brief Recompute the primary and secondary checksum fields
     */
    void update_checksums() noexcept {
        std::array<uint8_t, max_header_size> bytes{};
        encode(bytes);
        primary_.checksum =
            detail::sum16(std::span<const uint8_t>(bytes).first(primary_checksum_offset));
        if (secondary_) {
            secondary_->checksum = detail::sum16(std::span<const uint8_t>(bytes).subspan(
                primary_header_size, secondary_checksum_offset));
        }
    }

    /**
     * @brief Write the header in wire format
     *
     * Writes exactly header_length() bytes using the stored checksum values.
     *
     * @param out Destination buffer
     * @return Bytes written, or 0 if out is smaller than header_length()
     */
    size_t encode(std::span<uint8_t> out) const noexcept {
        if (out.size() < header_length()) {
            return 0;
        }

        uint8_t* p = out.data();
        detail::write_le16(p, 0, primary_.sync);
        detail::write_le16(p, 2, primary_.channel_id);
        detail::write_le32(p, 4, primary_.packet_length);
        detail::write_le32(p, 8, primary_.data_length);
        p[12] = primary_.header_version;
        p[13] = primary_.sequence_number;
        p[14] = primary_.packet_flags;
        p[15] = primary_.data_type;
        for (size_t i = 0; i < primary_.rel_time.size(); ++i) {
            p[16 + i] = primary_.rel_time[i];
        }
        detail::write_le16(p, primary_checksum_offset, primary_.checksum);

        if (secondary_) {
            uint8_t* s = p + primary_header_size;
            detail::write_le32(s, 0, secondary_->time[0]);
            detail::write_le32(s, 4, secondary_->time[1]);
            detail::write_le16(s, 8, secondary_->reserved);
            detail::write_le16(s, secondary_checksum_offset, secondary_->checksum);
        }

        return header_length();
    }

    // Field accessors
    uint16_t sync() const noexcept { return primary_.sync; }
    uint16_t channel_id() const noexcept { return primary_.channel_id; }
    uint32_t packet_length() const noexcept { return primary_.packet_length; }
    uint32_t data_length() const noexcept { return primary_.data_length; }
    uint8_t header_version() const noexcept { return primary_.header_version; }
    uint8_t sequence_number() const noexcept { return primary_.sequence_number; }
    uint8_t packet_flags() const noexcept { return primary_.packet_flags; }
    uint8_t data_type() const noexcept { return primary_.data_type; }
    const std::array<uint8_t, 6>& rel_time_bytes() const noexcept { return primary_.rel_time; }
    uint16_t checksum() const noexcept { return primary_.checksum; }

    /// 48-bit relative time counter
    uint64_t rel_time() const noexcept {
        uint64_t value = 0;
        for (size_t i = primary_.rel_time.size(); i > 0; --i) {
            value = (value << 8) | primary_.rel_time[i - 1];
        }
        return value;
    }

    const char* data_type_name() const noexcept { return ch10io::data_type_name(data_type()); }

    const PrimaryHeader& primary() const noexcept { return primary_; }
    const std::optional<SecondaryHeader>& secondary() const noexcept { return secondary_; }

    bool has_secondary_header() const noexcept {
        return (primary_.packet_flags & flag_bits::secondary_header) != 0;
    }

    /// Bytes occupied by the primary and (if present) secondary header
    size_t header_length() const noexcept {
        return has_secondary_header() ? max_header_size : primary_header_size;
    }

    uint32_t payload_length() const noexcept { return primary_.data_length; }

    // PacketFlags decoding
    bool ipts_from_secondary() const noexcept {
        return (primary_.packet_flags & flag_bits::ipts_time_source) != 0;
    }

    bool rtc_sync_error() const noexcept {
        return (primary_.packet_flags & flag_bits::rtc_sync_error) != 0;
    }

    bool data_overflow() const noexcept {
        return (primary_.packet_flags & flag_bits::data_overflow) != 0;
    }

    SecondaryTimeFormat time_format() const noexcept {
        return static_cast<SecondaryTimeFormat>(
            (primary_.packet_flags & flag_bits::time_format_mask) >>
            flag_bits::time_format_shift);
    }

    DataChecksumType data_checksum_type() const noexcept {
        return static_cast<DataChecksumType>(primary_.packet_flags &
                                             flag_bits::checksum_type_mask);
    }

    bool operator==(const PacketHeader&) const = default;

private:
    PrimaryHeader primary_{};
    std::optional<SecondaryHeader> secondary_;
};

} // namespace ch10io
