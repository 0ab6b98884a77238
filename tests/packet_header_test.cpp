// Copyright (c) 2025 Michael Smith
// SPDX-License-Identifier: MIT

#include <array>
#include <span>

#include <gtest/gtest.h>
#include <ch10io/packet_header.hpp>

using namespace ch10io;

namespace {

// ChID 3, PacketLen 40, DataLen 16, TMATS, no secondary header
std::array<uint8_t, primary_header_size> tmats_header_bytes() {
    std::array<uint8_t, primary_header_size> bytes{};
    bytes[0] = 0x25;
    bytes[1] = 0xEB;
    bytes[2] = 0x03; // channel id
    bytes[4] = 40;   // packet length
    bytes[8] = 16;   // data length
    bytes[12] = 0x06;
    bytes[13] = 0x2A;
    bytes[15] = 0x01; // TMATS
    bytes[16] = 0x01;
    bytes[17] = 0x02;
    bytes[21] = 0x80;
    uint16_t sum = detail::sum16(std::span<const uint8_t>(bytes).first(22));
    bytes[22] = static_cast<uint8_t>(sum & 0xFF);
    bytes[23] = static_cast<uint8_t>(sum >> 8);
    return bytes;
}

PacketHeader secondary_header_packet() {
    PrimaryHeader primary;
    primary.channel_id = 0x0102;
    primary.packet_length = 100;
    primary.data_length = 40;
    primary.data_type = 0x19;
    SecondaryHeader sec;
    sec.time = {0xDEADBEEF, 0x01020304};
    return PacketHeader::build(primary, sec);
}

} // namespace

// =============================================================================
// Decoding
// =============================================================================

TEST(PacketHeaderTest, DecodePrimaryOnly) {
    auto bytes = tmats_header_bytes();
    auto result = PacketHeader::decode(bytes);

    ASSERT_TRUE(result.has_value()) << result.error().message();
    const PacketHeader& hdr = *result;
    EXPECT_EQ(hdr.sync(), packet_sync);
    EXPECT_EQ(hdr.channel_id(), 3);
    EXPECT_EQ(hdr.packet_length(), 40u);
    EXPECT_EQ(hdr.data_length(), 16u);
    EXPECT_EQ(hdr.header_version(), 0x06);
    EXPECT_EQ(hdr.sequence_number(), 0x2A);
    EXPECT_EQ(hdr.data_type(), 0x01);
    EXPECT_STREQ(hdr.data_type_name(), "TMATS");
    EXPECT_FALSE(hdr.has_secondary_header());
    EXPECT_FALSE(hdr.secondary().has_value());
    EXPECT_EQ(hdr.header_length(), primary_header_size);
    EXPECT_EQ(hdr.payload_length(), 16u);
    EXPECT_EQ(hdr.rel_time(), 0x800000000201ull);
}

TEST(PacketHeaderTest, IgnoresBytesPastPrimaryWhenFlagClear) {
    std::array<uint8_t, max_header_size> bytes{};
    auto primary = tmats_header_bytes();
    std::copy(primary.begin(), primary.end(), bytes.begin());
    // Garbage where a secondary header would be
    for (size_t i = primary_header_size; i < bytes.size(); ++i) {
        bytes[i] = 0xA5;
    }

    auto result = PacketHeader::decode(bytes);
    ASSERT_TRUE(result.has_value());
    EXPECT_FALSE(result->has_secondary_header());
    EXPECT_EQ(result->header_length(), primary_header_size);
}

TEST(PacketHeaderTest, BufferTooSmall) {
    auto bytes = tmats_header_bytes();
    auto result = PacketHeader::decode(std::span<const uint8_t>(bytes).first(23));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ValidationError::buffer_too_small);
    EXPECT_EQ(result.error().status(), Status::format_error);
}

TEST(PacketHeaderTest, BadSync) {
    auto bytes = tmats_header_bytes();
    bytes[0] = 0x26;
    auto result = PacketHeader::decode(bytes);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ValidationError::bad_sync);
    EXPECT_STREQ(result.error().message(), "Sync pattern mismatch");
}

TEST(PacketHeaderTest, AnySingleByteChangeFailsValidation) {
    auto good = tmats_header_bytes();
    for (size_t i = 0; i < primary_checksum_offset; ++i) {
        auto bytes = good;
        bytes[i] ^= 0x01;
        auto result = PacketHeader::decode(bytes);
        ASSERT_FALSE(result.has_value()) << "byte " << i;
        if (i < 2) {
            EXPECT_EQ(result.error().code, ValidationError::bad_sync) << "byte " << i;
        } else {
            EXPECT_EQ(result.error().code, ValidationError::header_checksum_mismatch)
                << "byte " << i;
        }
    }
}

TEST(PacketHeaderTest, CorruptChecksumField) {
    auto bytes = tmats_header_bytes();
    bytes[23] ^= 0x10;
    auto result = PacketHeader::decode(bytes);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ValidationError::header_checksum_mismatch);
    EXPECT_EQ(result.error().raw_bytes.size(), primary_header_size);
}

TEST(PacketHeaderTest, LengthMismatch) {
    PrimaryHeader primary;
    primary.packet_length = 30;
    primary.data_length = 16; // 24 + 16 > 30
    auto hdr = PacketHeader::build(primary);

    std::array<uint8_t, primary_header_size> bytes{};
    ASSERT_EQ(hdr.encode(bytes), primary_header_size);
    auto result = PacketHeader::decode(bytes);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ValidationError::length_mismatch);
}

TEST(PacketHeaderTest, ExactLengthIsConsistent) {
    PrimaryHeader primary;
    primary.packet_length = 24;
    primary.data_length = 0;
    auto hdr = PacketHeader::build(primary);

    std::array<uint8_t, primary_header_size> bytes{};
    hdr.encode(bytes);
    auto result = PacketHeader::decode(bytes);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->payload_length(), 0u);
}

// =============================================================================
// Secondary header
// =============================================================================

TEST(PacketHeaderTest, DecodeWithSecondaryHeader) {
    auto hdr = secondary_header_packet();
    std::array<uint8_t, max_header_size> bytes{};
    ASSERT_EQ(hdr.encode(bytes), max_header_size);

    auto result = PacketHeader::decode(bytes);
    ASSERT_TRUE(result.has_value()) << result.error().message();
    EXPECT_TRUE(result->has_secondary_header());
    EXPECT_EQ(result->header_length(), max_header_size);
    ASSERT_TRUE(result->secondary().has_value());
    EXPECT_EQ(result->secondary()->time[0], 0xDEADBEEFu);
    EXPECT_EQ(result->secondary()->time[1], 0x01020304u);
    EXPECT_EQ(*result, hdr);
}

TEST(PacketHeaderTest, SecondaryFlagNeedsThirtySixBytes) {
    auto hdr = secondary_header_packet();
    std::array<uint8_t, max_header_size> bytes{};
    hdr.encode(bytes);

    auto result = PacketHeader::decode(std::span<const uint8_t>(bytes).first(30));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ValidationError::buffer_too_small);
}

TEST(PacketHeaderTest, SecondaryChecksumMismatch) {
    auto hdr = secondary_header_packet();
    std::array<uint8_t, max_header_size> bytes{};
    hdr.encode(bytes);
    bytes[primary_header_size + 3] ^= 0xFF;

    auto result = PacketHeader::decode(bytes);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ValidationError::secondary_checksum_mismatch);
}

TEST(PacketHeaderTest, SecondaryLengthCountsTowardConsistency) {
    PrimaryHeader primary;
    primary.packet_length = 50;
    primary.data_length = 16; // 36 + 16 > 50
    auto hdr = PacketHeader::build(primary, SecondaryHeader{});

    std::array<uint8_t, max_header_size> bytes{};
    hdr.encode(bytes);
    auto result = PacketHeader::decode(bytes);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ValidationError::length_mismatch);
}

TEST(PacketHeaderTest, ConstructorKeepsFlagAndOptionalInAgreement) {
    PrimaryHeader primary;
    primary.packet_flags = flag_bits::secondary_header | flag_bits::data_overflow;
    PacketHeader without(primary, std::nullopt);
    EXPECT_FALSE(without.has_secondary_header());
    EXPECT_EQ(without.packet_flags(), flag_bits::data_overflow);

    primary.packet_flags = 0;
    PacketHeader with(primary, SecondaryHeader{});
    EXPECT_TRUE(with.has_secondary_header());
    EXPECT_EQ(with.packet_flags() & flag_bits::secondary_header, flag_bits::secondary_header);
}

// =============================================================================
// Flag accessors and encoding
// =============================================================================

TEST(PacketHeaderTest, FlagAccessors) {
    PrimaryHeader primary;
    primary.packet_length = 24;
    primary.packet_flags = flag_bits::ipts_time_source | flag_bits::rtc_sync_error |
                           (1 << flag_bits::time_format_shift) | 0x02;
    auto hdr = PacketHeader::build(primary);

    EXPECT_TRUE(hdr.ipts_from_secondary());
    EXPECT_TRUE(hdr.rtc_sync_error());
    EXPECT_FALSE(hdr.data_overflow());
    EXPECT_EQ(hdr.time_format(), SecondaryTimeFormat::ieee_1588);
    EXPECT_EQ(hdr.data_checksum_type(), DataChecksumType::sum16);
}

TEST(PacketHeaderTest, EncodeReproducesDecodedBytes) {
    auto bytes = tmats_header_bytes();
    auto result = PacketHeader::decode(bytes);
    ASSERT_TRUE(result.has_value());

    std::array<uint8_t, primary_header_size> out{};
    ASSERT_EQ(result->encode(out), primary_header_size);
    EXPECT_EQ(out, bytes);
}

TEST(PacketHeaderTest, EncodeRejectsSmallBuffer) {
    auto hdr = secondary_header_packet();
    std::array<uint8_t, primary_header_size> out{};
    EXPECT_EQ(hdr.encode(out), 0u);
}

TEST(PacketHeaderTest, BuildComputesChecksum) {
    PrimaryHeader primary;
    primary.sync = 0; // overwritten by build()
    primary.channel_id = 3;
    primary.packet_length = 40;
    primary.data_length = 16;
    primary.header_version = 0x06;
    primary.sequence_number = 0x2A;
    primary.data_type = 0x01;
    primary.rel_time = {0x01, 0x02, 0, 0, 0, 0x80};

    auto hdr = PacketHeader::build(primary);
    auto expected_bytes = tmats_header_bytes();
    EXPECT_EQ(hdr.sync(), packet_sync);
    EXPECT_EQ(hdr.checksum(), static_cast<uint16_t>(expected_bytes[22] | (expected_bytes[23] << 8)));
}
