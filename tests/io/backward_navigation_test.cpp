// Copyright (c) 2025 Michael Smith
// SPDX-License-Identifier: MIT

#include <vector>

#include <gtest/gtest.h>
#include <ch10io.hpp>

#include "support/ch10_builder.hpp"

using namespace ch10io;
using ch10io::test::build_recording;
using ch10io::test::Ch10FileTest;
using ch10io::test::PacketSpec;

class BackwardNavigationTest : public Ch10FileTest {
protected:
    void SetUp() override {
        Ch10FileTest::SetUp();
        bytes_ = build_recording(
            {
                PacketSpec{.channel_id = 1, .data_length = 40},
                PacketSpec{.channel_id = 2, .data_length = 12, .filler = 4},
                PacketSpec{.channel_id = 3, .data_length = 76, .secondary = true},
                PacketSpec{.channel_id = 4, .data_length = 8},
            },
            &offsets_);
        path_ = write_recording("walk.ch10", bytes_);
    }

    std::vector<uint8_t> bytes_;
    std::vector<uint64_t> offsets_;
    std::filesystem::path path_;
};

TEST_F(BackwardNavigationTest, ReverseAfterForwardPassUsesIndex) {
    PacketStream<> stream;
    ASSERT_EQ(stream.open(path_.string(), FileMode::read), Status::ok);
    while (stream.read_next_header() == Status::ok) {
    }
    EXPECT_EQ(stream.indexed_packets(), 4u);

    // Current header is channel 4; stepping back yields 3, 2, 1
    for (uint16_t expected_ch : {3, 2, 1}) {
        ASSERT_EQ(stream.read_prev_header(), Status::ok) << "channel " << expected_ch;
        EXPECT_EQ(stream.header()->channel_id(), expected_ch);
        EXPECT_EQ(stream.header_offset(), offsets_[expected_ch - 1]);
    }
    EXPECT_EQ(stream.read_prev_header(), Status::beginning_of_file);
}

TEST_F(BackwardNavigationTest, ReverseWithoutIndexScans) {
    PacketStream<> stream;
    ASSERT_EQ(stream.open(path_.string(), FileMode::read), Status::ok);
    ASSERT_EQ(stream.set_pos(bytes_.size()), Status::ok);
    EXPECT_EQ(stream.indexed_packets(), 0u);

    for (uint16_t expected_ch : {4, 3, 2, 1}) {
        ASSERT_EQ(stream.read_prev_header(), Status::ok) << "channel " << expected_ch;
        EXPECT_EQ(stream.header()->channel_id(), expected_ch);
        EXPECT_EQ(stream.header_offset(), offsets_[expected_ch - 1]);
    }
    EXPECT_EQ(stream.read_prev_header(), Status::beginning_of_file);
}

TEST_F(BackwardNavigationTest, ReadPrevLeavesCursorAfterPacket) {
    PacketStream<> stream;
    ASSERT_EQ(stream.open(path_.string(), FileMode::read), Status::ok);
    ASSERT_EQ(stream.set_pos(offsets_[2]), Status::ok);

    ASSERT_EQ(stream.read_prev_header(), Status::ok);
    EXPECT_EQ(stream.header()->channel_id(), 2);
    EXPECT_EQ(*stream.get_pos(), offsets_[2]);

    // Payload of a packet reached backward is readable
    ASSERT_EQ(stream.read_data(), Status::ok);
    ASSERT_EQ(stream.payload().size(), 12u);
    EXPECT_EQ(stream.payload()[0], 2);

    // Forward again returns the packet that followed
    ASSERT_EQ(stream.read_next_header(), Status::ok);
    EXPECT_EQ(stream.header()->channel_id(), 3);
}

TEST_F(BackwardNavigationTest, ReadPrevAfterLast) {
    PacketStream<> stream;
    ASSERT_EQ(stream.open(path_.string(), FileMode::read), Status::ok);
    ASSERT_EQ(stream.last(), Status::ok);
    ASSERT_EQ(stream.read_prev_header(), Status::ok);
    EXPECT_EQ(stream.header()->channel_id(), 3);
    EXPECT_TRUE(stream.header()->has_secondary_header());
}

TEST_F(BackwardNavigationTest, AtStartIsBeginningOfFile) {
    PacketStream<> stream;
    ASSERT_EQ(stream.open(path_.string(), FileMode::read), Status::ok);
    EXPECT_EQ(stream.read_prev_header(), Status::beginning_of_file);

    ASSERT_EQ(stream.read_next_header(), Status::ok);
    EXPECT_EQ(stream.read_prev_header(), Status::beginning_of_file);
}

TEST_F(BackwardNavigationTest, AnchorNotOnBoundary) {
    PacketStream<> stream;
    ASSERT_EQ(stream.open(path_.string(), FileMode::read), Status::ok);
    ASSERT_EQ(stream.set_pos(offsets_[1] + 3), Status::ok);
    EXPECT_EQ(stream.read_prev_header(), Status::format_error);
}

TEST_F(BackwardNavigationTest, SmallScanWindowNeedsIndex) {
    // Packet 3 is 112 bytes long, larger than the 64-byte window
    PacketStream<64> stream;
    ASSERT_EQ(stream.open(path_.string(), FileMode::read), Status::ok);
    ASSERT_EQ(stream.set_pos(offsets_[3]), Status::ok);
    EXPECT_EQ(stream.read_prev_header(), Status::format_error);

    // A forward pass records the boundaries, after which the step succeeds
    ASSERT_EQ(stream.first(), Status::ok);
    while (stream.read_next_header() == Status::ok) {
    }
    ASSERT_EQ(stream.set_pos(offsets_[3]), Status::ok);
    ASSERT_EQ(stream.read_prev_header(), Status::ok);
    EXPECT_EQ(stream.header()->channel_id(), 3);
}

TEST_F(BackwardNavigationTest, ScanSkipsSyncBytesInsidePayload) {
    // Plant a sync pattern without a valid header inside packet 1's payload
    bytes_[primary_header_size + 10] = 0x25;
    bytes_[primary_header_size + 11] = 0xEB;
    auto path = write_recording("planted.ch10", bytes_);

    PacketStream<> stream;
    ASSERT_EQ(stream.open(path.string(), FileMode::read), Status::ok);
    ASSERT_EQ(stream.set_pos(offsets_[1]), Status::ok);
    ASSERT_EQ(stream.read_prev_header(), Status::ok);
    EXPECT_EQ(stream.header()->channel_id(), 1);
    EXPECT_EQ(stream.header_offset(), 0u);
}

// =============================================================================
// Long recordings
// =============================================================================

class LongRecordingTest : public Ch10FileTest {};

TEST_F(LongRecordingTest, UnindexedWalkAcrossManyChunks) {
    std::vector<PacketSpec> specs;
    for (uint32_t i = 0; i < 20000; ++i) {
        specs.push_back(PacketSpec{.channel_id = static_cast<uint16_t>(i % 16),
                                   .data_length = i % 97,
                                   .sequence_number = static_cast<uint8_t>(i)});
    }
    std::vector<uint64_t> offsets;
    auto bytes = build_recording(specs, &offsets);
    auto path = write_recording("long.ch10", bytes);

    PacketStream<> stream;
    ASSERT_EQ(stream.open(path.string(), FileMode::read), Status::ok);
    ASSERT_EQ(stream.set_pos(bytes.size()), Status::ok);

    for (size_t n = specs.size(); n-- > 0;) {
        ASSERT_EQ(stream.read_prev_header(), Status::ok) << "packet " << n;
        ASSERT_EQ(stream.header_offset(), offsets[n]);
        ASSERT_EQ(stream.header()->sequence_number(), static_cast<uint8_t>(n));
    }
    EXPECT_EQ(stream.read_prev_header(), Status::beginning_of_file);
}

TEST_F(LongRecordingTest, PacketLargerThanOneReadChunk) {
    std::vector<uint64_t> offsets;
    auto bytes = build_recording(
        {
            PacketSpec{.channel_id = 1, .data_length = 20000},
            PacketSpec{.channel_id = 2, .data_length = 150000},
            PacketSpec{.channel_id = 3, .data_length = 7},
        },
        &offsets);
    auto path = write_recording("large.ch10", bytes);

    PacketStream<> stream;
    ASSERT_EQ(stream.open(path.string(), FileMode::read), Status::ok);
    ASSERT_EQ(stream.last(), Status::ok);
    EXPECT_EQ(*stream.get_pos(), offsets[2]);

    for (uint16_t expected_ch : {2, 1}) {
        ASSERT_EQ(stream.read_prev_header(), Status::ok) << "channel " << expected_ch;
        EXPECT_EQ(stream.header()->channel_id(), expected_ch);
        EXPECT_EQ(stream.header_offset(), offsets[expected_ch - 1]);
    }
    EXPECT_EQ(stream.read_prev_header(), Status::beginning_of_file);
}

TEST_F(LongRecordingTest, LastOnTruncatedLongRecording) {
    std::vector<PacketSpec> specs;
    for (uint32_t i = 0; i < 2000; ++i) {
        specs.push_back(PacketSpec{.channel_id = 4, .data_length = 32});
    }
    specs.push_back(PacketSpec{.channel_id = 9, .data_length = 4096});
    std::vector<uint64_t> offsets;
    auto bytes = build_recording(specs, &offsets);
    bytes.resize(offsets.back() + primary_header_size + 100);
    auto path = write_recording("long_truncated.ch10", bytes);

    PacketStream<> stream;
    ASSERT_EQ(stream.open(path.string(), FileMode::read), Status::ok);
    ASSERT_EQ(stream.last(), Status::ok);
    EXPECT_EQ(*stream.get_pos(), offsets.back());
    ASSERT_EQ(stream.read_next_header(), Status::ok);
    EXPECT_EQ(stream.header()->channel_id(), 9);
}
