// Copyright (c) 2025 Michael Smith
// SPDX-License-Identifier: MIT

#pragma once

#include <algorithm>
#include <array>
#include <limits>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include <cerrno>
#include <cstdint>
#include <cstdio>

#include "../../detail/parse_error.hpp"
#include "../../expected.hpp"
#include "../../packet_header.hpp"
#include "../../status.hpp"
#include "../../types.hpp"

namespace ch10io::utils::fileio {

/**
 * @brief Chapter 10 recording reader with forward, backward and absolute positioning
 *
 * Owns an open file, a cursor (offset of the next header to read), the most
 * recently decoded header, and a grow-only payload buffer.
 *
 * Navigation:
 * - read_next_header(): decode at the cursor, advance the cursor by PacketLen
 * - read_prev_header(): decode the packet that ends where the current one starts
 * - first() / last() / set_pos(): reposition the cursor
 * - read_data(): load the current packet's payload into the internal buffer
 *
 * Backward steps are answered from an offset index filled by every successful
 * decode (packet end -> packet start). When the index has no entry for the
 * anchor, a bounded backward scan of at most ScanWindowBytes re-synchronizes on
 * the sync pattern and accepts the nearest candidate whose checksums validate
 * and whose offset + PacketLen lands exactly on the anchor.
 *
 * Every operation returns a Status; nothing throws and nothing is retried
 * internally.
 *
 * Thread Safety:
 * - Not thread-safe: single thread should own this instance
 * - Independent instances may run concurrently, even over the same file
 *
 * @tparam ScanWindowBytes Upper bound on bytes examined by one backward scan
 *
 * @warning This class is MOVE-ONLY (file handle ownership).
 *
 * Example usage:
 * @code
 * ch10io::PacketStream<> stream;
 * if (stream.open("flight.ch10", ch10io::FileMode::read) != ch10io::Status::ok) {
 *     return 1;
 * }
 *
 * while (stream.read_next_header() == ch10io::Status::ok) {
 *     if (stream.header()->channel_id() == 3 && stream.read_data() == ch10io::Status::ok) {
 *         process(stream.payload());
 *     }
 * }
 * @endcode
 */
template <uint32_t ScanWindowBytes = default_scan_window_bytes>
class PacketStream {
    static_assert(ScanWindowBytes >= max_header_size,
                  "ScanWindowBytes must cover at least one full header");

public:
    PacketStream() noexcept = default;

    /**
     * @brief Destructor - closes file handle
     */
    ~PacketStream() noexcept { release(); }

    // Non-copyable due to FILE* ownership
    PacketStream(const PacketStream&) = delete;
    PacketStream& operator=(const PacketStream&) = delete;

    // Move-only semantics
    PacketStream(PacketStream&& other) noexcept
        : file_(std::exchange(other.file_, nullptr)),
          mode_(std::exchange(other.mode_, FileMode::closed)),
          file_size_(other.file_size_),
          cursor_(other.cursor_),
          header_(std::move(other.header_)),
          header_offset_(other.header_offset_),
          buffer_(std::move(other.buffer_)),
          data_length_(other.data_length_),
          index_(std::move(other.index_)),
          packets_read_(other.packets_read_) {}

    PacketStream& operator=(PacketStream&& other) noexcept {
        if (this != &other) {
            release();
            file_ = std::exchange(other.file_, nullptr);
            mode_ = std::exchange(other.mode_, FileMode::closed);
            file_size_ = other.file_size_;
            cursor_ = other.cursor_;
            header_ = std::move(other.header_);
            header_offset_ = other.header_offset_;
            buffer_ = std::move(other.buffer_);
            data_length_ = other.data_length_;
            index_ = std::move(other.index_);
            packets_read_ = other.packets_read_;
            last_parse_error_.reset();
        }
        return *this;
    }

    /**
     * @brief Open a recording
     *
     * read / read_in_order open an existing file with the cursor at offset 0.
     * overwrite creates or truncates, append creates or extends with the cursor
     * at end of file; neither permits header reads.
     *
     * @param path File to open
     * @param mode Open mode
     * @return ok, not_found, access_denied, open_error, already_open,
     *         wrong_file_mode (mode closed), unsupported (network stream), seek_error
     */
    Status open(const char* path, FileMode mode) noexcept {
        if (file_) {
            return Status::already_open;
        }

        const char* fopen_mode = nullptr;
        switch (mode) {
            case FileMode::read:
            case FileMode::read_in_order:
                fopen_mode = "rb";
                break;
            case FileMode::overwrite:
                fopen_mode = "w+b";
                break;
            case FileMode::append:
                fopen_mode = "a+b";
                break;
            case FileMode::read_network_stream:
                return Status::unsupported;
            case FileMode::closed:
                return Status::wrong_file_mode;
        }
        if (fopen_mode == nullptr) {
            return Status::wrong_file_mode;
        }

        errno = 0;
        file_ = std::fopen(path, fopen_mode);
        if (!file_) {
            return map_open_errno(errno);
        }

        if (std::fseek(file_, 0, SEEK_END) != 0) {
            release();
            return Status::seek_error;
        }
        long end = std::ftell(file_);
        if (end < 0) {
            release();
            return Status::seek_error;
        }

        mode_ = mode;
        file_size_ = static_cast<uint64_t>(end);
        cursor_ = (mode == FileMode::append) ? file_size_ : 0;
        reset_position_state();
        index_.clear();
        packets_read_ = 0;
        return Status::ok;
    }

    Status open(const std::string& path, FileMode mode) noexcept {
        return open(path.c_str(), mode);
    }

    /**
     * @brief Close the recording
     *
     * Idempotent: closing a closed stream returns ok. The payload buffer keeps
     * its capacity for reuse by a later open().
     */
    Status close() noexcept {
        if (!file_) {
            return Status::ok;
        }
        int rc = std::fclose(std::exchange(file_, nullptr));
        mode_ = FileMode::closed;
        file_size_ = 0;
        cursor_ = 0;
        reset_position_state();
        index_.clear();
        return rc == 0 ? Status::ok : Status::close_error;
    }

    /**
     * @brief Decode the header at the cursor
     *
     * On ok the header becomes current and the cursor moves past the whole
     * packet (PacketLen bytes). A trailing fragment shorter than the header it
     * starts is reported as end_of_file. Any validation failure returns
     * format_error, leaves the cursor where it was, and is described by
     * last_parse_error().
     */
    Status read_next_header() noexcept {
        if (auto st = check_readable(); st != Status::ok) {
            return st;
        }
        if (cursor_ >= file_size_) {
            return Status::end_of_file;
        }

        size_t want = static_cast<size_t>(
            std::min<uint64_t>(max_header_size, file_size_ - cursor_));
        size_t got = 0;
        if (auto st = read_at(cursor_, header_scratch_.data(), want, got); st != Status::ok) {
            return st;
        }
        if (got < primary_header_size) {
            return Status::end_of_file;
        }

        auto decoded = PacketHeader::decode(std::span<const uint8_t>(header_scratch_.data(), got));
        if (!decoded.has_value()) {
            if (decoded.error().code == ValidationError::buffer_too_small) {
                return Status::end_of_file;
            }
            last_parse_error_ = decoded.error();
            reset_position_state();
            return decoded.error().status();
        }

        make_current(cursor_, *decoded);
        cursor_ += decoded->packet_length();
        ++packets_read_;
        return Status::ok;
    }

    /**
     * @brief Decode the packet immediately before the current one
     *
     * The anchor is the start of the current packet, or the cursor when no
     * header is current (after open, first(), last() or set_pos()). On ok the
     * preceding packet becomes current and the cursor points just past it, so
     * repeated calls walk toward the start of the file.
     *
     * @return ok, beginning_of_file at offset 0, format_error when no packet in
     *         the scan window ends at the anchor
     */
    Status read_prev_header() noexcept {
        if (auto st = check_readable(); st != Status::ok) {
            return st;
        }

        uint64_t anchor = header_ ? header_offset_ : cursor_;
        if (anchor == 0) {
            return Status::beginning_of_file;
        }

        auto found = find_packet_ending_at(anchor);
        if (!found.has_value()) {
            return found.error();
        }

        make_current(found->offset, found->header);
        cursor_ = found->offset + found->header.packet_length();
        return Status::ok;
    }

    /**
     * @brief Load the current packet's payload
     *
     * Reads exactly DataLen bytes following the (primary + optional secondary)
     * header. The buffer only ever grows; payload() exposes the logical length.
     *
     * @return ok, short_read when the file ends first, no_current_header
     */
    Status read_data() noexcept {
        if (auto st = check_readable(); st != Status::ok) {
            return st;
        }
        if (!header_) {
            return Status::no_current_header;
        }

        data_length_ = 0;
        uint64_t start = header_offset_ + header_->header_length();
        uint64_t required = header_->payload_length();
        if (start > file_size_ || required > file_size_ - start) {
            return Status::short_read;
        }

        if (buffer_.size() < required) {
            buffer_.resize(static_cast<size_t>(required));
        }

        size_t got = 0;
        if (auto st = read_at(start, buffer_.data(), static_cast<size_t>(required), got);
            st != Status::ok) {
            return st;
        }
        if (got < required) {
            return Status::short_read;
        }

        data_length_ = static_cast<size_t>(required);
        return Status::ok;
    }

    /**
     * @brief Position the cursor on the first packet
     */
    Status first() noexcept {
        if (auto st = check_readable(); st != Status::ok) {
            return st;
        }
        cursor_ = 0;
        reset_position_state();
        return Status::ok;
    }

    /**
     * @brief Position the cursor on the last packet
     *
     * Prefers a packet that ends exactly at end of file. For a recording with a
     * truncated final packet, falls back to the valid header nearest to the end.
     *
     * @return ok, end_of_file for an empty file, format_error if no header is
     *         found within the scan window
     */
    Status last() noexcept {
        if (auto st = check_readable(); st != Status::ok) {
            return st;
        }
        if (file_size_ == 0) {
            return Status::end_of_file;
        }

        expected<Located, Status> found = unexpected(Status::format_error);
        if (auto hit = lookup_index(file_size_)) {
            found = *hit;
        } else {
            // One pass: remember the nearest valid header while looking for one
            // that ends exactly at end of file
            std::optional<Located> nearest;
            found = scan_backward(file_size_, [&](uint64_t offset, const PacketHeader& header) {
                if (!nearest) {
                    nearest = Located{offset, header};
                }
                return offset + header.packet_length() == file_size_;
            });
            if (!found.has_value() && found.error() == Status::format_error && nearest) {
                found = *nearest;
            }
        }
        if (!found.has_value()) {
            return found.error();
        }

        record(found->offset, found->header);
        cursor_ = found->offset;
        reset_position_state();
        return Status::ok;
    }

    /**
     * @brief Set the cursor directly
     *
     * The offset is not validated; a following read_next_header() reports
     * format_error if it is not a packet boundary.
     */
    Status set_pos(uint64_t offset) noexcept {
        if (!file_) {
            return Status::invalid_handle;
        }
        cursor_ = offset;
        reset_position_state();
        return Status::ok;
    }

    /**
     * @brief Get the cursor (offset of the next header to read)
     */
    [[nodiscard]] expected<uint64_t, Status> get_pos() const noexcept {
        if (!file_) {
            return unexpected(Status::invalid_handle);
        }
        return cursor_;
    }

    /**
     * @brief Read raw bytes without moving the cursor
     *
     * @param offset File offset to read from
     * @param out Destination; fewer bytes are returned at end of file
     * @return Number of bytes read, or invalid_handle / wrong_file_mode /
     *         seek_error / read_error
     */
    [[nodiscard]] expected<size_t, Status> peek(uint64_t offset,
                                                std::span<uint8_t> out) noexcept {
        if (auto st = check_readable(); st != Status::ok) {
            return unexpected(st);
        }
        if (offset >= file_size_ || out.empty()) {
            return size_t{0};
        }
        size_t want = static_cast<size_t>(std::min<uint64_t>(out.size(), file_size_ - offset));
        size_t got = 0;
        if (auto st = read_at(offset, out.data(), want, got); st != Status::ok) {
            return unexpected(st);
        }
        return got;
    }

    /**
     * @brief Most recently decoded header, if the last navigation produced one
     */
    const std::optional<PacketHeader>& header() const noexcept { return header_; }

    /**
     * @brief File offset of the current header (meaningful only when header() is set)
     */
    uint64_t header_offset() const noexcept { return header_offset_; }

    /**
     * @brief Payload loaded by the last successful read_data()
     *
     * @warning The span is invalidated by the next read_data() call and is empty
     *          after any navigation.
     */
    std::span<const uint8_t> payload() const noexcept {
        return std::span<const uint8_t>(buffer_.data(), data_length_);
    }

    /**
     * @brief Error detail for the last format_error from read_next_header()
     *
     * raw_bytes refers to an internal scratch buffer, valid until the next read.
     */
    const std::optional<ParseError>& last_parse_error() const noexcept { return last_parse_error_; }

    /// Allocated payload buffer size in bytes (never shrinks)
    size_t buffer_capacity() const noexcept { return buffer_.size(); }

    /// Size of the file at open time
    uint64_t size() const noexcept { return file_size_; }

    /// Number of successful read_next_header() calls since open
    size_t packets_read() const noexcept { return packets_read_; }

    /// Number of packet boundaries held by the backward-navigation index
    size_t indexed_packets() const noexcept { return index_.size(); }

    bool is_open() const noexcept { return file_ != nullptr; }

    FileMode mode() const noexcept { return mode_; }

private:
    struct Located {
        uint64_t offset;
        PacketHeader header;
    };

    static Status map_open_errno(int err) noexcept {
        switch (err) {
            case ENOENT:
                return Status::not_found;
            case EACCES:
            case EPERM:
                return Status::access_denied;
            default:
                return Status::open_error;
        }
    }

    void release() noexcept {
        if (file_) {
            std::fclose(file_);
            file_ = nullptr;
        }
    }

    Status check_readable() const noexcept {
        if (!file_) {
            return Status::invalid_handle;
        }
        if (!is_read_mode(mode_)) {
            return Status::wrong_file_mode;
        }
        return Status::ok;
    }

    void reset_position_state() noexcept {
        header_.reset();
        header_offset_ = 0;
        data_length_ = 0;
    }

    void record(uint64_t offset, const PacketHeader& header) {
        index_[offset + header.packet_length()] = offset;
    }

    void make_current(uint64_t offset, const PacketHeader& header) {
        header_ = header;
        header_offset_ = offset;
        data_length_ = 0;
        last_parse_error_.reset();
        record(offset, header);
    }

    Status read_at(uint64_t offset, uint8_t* dst, size_t count, size_t& got) noexcept {
        got = 0;
        if (offset > static_cast<uint64_t>(std::numeric_limits<long>::max())) {
            return Status::seek_error;
        }
        if (std::fseek(file_, static_cast<long>(offset), SEEK_SET) != 0) {
            return Status::seek_error;
        }
        got = std::fread(dst, 1, count, file_);
        if (got < count && std::ferror(file_)) {
            std::clearerr(file_);
            return Status::read_error;
        }
        return Status::ok;
    }

    std::optional<Located> lookup_index(uint64_t anchor) noexcept {
        auto it = index_.find(anchor);
        if (it == index_.end()) {
            return std::nullopt;
        }
        std::array<uint8_t, max_header_size> bytes{};
        size_t want = static_cast<size_t>(
            std::min<uint64_t>(max_header_size, file_size_ - std::min(file_size_, it->second)));
        size_t got = 0;
        if (read_at(it->second, bytes.data(), want, got) != Status::ok) {
            return std::nullopt;
        }
        auto decoded = PacketHeader::decode(std::span<const uint8_t>(bytes.data(), got));
        if (!decoded.has_value() || it->second + decoded->packet_length() != anchor) {
            return std::nullopt;
        }
        return Located{it->second, *decoded};
    }

    expected<Located, Status> find_packet_ending_at(uint64_t anchor) {
        if (auto hit = lookup_index(anchor)) {
            return *hit;
        }
        return scan_backward(anchor, [anchor](uint64_t offset, const PacketHeader& header) {
            return offset + header.packet_length() == anchor;
        });
    }

    /**
     * Walk candidate offsets in [anchor - ScanWindowBytes, anchor) from the anchor
     * downward and return the first valid header that satisfies accept().
     *
     * The window is read in chunks that start small and double, so a header a
     * few bytes back costs one short read. Each chunk also reads one full
     * header past its top candidate so candidates at a chunk edge still decode.
     * Decoding never looks at bytes at or past the anchor.
     */
    template <typename Accept>
    expected<Located, Status> scan_backward(uint64_t anchor, Accept&& accept) {
        uint64_t lo = anchor > ScanWindowBytes ? anchor - ScanWindowBytes : 0;
        uint64_t hi = std::min(anchor, file_size_);
        if (hi <= lo || hi - lo < primary_header_size) {
            return unexpected(Status::format_error);
        }

        const uint8_t sync_lo = static_cast<uint8_t>(packet_sync & 0xFF);
        const uint8_t sync_hi = static_cast<uint8_t>(packet_sync >> 8);

        uint64_t chunk = scan_chunk_min;
        uint64_t top = hi - primary_header_size + 1; // one past the highest candidate
        while (top > lo) {
            uint64_t base = (top - lo > chunk) ? top - chunk : lo;
            uint64_t read_end = std::min<uint64_t>(top - 1 + max_header_size, hi);
            size_t span_len = static_cast<size_t>(read_end - base);
            if (scan_buffer_.size() < span_len) {
                scan_buffer_.resize(span_len);
            }

            size_t got = 0;
            if (auto st = read_at(base, scan_buffer_.data(), span_len, got); st != Status::ok) {
                return unexpected(st);
            }

            for (uint64_t offset = top; offset-- > base;) {
                size_t i = static_cast<size_t>(offset - base);
                if (i + primary_header_size > got) {
                    continue;
                }
                if (scan_buffer_[i] != sync_lo || scan_buffer_[i + 1] != sync_hi) {
                    continue;
                }
                auto decoded = PacketHeader::decode(
                    std::span<const uint8_t>(scan_buffer_.data() + i, got - i));
                if (decoded.has_value() && accept(offset, *decoded)) {
                    return Located{offset, *decoded};
                }
            }

            top = base;
            chunk = std::min<uint64_t>(chunk * 2, scan_chunk_max);
        }
        return unexpected(Status::format_error);
    }

    static constexpr uint64_t scan_chunk_min = 4 * 1024;
    static constexpr uint64_t scan_chunk_max = 64 * 1024;

    FILE* file_{nullptr};               ///< File handle
    FileMode mode_{FileMode::closed};   ///< Mode passed to open()
    uint64_t file_size_{0};             ///< Total file size in bytes at open time
    uint64_t cursor_{0};                ///< Offset of the next header to read
    std::optional<PacketHeader> header_; ///< Current header
    uint64_t header_offset_{0};         ///< Offset of the current header
    std::vector<uint8_t> buffer_;       ///< Payload storage (grow-only)
    size_t data_length_{0};             ///< Logical payload length in buffer_
    std::map<uint64_t, uint64_t> index_; ///< Packet end offset -> packet start offset
    size_t packets_read_{0};
    std::array<uint8_t, max_header_size> header_scratch_{};
    std::vector<uint8_t> scan_buffer_;
    std::optional<ParseError> last_parse_error_;
};

} // namespace ch10io::utils::fileio
