// Copyright (c) 2025 Michael Smith
// SPDX-License-Identifier: MIT

#pragma once

#include <iterator>
#include <utility>

#include <cstddef>

#include "../../packet_header.hpp"
#include "../../status.hpp"
#include "../detail/iteration_helpers.hpp"

namespace ch10io::utils::fileio {

/**
 * @brief Lazy, filtered, single-pass sequence of packet headers
 *
 * Each step calls read_next_header() on the underlying reader and yields the
 * header when its channel passes the filter. The sequence ends quietly on
 * end_of_file; any other status ends it as well and is kept in status().
 *
 * The range holds a reference to the reader and nothing else: skipped packets
 * are not buffered, and the yielded header is the reader's current header.
 * Payloads are not read; call read_data() on the reader inside the loop body
 * before advancing if the bytes are needed.
 *
 * To restart, reposition the reader (first(), set_pos()) and build a new range.
 *
 * Example usage:
 * @code
 * ch10io::PacketStream<> stream;
 * stream.open("flight.ch10", ch10io::FileMode::read);
 *
 * auto range = ch10io::headers(stream, {5});
 * for (const auto& hdr : range) {
 *     if (stream.read_data() == ch10io::Status::ok) {
 *         decode_1553(stream.payload());
 *     }
 * }
 * if (range.status() != ch10io::Status::ok) {
 *     report(range.status());
 * }
 * @endcode
 *
 * @tparam Reader Type satisfying detail::HeaderReader
 */
template <detail::HeaderReader Reader>
class HeaderRange {
public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = PacketHeader;
        using difference_type = std::ptrdiff_t;
        using pointer = const PacketHeader*;
        using reference = const PacketHeader&;

        iterator() = default;

        reference operator*() const noexcept { return *range_->reader_->header(); }
        pointer operator->() const noexcept { return &*range_->reader_->header(); }

        iterator& operator++() {
            range_->advance();
            return *this;
        }

        void operator++(int) { ++*this; }

        friend bool operator==(const iterator& it, std::default_sentinel_t) noexcept {
            return it.range_ == nullptr || it.range_->done();
        }

    private:
        friend class HeaderRange;
        explicit iterator(HeaderRange* range) noexcept : range_(range) {}

        HeaderRange* range_{nullptr};
    };

    HeaderRange(Reader& reader, ChannelFilter filter) : reader_(&reader), filter_(std::move(filter)) {}

    // The iterator points back into the range
    HeaderRange(const HeaderRange&) = delete;
    HeaderRange& operator=(const HeaderRange&) = delete;

    /**
     * @brief Start the sequence
     *
     * Single pass: the first call reads up to the first matching header, later
     * calls resume from wherever iteration stopped.
     */
    iterator begin() {
        if (!started_) {
            started_ = true;
            advance();
        }
        return iterator(this);
    }

    std::default_sentinel_t end() const noexcept { return {}; }

    /**
     * @brief Terminal status
     *
     * ok while iterating and after a clean end_of_file; otherwise the status
     * that ended the sequence.
     */
    Status status() const noexcept { return status_; }

    /// True once the underlying reader stopped producing headers
    bool done() const noexcept { return done_; }

    /// Number of headers yielded so far
    size_t yielded() const noexcept { return yielded_; }

    const ChannelFilter& filter() const noexcept { return filter_; }

private:
    void advance() {
        if (done_) {
            return;
        }
        while (true) {
            Status st = reader_->read_next_header();
            if (st == Status::ok) {
                if (passes_filter(filter_, *reader_->header())) {
                    ++yielded_;
                    return;
                }
                continue;
            }
            done_ = true;
            status_ = (st == Status::end_of_file) ? Status::ok : st;
            return;
        }
    }

    Reader* reader_;
    ChannelFilter filter_;
    Status status_{Status::ok};
    size_t yielded_{0};
    bool started_{false};
    bool done_{false};
};

/**
 * @brief Build a filtered header sequence over a reader
 *
 * @param reader Reader to step; must outlive the range
 * @param filter Channel IDs to yield (empty = all)
 */
template <detail::HeaderReader Reader>
HeaderRange<Reader> headers(Reader& reader, ChannelFilter filter = {}) {
    return HeaderRange<Reader>(reader, std::move(filter));
}

} // namespace ch10io::utils::fileio
