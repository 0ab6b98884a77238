// Copyright (c) 2025 Michael Smith
// SPDX-License-Identifier: MIT

#pragma once

#include <algorithm>
#include <span>
#include <vector>

#include <cstdint>

#include "../../packet_header.hpp"
#include "../../status.hpp"
#include "../../types.hpp"

namespace ch10io::utils::fileio {

/**
 * @brief Move the cursor to the next decodable header after a corrupt region
 *
 * Recovery step for callers that choose to skip damage instead of stopping on
 * format_error. Scans forward from one byte past the cursor for the sync
 * pattern and stops at the first offset whose bytes pass full header
 * validation. The cursor is only moved on success.
 *
 * @param stream Open stream (PacketStream or compatible)
 * @param max_bytes Maximum number of offsets to examine
 * @return ok with the cursor on the recovered header, end_of_file when no valid
 *         header exists within max_bytes or before end of file, or the status
 *         of a failed positioning/read call
 *
 * Example:
 * @code
 * Status st = stream.read_next_header();
 * if (st == Status::format_error) {
 *     st = ch10io::resync_forward(stream);
 * }
 * @endcode
 */
template <typename Stream>
Status resync_forward(Stream& stream, uint64_t max_bytes = default_scan_window_bytes) {
    constexpr size_t chunk_size = 64 * 1024;

    auto pos = stream.get_pos();
    if (!pos.has_value()) {
        return pos.error();
    }

    const uint64_t start = *pos + 1;
    const uint64_t remaining = stream.size() - std::min<uint64_t>(start, stream.size());
    const uint64_t limit = max_bytes >= remaining ? stream.size() : start + max_bytes;

    // Each read overlaps the next chunk by one full header so candidates that
    // straddle a chunk boundary still decode.
    std::vector<uint8_t> chunk(chunk_size + max_header_size);
    const uint8_t sync_lo = static_cast<uint8_t>(packet_sync & 0xFF);
    const uint8_t sync_hi = static_cast<uint8_t>(packet_sync >> 8);

    for (uint64_t base = start; base < limit; base += chunk_size) {
        auto got = stream.peek(base, chunk);
        if (!got.has_value()) {
            return got.error();
        }
        if (*got < primary_header_size) {
            break;
        }

        size_t candidates = static_cast<size_t>(
            std::min<uint64_t>({static_cast<uint64_t>(chunk_size), limit - base,
                                static_cast<uint64_t>(*got - primary_header_size + 1)}));
        for (size_t i = 0; i < candidates; ++i) {
            if (chunk[i] != sync_lo || chunk[i + 1] != sync_hi) {
                continue;
            }
            auto decoded =
                PacketHeader::decode(std::span<const uint8_t>(chunk.data() + i, *got - i));
            if (decoded.has_value()) {
                return stream.set_pos(base + i);
            }
        }
    }

    return Status::end_of_file;
}

} // namespace ch10io::utils::fileio
