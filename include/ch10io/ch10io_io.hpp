#pragma once

/**
 * @file ch10io_io.hpp
 * @brief Convenience header for Chapter 10 file navigation
 *
 * Primary types:
 * - PacketStream: Open/close, forward and backward header stepping, payload reads,
 *   first/last/set_pos/get_pos positioning
 * - HeaderRange: Lazy channel-filtered header sequence built with headers()
 * - ChannelFilter: Set of channel IDs (empty = all channels)
 *
 * Helpers:
 * - for_each_header(): Callback iteration over filtered headers
 * - for_each_packet(): Callback iteration over filtered headers plus payloads
 * - resync_forward(): Skip to the next valid header after a format_error
 */

#include "utils/detail/iteration_helpers.hpp"
#include "utils/fileio/packet_iterator.hpp"
#include "utils/fileio/packet_stream.hpp"
#include "utils/fileio/resync.hpp"

namespace ch10io {

// Chapter 10 file reader (RECOMMENDED entry point)
template <uint32_t ScanWindowBytes = default_scan_window_bytes>
using PacketStream = utils::fileio::PacketStream<ScanWindowBytes>;

template <typename Reader>
using HeaderRange = utils::fileio::HeaderRange<Reader>;

using ChannelFilter = utils::ChannelFilter;

using utils::passes_filter;
using utils::detail::for_each_header;
using utils::detail::for_each_packet;
using utils::fileio::headers;
using utils::fileio::resync_forward;

} // namespace ch10io
