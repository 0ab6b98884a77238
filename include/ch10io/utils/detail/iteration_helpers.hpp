#pragma once

#include <concepts>
#include <optional>
#include <set>
#include <span>

#include <cstddef>
#include <cstdint>

#include "../../expected.hpp"
#include "../../packet_header.hpp"
#include "../../status.hpp"

namespace ch10io::utils {

/// Channel IDs to keep; empty keeps every channel
using ChannelFilter = std::set<uint16_t>;

/**
 * @brief Check a header against a channel filter
 */
[[nodiscard]] inline bool passes_filter(const ChannelFilter& filter,
                                        const PacketHeader& header) noexcept {
    return filter.empty() || filter.contains(header.channel_id());
}

} // namespace ch10io::utils

namespace ch10io::utils::detail {

/**
 * @brief Concept for readers that step forward header by header
 *
 * Any reader that provides read_next_header() returning Status and exposes the
 * decoded header through header() can use these iteration helpers.
 */
template <typename T>
concept HeaderReader = requires(T& reader) {
    { reader.read_next_header() } -> std::same_as<Status>;
    { reader.header() } -> std::same_as<const std::optional<PacketHeader>&>;
};

/**
 * @brief Concept for header readers that can also load payload bytes
 */
template <typename T>
concept PayloadReader = HeaderReader<T> && requires(T& reader) {
    { reader.read_data() } -> std::same_as<Status>;
    { reader.payload() } -> std::same_as<std::span<const uint8_t>>;
};

/**
 * @brief Iterate over headers that pass a channel filter
 *
 * Error handling contract:
 * - end_of_file: Stop iteration (normal termination)
 * - Any other non-ok status: Stop iteration and return it
 *
 * @tparam Reader Type satisfying HeaderReader concept
 * @tparam Callback Function type with signature: bool(const PacketHeader&)
 * @param reader Reader providing read_next_header()
 * @param filter Channels to keep (empty = all)
 * @param callback Function called for each matching header. Return false to stop iteration.
 * @return Number of headers delivered, or the terminal status
 */
template <HeaderReader Reader, typename Callback>
expected<size_t, Status> for_each_header(Reader& reader, const ChannelFilter& filter,
                                         Callback&& callback) {
    size_t count = 0;

    while (true) {
        Status status = reader.read_next_header();
        if (status == Status::end_of_file) {
            break;
        }
        if (status != Status::ok) {
            return unexpected(status);
        }

        const PacketHeader& header = *reader.header();
        if (!passes_filter(filter, header)) {
            continue;
        }

        ++count;
        if (!callback(header)) {
            break; // Callback requested stop
        }
    }

    return count;
}

/**
 * @brief Iterate over headers and payloads that pass a channel filter
 *
 * Loads each matching packet's payload before invoking the callback. The span
 * handed to the callback is only valid for the duration of the call.
 *
 * Error handling contract:
 * - end_of_file: Stop iteration (normal termination)
 * - Any other non-ok status (including short_read): Stop iteration and return it
 *
 * @tparam Reader Type satisfying PayloadReader concept
 * @tparam Callback Function type with signature:
 *         bool(const PacketHeader&, std::span<const uint8_t>)
 */
template <PayloadReader Reader, typename Callback>
expected<size_t, Status> for_each_packet(Reader& reader, const ChannelFilter& filter,
                                         Callback&& callback) {
    size_t count = 0;

    while (true) {
        Status status = reader.read_next_header();
        if (status == Status::end_of_file) {
            break;
        }
        if (status != Status::ok) {
            return unexpected(status);
        }

        const PacketHeader& header = *reader.header();
        if (!passes_filter(filter, header)) {
            continue;
        }

        status = reader.read_data();
        if (status != Status::ok) {
            return unexpected(status);
        }

        ++count;
        if (!callback(header, reader.payload())) {
            break;
        }
    }

    return count;
}

} // namespace ch10io::utils::detail
