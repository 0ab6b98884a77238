// Copyright (c) 2025 Michael Smith
// SPDX-License-Identifier: MIT

#pragma once

#include <cstdint>

namespace ch10io {

// Packet content type codes (DataType header field)
enum class DataType : uint8_t {
    computer_0 = 0x00,
    user_defined = 0x00,
    computer_1 = 0x01,
    tmats = 0x01,
    computer_2 = 0x02,
    recording_event = 0x02,
    computer_3 = 0x03,
    recording_index = 0x03,
    computer_4 = 0x04,
    computer_5 = 0x05,
    computer_6 = 0x06,
    computer_7 = 0x07,
    pcm_fmt_0 = 0x08,
    pcm_fmt_1 = 0x09,
    irig_time = 0x11,
    mil1553_fmt_1 = 0x19,
    mil1553_16pp194 = 0x1A,
    analog = 0x21,
    discrete = 0x29,
    message = 0x30,
    arinc_429_fmt_0 = 0x38,
    video_fmt_0 = 0x40,
    video_fmt_1 = 0x41,
    video_fmt_2 = 0x42,
    image_fmt_0 = 0x48,
    image_fmt_1 = 0x49,
    uart_fmt_0 = 0x50,
    ieee1394_fmt_0 = 0x58,
    ieee1394_fmt_1 = 0x59,
    parallel_fmt_0 = 0x60,
    ethernet_fmt_0 = 0x68,
    can_bus = 0x78,
    fibre_chan_fmt_0 = 0x79,
    fibre_chan_fmt_1 = 0x7A,
};

/**
 * @brief Display name for a DataType code
 *
 * Total over all byte values; codes without a table entry return "Undefined".
 */
constexpr const char* data_type_name(uint8_t code) noexcept {
    switch (static_cast<DataType>(code)) {
        case DataType::user_defined:
            return "User Defined";
        case DataType::tmats:
            return "TMATS";
        case DataType::recording_event:
            return "Event";
        case DataType::recording_index:
            return "Index";
        case DataType::computer_4:
            return "Computer Generated 4";
        case DataType::computer_5:
            return "Computer Generated 5";
        case DataType::computer_6:
            return "Computer Generated 6";
        case DataType::computer_7:
            return "Computer Generated 7";
        case DataType::pcm_fmt_0:
            return "PCM Format 0";
        case DataType::pcm_fmt_1:
            return "PCM Format 1";
        case DataType::irig_time:
            return "Time";
        case DataType::mil1553_fmt_1:
            return "1553";
        case DataType::mil1553_16pp194:
            return "16PP194";
        case DataType::analog:
            return "Analog";
        case DataType::discrete:
            return "Discrete";
        case DataType::message:
            return "Message";
        case DataType::arinc_429_fmt_0:
            return "ARINC 429";
        case DataType::video_fmt_0:
            return "Video Format 0";
        case DataType::video_fmt_1:
            return "Video Format 1";
        case DataType::video_fmt_2:
            return "Video Format 2";
        case DataType::image_fmt_0:
            return "Image Format 0";
        case DataType::image_fmt_1:
            return "Image Format 1";
        case DataType::uart_fmt_0:
            return "UART";
        case DataType::ieee1394_fmt_0:
            return "IEEE 1394 Format 0";
        case DataType::ieee1394_fmt_1:
            return "IEEE 1394 Format 1";
        case DataType::parallel_fmt_0:
            return "Parallel";
        case DataType::ethernet_fmt_0:
            return "Ethernet";
        case DataType::can_bus:
            return "CAN Bus";
        case DataType::fibre_chan_fmt_0:
            return "Fibre Channel Format 0";
        case DataType::fibre_chan_fmt_1:
            return "Fibre Channel Format 1";
    }
    return "Undefined";
}

constexpr const char* data_type_name(DataType type) noexcept {
    return data_type_name(static_cast<uint8_t>(type));
}

} // namespace ch10io
