#pragma once
// Core bindings: Enums, PacketHeader, data type names, constants

#include <nanobind/nanobind.h>
#include <nanobind/stl/optional.h>
#include <nanobind/stl/string.h>

#include <ch10io/data_type.hpp>
#include <ch10io/packet_header.hpp>
#include <ch10io/status.hpp>
#include <ch10io/types.hpp>

#include "py_types.hpp"

#include <array>
#include <optional>
#include <span>
#include <sstream>

namespace nb = nanobind;
using namespace nb::literals;

namespace ch10io_python {

inline void bind_core(nb::module_& m) {
    // =========================================================================
    // Enums
    // =========================================================================

    nb::enum_<ch10io::Status>(m, "Status", "Result codes returned by stream operations")
        .value("ok", ch10io::Status::ok)
        .value("end_of_file", ch10io::Status::end_of_file)
        .value("beginning_of_file", ch10io::Status::beginning_of_file)
        .value("format_error", ch10io::Status::format_error)
        .value("short_read", ch10io::Status::short_read)
        .value("not_found", ch10io::Status::not_found)
        .value("access_denied", ch10io::Status::access_denied)
        .value("invalid_handle", ch10io::Status::invalid_handle)
        .value("open_error", ch10io::Status::open_error)
        .value("already_open", ch10io::Status::already_open)
        .value("wrong_file_mode", ch10io::Status::wrong_file_mode)
        .value("read_error", ch10io::Status::read_error)
        .value("seek_error", ch10io::Status::seek_error)
        .value("close_error", ch10io::Status::close_error)
        .value("no_current_header", ch10io::Status::no_current_header)
        .value("unsupported", ch10io::Status::unsupported)
        .def("__str__", [](ch10io::Status s) { return std::string(ch10io::status_string(s)); });

    nb::enum_<ch10io::FileMode>(m, "FileMode", "Data file open mode")
        .value("closed", ch10io::FileMode::closed)
        .value("read", ch10io::FileMode::read, "Open an existing file for reading")
        .value("overwrite", ch10io::FileMode::overwrite, "Create or truncate a file")
        .value("append", ch10io::FileMode::append, "Create or extend a file")
        .value("read_in_order", ch10io::FileMode::read_in_order,
               "Open an existing file for reading in time order")
        .value("read_network_stream", ch10io::FileMode::read_network_stream,
               "Network data stream (not supported)")
        .def("__str__",
             [](ch10io::FileMode f) { return std::string(ch10io::file_mode_string(f)); });

    nb::enum_<ch10io::SecondaryTimeFormat>(m, "SecondaryTimeFormat",
                                           "Secondary header time format (flag bits 3-2)")
        .value("ch4_binary", ch10io::SecondaryTimeFormat::ch4_binary)
        .value("ieee_1588", ch10io::SecondaryTimeFormat::ieee_1588)
        .value("ertc", ch10io::SecondaryTimeFormat::ertc)
        .value("reserved", ch10io::SecondaryTimeFormat::reserved);

    nb::enum_<ch10io::DataChecksumType>(m, "DataChecksumType",
                                        "Packet body checksum kind (flag bits 1-0)")
        .value("none", ch10io::DataChecksumType::none)
        .value("sum8", ch10io::DataChecksumType::sum8)
        .value("sum16", ch10io::DataChecksumType::sum16)
        .value("sum32", ch10io::DataChecksumType::sum32);

    // =========================================================================
    // Data type catalog
    // =========================================================================

    m.def(
        "data_type_name",
        [](uint8_t code) { return std::string(ch10io::data_type_name(code)); },
        "Display name for a DataType code ('Undefined' for unknown codes)", "code"_a);

    // =========================================================================
    // PacketHeader
    // =========================================================================

    nb::class_<ch10io::PacketHeader>(m, "PacketHeader", "Decoded Chapter 10 packet header")
        .def_static(
            "decode",
            [](nb::bytes data) {
                auto bytes = std::span<const uint8_t>(
                    reinterpret_cast<const uint8_t*>(data.c_str()), data.size());
                auto result = ch10io::PacketHeader::decode(bytes);
                if (!result.has_value()) {
                    PyErr_SetString(format_error_type, result.error().message());
                    throw nb::python_error();
                }
                return *result;
            },
            "Decode and validate a header. Raises Ch10FormatError on failure.", "data"_a)
        .def(
            "to_bytes",
            [](const ch10io::PacketHeader& h) {
                std::array<uint8_t, ch10io::max_header_size> buf{};
                size_t n = h.encode(buf);
                return nb::bytes(reinterpret_cast<const char*>(buf.data()), n);
            },
            "Encode the header (24 or 36 bytes)")
        .def_prop_ro("sync", &ch10io::PacketHeader::sync)
        .def_prop_ro("channel_id", &ch10io::PacketHeader::channel_id)
        .def_prop_ro("packet_length", &ch10io::PacketHeader::packet_length)
        .def_prop_ro("data_length", &ch10io::PacketHeader::data_length)
        .def_prop_ro("header_version", &ch10io::PacketHeader::header_version)
        .def_prop_ro("sequence_number", &ch10io::PacketHeader::sequence_number)
        .def_prop_ro("packet_flags", &ch10io::PacketHeader::packet_flags)
        .def_prop_ro("data_type", &ch10io::PacketHeader::data_type)
        .def_prop_ro("checksum", &ch10io::PacketHeader::checksum)
        .def_prop_ro("rel_time", &ch10io::PacketHeader::rel_time, "48-bit relative time counter")
        .def_prop_ro("data_type_name",
                     [](const ch10io::PacketHeader& h) { return std::string(h.data_type_name()); })
        .def_prop_ro("has_secondary_header", &ch10io::PacketHeader::has_secondary_header)
        .def_prop_ro("header_length", &ch10io::PacketHeader::header_length)
        .def_prop_ro("time_format", &ch10io::PacketHeader::time_format)
        .def_prop_ro("data_checksum_type", &ch10io::PacketHeader::data_checksum_type)
        .def_prop_ro("ipts_from_secondary", &ch10io::PacketHeader::ipts_from_secondary)
        .def_prop_ro("rtc_sync_error", &ch10io::PacketHeader::rtc_sync_error)
        .def_prop_ro("data_overflow", &ch10io::PacketHeader::data_overflow)
        .def_prop_ro(
            "secondary_time",
            [](const ch10io::PacketHeader& h) -> nb::object {
                if (!h.secondary()) {
                    return nb::none();
                }
                return nb::make_tuple(h.secondary()->time[0], h.secondary()->time[1]);
            },
            "Secondary header time words, or None")
        .def("__eq__", [](const ch10io::PacketHeader& a, const ch10io::PacketHeader& b) {
            return a == b;
        })
        .def("__repr__", [](const ch10io::PacketHeader& h) {
            std::ostringstream oss;
            oss << "PacketHeader(channel_id=" << h.channel_id()
                << ", data_type=" << static_cast<int>(h.data_type()) << " '"
                << h.data_type_name() << "', packet_length=" << h.packet_length()
                << ", data_length=" << h.data_length()
                << ", seq=" << static_cast<int>(h.sequence_number())
                << (h.has_secondary_header() ? ", secondary" : "") << ")";
            return oss.str();
        });

    // =========================================================================
    // Constants
    // =========================================================================

    m.attr("PACKET_SYNC") = ch10io::packet_sync;
    m.attr("PRIMARY_HEADER_SIZE") = ch10io::primary_header_size;
    m.attr("SECONDARY_HEADER_SIZE") = ch10io::secondary_header_size;
}

} // namespace ch10io_python
