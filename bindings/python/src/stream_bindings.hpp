#pragma once
// Stream bindings: PacketStream, packet_headers() generator

#include <nanobind/nanobind.h>
#include <nanobind/stl/optional.h>
#include <nanobind/stl/vector.h>
#include <nanobind/stl/string.h>

#include <ch10io.hpp>

#include "py_types.hpp"

#include <sstream>
#include <vector>

namespace nb = nanobind;
using namespace nb::literals;

namespace ch10io_python {

inline void bind_stream(nb::module_& m) {
    // =========================================================================
    // Header generator
    // =========================================================================

    nb::class_<PyHeaderIterator>(m, "PacketHeaderIterator",
                                 "Channel-filtered header generator over a PacketStream")
        .def("__iter__", [](PyHeaderIterator& it) -> PyHeaderIterator& {
            return it;
        }, nb::rv_policy::reference)
        .def("__next__", [](PyHeaderIterator& it) {
            auto& stream = it.target->stream;
            while (true) {
                ch10io::Status st = [&]() {
                    nb::gil_scoped_release release;
                    return stream.read_next_header();
                }();

                // End of file -> StopIteration
                if (st == ch10io::Status::end_of_file) {
                    throw nb::stop_iteration();
                }
                if (st != ch10io::Status::ok) {
                    raise_status(st, "packet_headers");
                }
                if (ch10io::passes_filter(it.filter, *stream.header())) {
                    return *stream.header();
                }
            }
        });

    // =========================================================================
    // PacketStream
    // =========================================================================

    nb::class_<PyPacketStream>(m, "PacketStream",
                               "IRIG 106 Chapter 10 packet stream reader")
        .def(nb::init<>())
        .def(
            "open",
            [](PyPacketStream& s, const std::string& path, ch10io::FileMode mode) {
                return s.stream.open(path, mode);
            },
            "Open a recording. Returns Status.", "path"_a, "mode"_a = ch10io::FileMode::read)
        .def("close", [](PyPacketStream& s) { return s.stream.close(); },
             "Close the recording. Returns Status.")
        .def(
            "read_next_header",
            [](PyPacketStream& s) {
                nb::gil_scoped_release release;
                return s.stream.read_next_header();
            },
            "Decode the header at the cursor and advance past the packet. Returns Status.")
        .def(
            "read_prev_header",
            [](PyPacketStream& s) {
                nb::gil_scoped_release release;
                return s.stream.read_prev_header();
            },
            "Decode the packet before the current one. Returns Status.")
        .def(
            "read_data",
            [](PyPacketStream& s) {
                nb::gil_scoped_release release;
                return s.stream.read_data();
            },
            "Load the current packet's payload. Returns Status.")
        .def("first", [](PyPacketStream& s) { return s.stream.first(); },
             "Position the cursor on the first packet. Returns Status.")
        .def("last", [](PyPacketStream& s) { return s.stream.last(); },
             "Position the cursor on the last packet. Returns Status.")
        .def("set_pos", [](PyPacketStream& s, uint64_t offset) { return s.stream.set_pos(offset); },
             "Set the cursor to a byte offset. Returns Status.", "offset"_a)
        .def(
            "get_pos",
            [](PyPacketStream& s) {
                auto pos = s.stream.get_pos();
                if (!pos.has_value()) {
                    raise_status(pos.error(), "get_pos");
                }
                return *pos;
            },
            "Current cursor offset. Raises Ch10IOError if the stream is closed.")
        .def(
            "packet_headers",
            [](nb::handle self, std::vector<uint16_t> ch_ids) {
                auto& s = nb::cast<PyPacketStream&>(self);
                return PyHeaderIterator{nb::borrow(self), &s,
                                        ch10io::ChannelFilter(ch_ids.begin(), ch_ids.end())};
            },
            "Iterate headers from the cursor, keeping only the listed channel IDs "
            "(empty = all). Raises Ch10FormatError or Ch10IOError on failure.",
            "ch_ids"_a = std::vector<uint16_t>{})
        // Properties
        .def_prop_ro("header",
                     [](PyPacketStream& s) { return s.stream.header(); },
                     "Current PacketHeader, or None")
        .def_prop_ro(
            "payload",
            [](PyPacketStream& s) {
                auto p = s.stream.payload();
                return nb::bytes(reinterpret_cast<const char*>(p.data()), p.size());
            },
            "Payload bytes loaded by the last read_data()")
        .def_prop_ro(
            "last_parse_error",
            [](PyPacketStream& s) -> std::optional<ch10io::ValidationError> {
                if (!s.stream.last_parse_error()) {
                    return std::nullopt;
                }
                return s.stream.last_parse_error()->code;
            },
            "ValidationError behind the last format_error, or None")
        .def_prop_ro("size", [](PyPacketStream& s) { return s.stream.size(); },
                     "File size in bytes at open time")
        .def_prop_ro("packets_read", [](PyPacketStream& s) { return s.stream.packets_read(); },
                     "Number of headers read forward since open")
        .def_prop_ro("is_open", [](PyPacketStream& s) { return s.stream.is_open(); })
        .def_prop_ro("mode", [](PyPacketStream& s) { return s.stream.mode(); })
        // Context manager
        .def("__enter__", [](nb::handle self) { return nb::borrow(self); })
        .def("__exit__", [](PyPacketStream& s, nb::args) {
            s.stream.close();
            return false;
        })
        .def("__repr__", [](PyPacketStream& s) {
            std::ostringstream oss;
            oss << "PacketStream(mode=" << ch10io::file_mode_string(s.stream.mode());
            if (s.stream.is_open()) {
                oss << ", position=" << s.stream.get_pos().value_or(0) << "/"
                    << s.stream.size() << " bytes, packets_read=" << s.stream.packets_read();
            }
            oss << ")";
            return oss.str();
        });

    m.def(
        "resync_forward",
        [](PyPacketStream& s, uint64_t max_bytes) {
            nb::gil_scoped_release release;
            return ch10io::resync_forward(s.stream, max_bytes);
        },
        "Move the cursor to the next valid header after a corrupt region. Returns Status.",
        "stream"_a, "max_bytes"_a = uint64_t{ch10io::default_scan_window_bytes});
}

} // namespace ch10io_python
