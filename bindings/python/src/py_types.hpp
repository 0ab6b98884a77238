#pragma once
// Python wrapper types for ch10io bindings

#include <nanobind/nanobind.h>

#include <ch10io.hpp>

#include <set>
#include <string>

namespace nb = nanobind;

namespace ch10io_python {

// Exception type pointers (set during module init)
extern PyObject* format_error_type;
extern PyObject* ch10_io_error_type;

/**
 * @brief Raise the Python exception matching a non-ok, non-boundary status
 *
 * format_error and short_read map to Ch10FormatError; everything else maps
 * to Ch10IOError.
 */
[[noreturn]] inline void raise_status(ch10io::Status status, const char* context) {
    std::string msg = std::string(context) + ": " + ch10io::status_string(status);
    PyObject* type = (status == ch10io::Status::format_error ||
                      status == ch10io::Status::short_read)
                         ? format_error_type
                         : ch10_io_error_type;
    PyErr_SetString(type, msg.c_str());
    throw nb::python_error();
}

/**
 * @brief Python wrapper for PacketStream
 */
struct PyPacketStream {
    ch10io::PacketStream<> stream;

    PyPacketStream() = default;

    PyPacketStream(const PyPacketStream&) = delete;
    PyPacketStream& operator=(const PyPacketStream&) = delete;
    PyPacketStream(PyPacketStream&&) = default;
    PyPacketStream& operator=(PyPacketStream&&) = default;
};

/**
 * @brief Generator state for PacketStream.packet_headers()
 *
 * Holds a strong reference to the owning stream object so the stream outlives
 * the generator.
 */
struct PyHeaderIterator {
    nb::object owner;
    PyPacketStream* target;
    ch10io::ChannelFilter filter;
};

} // namespace ch10io_python
