// ch10io Python Bindings
// Main module entry point - includes component bindings

#include <nanobind/nanobind.h>

// Binding components
#include "core_bindings.hpp"
#include "error_bindings.hpp"
#include "stream_bindings.hpp"

namespace nb = nanobind;

// Define the exception type pointers (declared extern in py_types.hpp)
namespace ch10io_python {
PyObject* format_error_type = nullptr;
PyObject* ch10_io_error_type = nullptr;
} // namespace ch10io_python

NB_MODULE(ch10io, m) {
    m.doc() = "ch10io - IRIG 106 Chapter 10 packet stream reader";

    // Bind components in dependency order:
    // 1. Error types (sets format_error_type, ch10_io_error_type)
    ch10io_python::bind_errors(m);

    // 2. Core types (enums, PacketHeader) - PacketHeader.decode raises Ch10FormatError
    ch10io_python::bind_core(m);

    // 3. PacketStream and header generator - needs core types, error types
    ch10io_python::bind_stream(m);
}
