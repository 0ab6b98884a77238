#pragma once
// Error bindings: ValidationError, Ch10FormatError, Ch10IOError

#include <nanobind/nanobind.h>

#include <ch10io/types.hpp>

#include "py_types.hpp"

#include <stdexcept>
#include <string>

namespace nb = nanobind;
using namespace nb::literals;

namespace ch10io_python {

inline void bind_errors(nb::module_& m) {
    // =========================================================================
    // ValidationError enum (detail behind Status.format_error)
    // =========================================================================

    nb::enum_<ch10io::ValidationError>(m, "ValidationError",
                                       "Header validation failure detail")
        .value("none", ch10io::ValidationError::none, "No error, header is valid")
        .value("buffer_too_small", ch10io::ValidationError::buffer_too_small,
               "Fewer bytes than the header requires")
        .value("bad_sync", ch10io::ValidationError::bad_sync, "Sync field is not 0xEB25")
        .value("header_checksum_mismatch", ch10io::ValidationError::header_checksum_mismatch,
               "Primary header checksum failed")
        .value("secondary_checksum_mismatch",
               ch10io::ValidationError::secondary_checksum_mismatch,
               "Secondary header checksum failed")
        .value("length_mismatch", ch10io::ValidationError::length_mismatch,
               "PacketLen smaller than header plus DataLen")
        .def("__str__", [](ch10io::ValidationError e) {
            return std::string(ch10io::validation_error_string(e));
        });

    // =========================================================================
    // Custom Exceptions
    // =========================================================================

    // Ch10FormatError - bad sync, checksum, lengths, or truncated payload
    auto format_error =
        nb::exception<std::runtime_error>(m, "Ch10FormatError", PyExc_ValueError);
    format_error_type = format_error.ptr();

    // Ch10IOError - open/seek/read failures and misuse of a closed stream
    // Inherits from OSError to match Python conventions for I/O errors
    auto io_error = nb::exception<std::runtime_error>(m, "Ch10IOError", PyExc_OSError);
    ch10_io_error_type = io_error.ptr();
}

} // namespace ch10io_python
