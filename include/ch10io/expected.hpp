#pragma once

// CH10IO Expected Type
//
// Exposes tl::expected in the ch10io namespace for consistent error handling.
// This provides a std::expected-compatible API (C++23) using the TartanLlama
// implementation for C++20 compatibility.
//
// Usage:
//   ch10io::expected<uint64_t, ch10io::Status> pos = stream.get_pos();
//   if (pos.has_value()) {
//       use(*pos);
//   } else {
//       handle(pos.error());
//   }
//
// Monadic operations:
//   result.and_then(f)  - chain on success
//   result.map(f)       - transform value
//   result.or_else(f)   - chain on error
//   result.map_error(f) - transform error

#include <tl/expected.hpp>

namespace ch10io {

using tl::expected;
using tl::make_unexpected;
using tl::unexpect;
using tl::unexpect_t;
using tl::unexpected;

} // namespace ch10io
