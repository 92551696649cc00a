#pragma once

// SYNCMAP Expected Type
//
// Exposes tl::expected in the syncmap namespace for recoverable failures
// (rejected insertions, failed validation, malformed time strings).
//
// Usage:
//   auto added = list.add(fragment);
//   if (!added) {
//       handle(added.error());
//   }

#include <tl/expected.hpp>

namespace syncmap {

using tl::expected;
using tl::make_unexpected;
using tl::unexpect;
using tl::unexpect_t;
using tl::unexpected;

} // namespace syncmap
