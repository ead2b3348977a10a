#pragma once

#include <string_view>

namespace tickring {

/*
===============================================================================
 tickring::Error
===============================================================================

Outcome classification shared by every buffer in the library.

Buffers never throw on their data path. Every fallible operation returns an
Error by value and callers decide whether to retry:

- InvalidCapacity is reported only by create() and is final for that call.
- Full and Empty are transient. A later retry succeeds once the opposite
  side has made progress.
- IndexOutOfRange means the offset was not below the size observed at read
  time. Re-check size() and retry.

Internal CAS contention is retried silently and never surfaces here.
===============================================================================
*/

enum class Error {
    None = 0,

    // --- Construction (caller responsibility) -------------------------------
    InvalidCapacity,  // Zero, or not a power of two where one is required

    // --- Transient / recoverable --------------------------------------------
    Full,             // No free slot observed at admission time
    Empty,            // No published item observed at admission time

    // --- Positional access --------------------------------------------------
    IndexOutOfRange,  // Offset >= size at snapshot time
};


/// Optional helper for logging / diagnostics
inline constexpr std::string_view to_string(Error err) noexcept {
    switch (err) {
    case Error::None:            return "None";
    case Error::InvalidCapacity: return "InvalidCapacity";
    case Error::Full:            return "Full";
    case Error::Empty:           return "Empty";
    case Error::IndexOutOfRange: return "IndexOutOfRange";
    default:                     return "Unknown";
    }
}

} // namespace tickring
