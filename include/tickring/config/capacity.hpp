#pragma once

#include <cstdint>

namespace tickring::config {

/*
===============================================================================
Default Buffer Capacities
===============================================================================

Defaults used by the bundled tools when no capacity is given on the command
line. Lock-free rings require powers of two, rolling windows do not.
===============================================================================
*/

// -----------------------------------------------------------------------------
// Lock-free MPMC rings
// -----------------------------------------------------------------------------
inline constexpr std::uint64_t log_ring_capacity   = 1 << 7;  // 128
inline constexpr std::uint64_t bench_ring_capacity = 1 << 10; // 1024

// -----------------------------------------------------------------------------
// Rolling windows (log-style buffers)
// -----------------------------------------------------------------------------
inline constexpr std::uint64_t log_window_capacity = 100;

} // namespace tickring::config
