#pragma once

#include <ostream>

#include "tickring/metrics/atomic/counter.hpp"
#include "tickring/format.hpp"

namespace tickring::telemetry {

// ============================================================================
// Ring Telemetry
//
// Slow-path facts of a lock-free ring. The uncontended push/pop path
// touches none of these counters.
// ============================================================================

struct alignas(64) Ring final {
    // ---------------------------------------------------------------------
    // Admission
    // ---------------------------------------------------------------------

    // push() returned Error::Full
    metrics::atomic::counter64 full_rejections_total;

    // pop() returned Error::Empty
    metrics::atomic::counter64 empty_rejections_total;

    // ---------------------------------------------------------------------
    // Contention
    // ---------------------------------------------------------------------

    // Ticket CAS lost to another producer or consumer
    metrics::atomic::counter64 claim_retries_total;

    // Publish CAS failed because an earlier ticket was still unpublished
    metrics::atomic::counter64 publish_waits_total;

    // ---------------------------------------------------------------------
    // Lifecycle
    // ---------------------------------------------------------------------

    metrics::atomic::counter32 resets_total;

    inline void debug_dump(std::ostream& os) const {
        os << "\n=== Ring Telemetry ===\n";
        os << "Admission\n";
        os << "  Full rejections       : " << format_number_exact(full_rejections_total.load()) << '\n';
        os << "  Empty rejections      : " << format_number_exact(empty_rejections_total.load()) << '\n';
        os << "Contention\n";
        os << "  Claim retries         : " << format_number_exact(claim_retries_total.load()) << '\n';
        os << "  Publish waits         : " << format_number_exact(publish_waits_total.load()) << '\n';
        os << "Lifecycle\n";
        os << "  Resets                : " << format_number_exact(resets_total.load()) << '\n';
    }
};

} // namespace tickring::telemetry
