#pragma once

#include <concepts>
#include <cstdint>
#include <thread>

#include "tickring/config/publish.hpp"
#include "tickring/system/cpu_relax.hpp"

namespace tickring::policy {
namespace publish_wait {

// ============================================================================
// Publish Wait Policy
// ============================================================================
//
// Controls what a thread does between failed publish CAS attempts while an
// earlier ticket is still unpublished.
//
// Every policy waits without bound and preserves strict in-ticket-order
// publication. Policies differ only in how the waiting thread uses its core.
//
// Spin
//   - Re-attempts immediately (tight busy loop)
//
// Relax
//   - Issues a CPU pause hint between attempts
//
// Backoff
//   - Pause hint for the first config::publish::RELAX_SPINS attempts
//   - Yields the time slice afterwards
//
// ============================================================================

struct Spin {
    static void pause(std::uint32_t) noexcept {}
};

struct Relax {
    static void pause(std::uint32_t) noexcept {
        system::cpu_relax();
    }
};

struct Backoff {
    static void pause(std::uint32_t attempt) noexcept {
        if (attempt < config::publish::RELAX_SPINS) {
            system::cpu_relax();
        } else {
            std::this_thread::yield();
        }
    }
};

} // namespace publish_wait

// ----------------------------------------------------------------------------
// Concept
// ----------------------------------------------------------------------------

template<class T>
concept PublishWaitConcept =
    requires(std::uint32_t attempt) {
        { T::pause(attempt) } noexcept;
    };

// ----------------------------------------------------------------------------
// Default
// ----------------------------------------------------------------------------

using DefaultPublishWait = publish_wait::Backoff;

} // namespace tickring::policy
