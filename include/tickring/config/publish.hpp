/*
================================================================================
Publish Wait Configuration
================================================================================

A producer (or consumer) that has finished its slot access must wait until
every earlier ticket holder has published before its own publish CAS can
succeed. These constants shape how that wait spends CPU time.

RELAX_SPINS:
    Number of failed publish attempts answered with a CPU pause hint before
    the Backoff policy starts yielding the time slice. Yielding lets a
    preempted earlier ticket holder get scheduled again when threads
    outnumber cores.

None of these values bounds the wait. Publish order always equals claim
order, and a thread that stops forever between claim and publish stalls
every later ticket.
================================================================================
*/
#pragma once

#include <cstdint>


namespace tickring::config::publish {

inline constexpr std::uint32_t RELAX_SPINS = 64;

} // namespace tickring::config::publish
