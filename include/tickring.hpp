#pragma once

/*
===============================================================================
tickring - Public API Entry Point
===============================================================================

Bounded ring buffers for C++20:

  tickring::lockfree::ring_buffer   Lock-free MPMC queue (ticket claim /
                                    in-order publish over four counters)
  tickring::guarded::ring_buffer    Mutex-guarded bounded queue
  tickring::window::rolling_buffer  Single-owner rolling window of samples

All buffers report failures through tickring::Error and never throw on their
data path.
===============================================================================
*/

#include <tickring/version.hpp>
#include <tickring/error.hpp>
#include <tickring/lockfree/ring_buffer.hpp>
#include <tickring/lockfree/view.hpp>
#include <tickring/guarded/ring_buffer.hpp>
#include <tickring/window/rolling_buffer.hpp>
