#pragma once

#include <algorithm>
#include <concepts>
#include <cstdint>
#include <type_traits>
#include <vector>

#include "tickring/error.hpp"

namespace tickring::lockfree {

/*
===============================================================================
Snapshot Views
===============================================================================

Read-only helpers that linearize a lock-free ring, oldest item first. They
never mutate the ring and never report an error.

Each view pins the front ticket and takes a size() snapshot up front, then
copies consecutive tickets with read_ticket(). If a concurrent pop consumes a
ticket before it is copied, the view stops early and returns the prefix it
collected. Under concurrent mutation the result is a best-effort picture, not
a linearizable one, but it is always a contiguous run of pushed items in
insertion order.

As with read_at(), the item type must be trivially copyable.
===============================================================================
*/

template <typename Ring>
concept SnapshotReadable =
    std::is_trivially_copyable_v<typename Ring::value_type> &&
    requires(const Ring& ring, std::uint64_t ticket, typename Ring::value_type& item) {
        { ring.front_ticket() } -> std::convertible_to<std::uint64_t>;
        { ring.size() } -> std::convertible_to<std::uint64_t>;
        { ring.read_ticket(ticket, item) } -> std::same_as<Error>;
    };

namespace detail {

template <SnapshotReadable Ring>
std::vector<typename Ring::value_type> collect(const Ring& ring, std::uint64_t front,
                                               std::uint64_t begin, std::uint64_t end) {
    std::vector<typename Ring::value_type> out;
    if (begin >= end) {
        return out;
    }
    out.reserve(end - begin);
    for (std::uint64_t i = begin; i < end; ++i) {
        typename Ring::value_type item{};
        if (ring.read_ticket(front + i, item) != Error::None) {
            break;
        }
        out.push_back(item);
    }
    return out;
}

} // namespace detail


// All published items
template <SnapshotReadable Ring>
[[nodiscard]] std::vector<typename Ring::value_type> values(const Ring& ring) {
    const std::uint64_t front = ring.front_ticket();
    return detail::collect(ring, front, 0, ring.size());
}

// The newest min(n, size) items, oldest first
template <SnapshotReadable Ring>
[[nodiscard]] std::vector<typename Ring::value_type> last(const Ring& ring, std::uint64_t n) {
    const std::uint64_t front = ring.front_ticket();
    const std::uint64_t size = ring.size();
    n = std::min(n, size);
    return detail::collect(ring, front, size - n, size);
}

// Items at positions [begin, end), end clamped to size
template <SnapshotReadable Ring>
[[nodiscard]] std::vector<typename Ring::value_type> range(const Ring& ring, std::uint64_t begin, std::uint64_t end) {
    const std::uint64_t front = ring.front_ticket();
    return detail::collect(ring, front, begin, std::min(end, ring.size()));
}

} // namespace tickring::lockfree
