// -----------------------------------------------------------------------------
// Lock-free MPMC ring buffer with ticket claim / in-order publish
//
// Any number of producers and consumers share one fixed array of slots. Four
// monotonically increasing 64-bit counters coordinate them:
//
//     read_reserve_ <= read_pointer_ <= write_reserve_ <= write_pointer_
//
//   write_pointer_  next write ticket a producer may claim
//   write_reserve_  writes below this ticket are complete and visible
//   read_pointer_   next read ticket a consumer may claim
//   read_reserve_   reads below this ticket are complete, slots reusable
//
// A ticket k maps to slot (k & mask). Tickets never wrap, only the slot index
// does, so the capacity must be a power of two.
//
// Protocol (push, pop is symmetric):
//   1. Claim: CAS write_pointer_ k -> k+1 after checking for room.
//   2. Write the payload into slot (k & mask). Nobody else owns that slot.
//   3. Publish: CAS write_reserve_ k -> k+1, retried until it succeeds.
//
// Step 3 only succeeds once every earlier ticket has published, so items
// become visible to consumers in exactly the order their tickets were claimed.
//
// Liveness hazard:
//   Publishing waits without bound. If a thread is preempted, stalled or
//   killed between claim and publish, every thread holding a later ticket
//   waits until it resumes (forever if it never does). The WaitPolicy only
//   controls how waiting threads burn their core (see policy/publish_wait.hpp).
//   No operation is cancellable.
//
// Weak consistency:
//   size(), empty(), full() and read_at() are independent snapshots and may be
//   stale by the time the caller acts on them.
//
// Positional reads:
//   read_at() and read_ticket() are only available for trivially copyable T.
//   They copy the slot without claiming it, then reject the copy with
//   IndexOutOfRange if a consumer claimed that ticket in the meantime. For owning types (strings,
//   smart pointers) there is no safe non-destructive read while pops run, so
//   such rings only offer push() and pop().
//
// reset() is not thread-safe. No other operation may run concurrently.
//
// Example:
//     std::unique_ptr<ring_buffer<Order>> ring;
//     if (ring_buffer<Order>::create(1024, ring) != Error::None) { ... }
//     if (ring->push(order) == Error::Full) { /* retry later */ }
//     Order out;
//     if (ring->pop(out) == Error::None) { process(out); }
// -----------------------------------------------------------------------------
#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <utility>
#include <type_traits>
#include <algorithm>

#include "tickring/error.hpp"
#include "tickring/log/logger.hpp"
#include "tickring/memory/footprint.hpp"
#include "tickring/policy/publish_wait.hpp"
#include "tickring/telemetry/ring.hpp"


namespace tickring::lockfree {

template <typename T, policy::PublishWaitConcept WaitPolicy = policy::DefaultPublishWait>
class ring_buffer {
    static_assert(std::is_default_constructible_v<T>,
                  "ring_buffer slots are value-initialized and cleared to T{}");
    static_assert(std::is_move_assignable_v<T>,
                  "ring_buffer moves items in and out of slots");

public:
    using value_type = T;

    // Allocates a ring of exactly `capacity` slots.
    // Returns Error::InvalidCapacity (and leaves `out` untouched) when capacity
    // is zero or not a power of two.
    [[nodiscard]] static Error create(std::uint64_t capacity, std::unique_ptr<ring_buffer>& out) {
        if (capacity == 0 || (capacity & (capacity - 1)) != 0) {
            TR_WARN("[RING] Rejected capacity " << capacity << " (must be a non-zero power of two)");
            return Error::InvalidCapacity;
        }
        out = std::make_unique<ring_buffer>(construct_tag{}, capacity);
        return Error::None;
    }

    ~ring_buffer() noexcept = default;

    // Non-copyable / non-movable
    ring_buffer(const ring_buffer&) = delete;
    ring_buffer& operator=(const ring_buffer&) = delete;

    // Push (copy)
    [[nodiscard]] inline Error push(const T& item) {
        return push_impl_(item);
    }

    // Push (move)
    [[nodiscard]] inline Error push(T&& item) {
        return push_impl_(std::move(item));
    }

    // Emplace (construct, then move into the claimed slot)
    template <typename... Args>
    [[nodiscard]] inline Error emplace_push(Args&&... args) {
        return push_impl_(T(std::forward<Args>(args)...));
    }

    // Pop (move). The vacated slot is reset to T{} so it holds no resource.
    [[nodiscard]] Error pop(T& out) {
        std::uint64_t rp = read_pointer_.value.load(std::memory_order_relaxed);
        while (true) {
            const std::uint64_t wp = write_reserve_.value.load(std::memory_order_acquire);
            if (rp >= wp) {
                telemetry_.empty_rejections_total.inc();
                return Error::Empty;
            }
            if (read_pointer_.value.compare_exchange_weak(
                    rp, rp + 1,
                    std::memory_order_relaxed,
                    std::memory_order_relaxed))
            {
                break;
            }
            // CAS failed -> another consumer took ticket rp -> retry with the reloaded rp
            telemetry_.claim_retries_total.inc();
        }

        if constexpr (std::is_trivially_copyable_v<T>) {
            // Orders the claim before the slot stores below, so a concurrent
            // read_at() that copied a half-consumed slot sees the claim.
            std::atomic_thread_fence(std::memory_order_release);
        }

        T& slot = slots_[rp & mask_];
        out = std::move(slot);
        slot = T{};

        publish_(read_reserve_.value, rp);
        return Error::None;
    }

    // Copies the item `offset` positions after the oldest published one.
    [[nodiscard]] Error read_at(std::uint64_t offset, T& out) const
        requires std::is_trivially_copyable_v<T>
    {
        const std::uint64_t rp = read_reserve_.value.load(std::memory_order_acquire);
        const std::uint64_t wp = write_reserve_.value.load(std::memory_order_acquire);
        const std::uint64_t published = (wp > rp) ? std::min(wp - rp, capacity_) : 0;
        if (offset >= published) {
            return Error::IndexOutOfRange;
        }
        return read_ticket(rp + offset, out);
    }

    // Ticket of the oldest published item (read_at offset 0)
    [[nodiscard]] inline std::uint64_t front_ticket() const noexcept {
        return read_reserve_.value.load(std::memory_order_acquire);
    }

    // Copies the item published under an absolute ticket.
    //
    // The copy is validated after the fact, seqlock style: once a consumer has
    // claimed the ticket the slot may be cleared or reused, so the copy is
    // rejected with IndexOutOfRange. Tickets not yet published are rejected
    // too. Only trivially copyable items can be read this way, since copying
    // an owning type while a pop moves it out would touch freed memory.
    [[nodiscard]] Error read_ticket(std::uint64_t ticket, T& out) const
        requires std::is_trivially_copyable_v<T>
    {
        if (ticket >= write_reserve_.value.load(std::memory_order_acquire) ||
            ticket < read_pointer_.value.load(std::memory_order_relaxed)) {
            return Error::IndexOutOfRange;
        }
        T copy = slots_[ticket & mask_];
        std::atomic_thread_fence(std::memory_order_acquire);
        if (read_pointer_.value.load(std::memory_order_relaxed) > ticket) {
            return Error::IndexOutOfRange;
        }
        out = copy;
        return Error::None;
    }

    // True when no published item is left for pop() to claim
    [[nodiscard]] inline bool empty() const noexcept {
        const std::uint64_t rp = read_pointer_.value.load(std::memory_order_acquire);
        const std::uint64_t wp = write_reserve_.value.load(std::memory_order_acquire);
        return rp >= wp;
    }

    // True when push() would currently be rejected with Error::Full
    [[nodiscard]] inline bool full() const noexcept {
        const std::uint64_t rp = read_reserve_.value.load(std::memory_order_acquire);
        const std::uint64_t wp = write_pointer_.value.load(std::memory_order_acquire);
        return wp - rp >= capacity_;
    }

    // Published items not yet released by consumers, in [0, capacity]
    [[nodiscard]] inline std::uint64_t size() const noexcept {
        const std::uint64_t rp = read_reserve_.value.load(std::memory_order_acquire);
        const std::uint64_t wp = write_reserve_.value.load(std::memory_order_acquire);
        return (wp > rp) ? std::min(wp - rp, capacity_) : 0;
    }

    [[nodiscard]] inline std::uint64_t capacity() const noexcept { return capacity_; }

    // Rewinds all counters to zero and clears every slot.
    // Caller must guarantee that no push/pop/read_at is in flight.
    void reset() {
        read_reserve_.value.store(0, std::memory_order_relaxed);
        read_pointer_.value.store(0, std::memory_order_relaxed);
        write_reserve_.value.store(0, std::memory_order_relaxed);
        write_pointer_.value.store(0, std::memory_order_relaxed);
        for (std::uint64_t i = 0; i < capacity_; ++i) {
            slots_[i] = T{};
        }
        std::atomic_thread_fence(std::memory_order_release);
        telemetry_.resets_total.inc();
        TR_DEBUG("[RING] Reset (capacity " << capacity_ << ")");
    }

    [[nodiscard]] inline const tickring::telemetry::Ring& telemetry() const noexcept { return telemetry_; }

    [[nodiscard]] inline memory::footprint memory_usage() const noexcept {
        return memory::footprint{
            .static_bytes = sizeof(ring_buffer),
            .dynamic_bytes = capacity_ * sizeof(T)
        };
    }

private:
    struct construct_tag {
        explicit construct_tag() = default;
    };

public:
    // Reachable only through create(); construct_tag is private.
    ring_buffer(construct_tag, std::uint64_t capacity)
        : capacity_(capacity)
        , mask_(capacity - 1)
        , slots_(std::make_unique<T[]>(capacity))
    {}

private:
    template <typename U>
    Error push_impl_(U&& item) {
        std::uint64_t wp = write_pointer_.value.load(std::memory_order_relaxed);
        while (true) {
            const std::uint64_t rp = read_reserve_.value.load(std::memory_order_acquire);
            if (wp < rp) [[unlikely]] {
                // Stale wp: consumers already released past it, so it was claimed long ago
                wp = write_pointer_.value.load(std::memory_order_relaxed);
                continue;
            }
            if (wp - rp >= capacity_) {
                telemetry_.full_rejections_total.inc();
                return Error::Full;
            }
            if (write_pointer_.value.compare_exchange_weak(
                    wp, wp + 1,
                    std::memory_order_relaxed,
                    std::memory_order_relaxed))
            {
                break;
            }
            // CAS failed -> another producer took ticket wp -> retry with the reloaded wp
            telemetry_.claim_retries_total.inc();
        }

        slots_[wp & mask_] = std::forward<U>(item);

        publish_(write_reserve_.value, wp);
        return Error::None;
    }

    // Advances `reserve` from `ticket` to `ticket + 1`, waiting until every
    // earlier ticket has done the same.
    void publish_(std::atomic<std::uint64_t>& reserve, std::uint64_t ticket) noexcept {
        std::uint64_t expected = ticket;
        std::uint32_t attempt = 0;
        while (!reserve.compare_exchange_weak(
                   expected, ticket + 1,
                   std::memory_order_acq_rel,
                   std::memory_order_relaxed))
        {
            if (attempt == 0) {
                telemetry_.publish_waits_total.inc();
            }
            expected = ticket;
            WaitPolicy::pause(attempt);
            if (attempt != UINT32_MAX) {
                ++attempt;
            }
        }
    }

    struct alignas(64) PaddedCounter {
        std::atomic<std::uint64_t> value{0};
    };

    const std::uint64_t capacity_;
    const std::uint64_t mask_;
    std::unique_ptr<T[]> slots_;

    PaddedCounter write_pointer_;
    PaddedCounter write_reserve_;
    PaddedCounter read_pointer_;
    PaddedCounter read_reserve_;

    tickring::telemetry::Ring telemetry_;
};

} // namespace tickring::lockfree
