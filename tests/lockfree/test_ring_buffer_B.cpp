/*
===============================================================================
 lockfree::ring_buffer - Group B Unit Tests
===============================================================================

Scope:
------
Single-threaded queue semantics of tickring::lockfree::ring_buffer<T>.
No concurrency is involved; every snapshot query is exact here.

Covered Requirements:
---------------------
B1. FIFO law
    - Inserting 1..N then removing N times yields 1..N in order
    - The N+1-th insert before any removal is rejected with Full
    - Remove on a fresh ring is rejected with Empty

B2. Full then one removal
    - full() clears after a single pop and the next push succeeds

B3. Wrap-around
    - Insert N, remove M, insert M more: drain order skips the first M

B4. Positional read
    - read_at(i) matches drain position i without changing size
    - Offsets >= size are rejected with IndexOutOfRange

B5. Reset
    - Clears to a fresh state and the ring behaves like a new one

B6. Slot release
    - A removed value no longer lives in its slot
    - reset() releases every value still held

===============================================================================
*/

#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "tickring/lockfree/ring_buffer.hpp"
#include "common/ring_harness.hpp"

using namespace tickring;
using Ring = lockfree::ring_buffer<int>;


// -----------------------------------------------------------------------------
// Group B1: FIFO law
// -----------------------------------------------------------------------------
void test_fifo_law() {
    std::cout << "[TEST] Group B1: FIFO law, Full and Empty\n";

    constexpr int N = 16;
    auto ring = make_buffer<Ring>(N);

    int out = -1;
    TEST_CHECK_ERROR(ring->pop(out), Error::Empty);
    TEST_CHECK(out == -1);

    for (int i = 1; i <= N; ++i) {
        TEST_CHECK_ERROR(ring->push(i), Error::None);
        TEST_CHECK(ring->size() == static_cast<std::uint64_t>(i));
    }
    TEST_CHECK(ring->full());
    TEST_CHECK(!ring->empty());
    TEST_CHECK_ERROR(ring->push(N + 1), Error::Full);
    TEST_CHECK(ring->size() == N);

    for (int i = 1; i <= N; ++i) {
        TEST_CHECK_ERROR(ring->pop(out), Error::None);
        TEST_CHECK(out == i);
    }
    TEST_CHECK(ring->empty());
    TEST_CHECK(ring->size() == 0);
    TEST_CHECK_ERROR(ring->pop(out), Error::Empty);

    TEST_CHECK(ring->telemetry().full_rejections_total.load() == 1);
    TEST_CHECK(ring->telemetry().empty_rejections_total.load() == 2);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group B2: Full then one removal
// -----------------------------------------------------------------------------
void test_full_then_pop_one() {
    std::cout << "[TEST] Group B2: full ring accepts a push after one pop\n";

    auto ring = make_buffer<Ring>(8);
    for (int i = 0; i < 8; ++i) {
        TEST_CHECK_ERROR(ring->push(i), Error::None);
    }
    TEST_CHECK(ring->full());
    TEST_CHECK_ERROR(ring->push(100), Error::Full);

    int out = -1;
    TEST_CHECK_ERROR(ring->pop(out), Error::None);
    TEST_CHECK(out == 0);
    TEST_CHECK(!ring->full());

    TEST_CHECK_ERROR(ring->push(200), Error::None);
    TEST_CHECK(ring->full());

    // Remaining order: 1..7 then 200
    for (int i = 1; i < 8; ++i) {
        TEST_CHECK_ERROR(ring->pop(out), Error::None);
        TEST_CHECK(out == i);
    }
    TEST_CHECK_ERROR(ring->pop(out), Error::None);
    TEST_CHECK(out == 200);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group B3: Wrap-around
// -----------------------------------------------------------------------------
void test_wrap_around() {
    std::cout << "[TEST] Group B3: wrap-around keeps insertion order\n";

    constexpr int N = 8;
    constexpr int M = 5;
    auto ring = make_buffer<Ring>(N);

    std::vector<int> inserted;
    for (int i = 0; i < N; ++i) {
        TEST_CHECK_ERROR(ring->push(i), Error::None);
        inserted.push_back(i);
    }
    int out = -1;
    for (int i = 0; i < M; ++i) {
        TEST_CHECK_ERROR(ring->pop(out), Error::None);
        TEST_CHECK(out == inserted[i]);
    }
    for (int i = N; i < N + M; ++i) {
        TEST_CHECK_ERROR(ring->push(i), Error::None);
        inserted.push_back(i);
    }
    TEST_CHECK(ring->full());

    for (std::size_t i = M; i < inserted.size(); ++i) {
        TEST_CHECK_ERROR(ring->pop(out), Error::None);
        TEST_CHECK(out == inserted[i]);
    }
    TEST_CHECK(ring->empty());

    // Many laps around a tiny ring
    auto tiny = make_buffer<Ring>(2);
    for (int i = 0; i < 1000; ++i) {
        TEST_CHECK_ERROR(tiny->push(i), Error::None);
        TEST_CHECK_ERROR(tiny->pop(out), Error::None);
        TEST_CHECK(out == i);
    }

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group B4: Positional read
// -----------------------------------------------------------------------------
void test_positional_read() {
    std::cout << "[TEST] Group B4: read_at matches drain order\n";

    auto ring = make_buffer<Ring>(8);
    int out = -1;
    TEST_CHECK_ERROR(ring->read_at(0, out), Error::IndexOutOfRange);

    // Shift the window so that positions straddle the physical end
    for (int i = 0; i < 6; ++i) {
        TEST_CHECK_ERROR(ring->push(i), Error::None);
    }
    for (int i = 0; i < 6; ++i) {
        TEST_CHECK_ERROR(ring->pop(out), Error::None);
    }
    for (int i = 10; i < 17; ++i) {
        TEST_CHECK_ERROR(ring->push(i), Error::None);
    }

    const std::uint64_t size = ring->size();
    TEST_CHECK(size == 7);

    std::vector<int> peeked;
    for (std::uint64_t i = 0; i < size; ++i) {
        TEST_CHECK_ERROR(ring->read_at(i, out), Error::None);
        peeked.push_back(out);
    }
    TEST_CHECK(ring->size() == size);
    TEST_CHECK_ERROR(ring->read_at(size, out), Error::IndexOutOfRange);
    TEST_CHECK_ERROR(ring->read_at(1000, out), Error::IndexOutOfRange);

    for (std::uint64_t i = 0; i < size; ++i) {
        TEST_CHECK_ERROR(ring->pop(out), Error::None);
        TEST_CHECK(out == peeked[i]);
        TEST_CHECK(out == static_cast<int>(10 + i));
    }

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group B5: Reset
// -----------------------------------------------------------------------------
void test_reset() {
    std::cout << "[TEST] Group B5: reset returns to a fresh state\n";

    auto ring = make_buffer<Ring>(4);
    for (int i = 0; i < 4; ++i) {
        TEST_CHECK_ERROR(ring->push(i), Error::None);
    }
    int out = -1;
    TEST_CHECK_ERROR(ring->pop(out), Error::None);
    TEST_CHECK_ERROR(ring->push(9), Error::None);

    ring->reset();
    TEST_CHECK(ring->size() == 0);
    TEST_CHECK(ring->empty());
    TEST_CHECK(!ring->full());
    TEST_CHECK(ring->capacity() == 4);
    TEST_CHECK_ERROR(ring->read_at(0, out), Error::IndexOutOfRange);
    TEST_CHECK_ERROR(ring->pop(out), Error::Empty);
    TEST_CHECK(ring->telemetry().resets_total.load() == 1);

    // Identical behavior to a freshly created ring
    for (int i = 1; i <= 4; ++i) {
        TEST_CHECK_ERROR(ring->push(i), Error::None);
    }
    TEST_CHECK_ERROR(ring->push(5), Error::Full);
    for (int i = 1; i <= 4; ++i) {
        TEST_CHECK_ERROR(ring->pop(out), Error::None);
        TEST_CHECK(out == i);
    }
    TEST_CHECK(ring->empty());

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group B6: Slot release
// -----------------------------------------------------------------------------
void test_slot_release() {
    std::cout << "[TEST] Group B6: removed values are released from their slot\n";

    using SharedRing = lockfree::ring_buffer<std::shared_ptr<std::string>>;
    auto ring = make_buffer<SharedRing>(4);

    auto payload = std::make_shared<std::string>("payload");
    TEST_CHECK_ERROR(ring->push(payload), Error::None);
    TEST_CHECK(payload.use_count() == 2);

    std::shared_ptr<std::string> out;
    TEST_CHECK_ERROR(ring->pop(out), Error::None);
    TEST_CHECK(*out == "payload");
    out.reset();
    TEST_CHECK(payload.use_count() == 1);

    TEST_CHECK_ERROR(ring->push(payload), Error::None);
    TEST_CHECK_ERROR(ring->push(payload), Error::None);
    TEST_CHECK(payload.use_count() == 3);
    ring->reset();
    TEST_CHECK(payload.use_count() == 1);

    // Move-only payloads go through push(T&&) and pop()
    using UniqueRing = lockfree::ring_buffer<std::unique_ptr<int>>;
    auto unique_ring = make_buffer<UniqueRing>(2);
    TEST_CHECK_ERROR(unique_ring->push(std::make_unique<int>(7)), Error::None);
    TEST_CHECK_ERROR(unique_ring->emplace_push(new int(8)), Error::None);
    std::unique_ptr<int> value;
    TEST_CHECK_ERROR(unique_ring->pop(value), Error::None);
    TEST_CHECK(value && *value == 7);
    TEST_CHECK_ERROR(unique_ring->pop(value), Error::None);
    TEST_CHECK(value && *value == 8);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test runner
// -----------------------------------------------------------------------------
#include "tickring/log/logger.hpp"

int main() {
    tickring::log::Logger::instance().set_level(tickring::log::Level::Trace);

    test_fifo_law();
    test_full_then_pop_one();
    test_wrap_around();
    test_positional_read();
    test_reset();
    test_slot_release();

    std::cout << "\n[GROUP B - SINGLE-THREADED SEMANTICS TESTS PASSED]\n";
    return 0;
}
