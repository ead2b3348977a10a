/*
===============================================================================
 window::rolling_buffer - Unit Tests
===============================================================================

Covered Requirements:
---------------------
W1. Construction: capacity 0 rejected, non-powers of two accepted
W2. add() never fails and overwrites the oldest sample once full
W3. last(n): newest min(n, size) samples, oldest first
W4. slice(begin, end): half-open, clamped, empty when inverted
W5. position(first, last): closed, clamped, empty when inverted
W6. reset()
W7. string_buffer and float64_buffer aliases (log-style workload)

===============================================================================
*/

#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "tickring/window/rolling_buffer.hpp"
#include "common/ring_harness.hpp"

using namespace tickring;
using Window = window::rolling_buffer<int>;


std::vector<int> iota(int first, int last) {
    std::vector<int> out;
    for (int i = first; i <= last; ++i) {
        out.push_back(i);
    }
    return out;
}

// Window of capacity 10 after adding 0..24: retains 15..24
std::unique_ptr<Window> make_rolled_window() {
    auto w = make_buffer<Window>(10);
    for (int i = 0; i < 25; ++i) {
        w->add(i);
    }
    return w;
}

// -----------------------------------------------------------------------------
// W1: Construction
// -----------------------------------------------------------------------------
void test_construction() {
    std::cout << "[TEST] W1: construction\n";

    std::unique_ptr<Window> w;
    TEST_CHECK(Window::create(0, w) == Error::InvalidCapacity);
    TEST_CHECK(w == nullptr);

    auto odd = make_buffer<Window>(7);
    TEST_CHECK(odd->capacity() == 7);
    TEST_CHECK(odd->empty());
    TEST_CHECK(odd->values().empty());

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// W2: Overwrite oldest
// -----------------------------------------------------------------------------
void test_overwrite_oldest() {
    std::cout << "[TEST] W2: add() overwrites the oldest sample\n";

    auto w = make_buffer<Window>(3);
    w->add(1);
    w->add(2);
    TEST_CHECK(w->size() == 2);
    TEST_CHECK(!w->full());
    TEST_CHECK(w->values() == iota(1, 2));

    w->add(3);
    TEST_CHECK(w->full());
    w->add(4);
    TEST_CHECK(w->size() == 3);
    TEST_CHECK(w->values() == iota(2, 4));

    auto rolled = make_rolled_window();
    TEST_CHECK(rolled->size() == 10);
    TEST_CHECK(rolled->values() == iota(15, 24));

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// W3: last(n)
// -----------------------------------------------------------------------------
void test_last() {
    std::cout << "[TEST] W3: last(n)\n";

    auto w = make_rolled_window();
    TEST_CHECK(w->last(3) == iota(22, 24));
    TEST_CHECK(w->last(10) == iota(15, 24));
    TEST_CHECK(w->last(50) == iota(15, 24));
    TEST_CHECK(w->last(0).empty());

    auto partial = make_buffer<Window>(100);
    partial->add(1);
    TEST_CHECK(partial->last(10) == iota(1, 1));

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// W4: slice(begin, end)
// -----------------------------------------------------------------------------
void test_slice() {
    std::cout << "[TEST] W4: slice(begin, end)\n";

    auto w = make_rolled_window();
    TEST_CHECK(w->slice(1, 4) == iota(16, 18));
    TEST_CHECK(w->slice(0, 10) == iota(15, 24));
    TEST_CHECK(w->slice(7, 25) == iota(22, 24));
    TEST_CHECK(w->slice(5, 5).empty());
    TEST_CHECK(w->slice(6, 3).empty());
    TEST_CHECK(w->slice(10, 15).empty());

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// W5: position(first, last)
// -----------------------------------------------------------------------------
void test_position() {
    std::cout << "[TEST] W5: position(first, last)\n";

    auto w = make_rolled_window();
    TEST_CHECK(w->position(1, 4) == iota(16, 19));
    TEST_CHECK(w->position(3, 3) == iota(18, 18));
    TEST_CHECK(w->position(7, 25) == iota(22, 24));
    TEST_CHECK(w->position(0, 9) == iota(15, 24));
    TEST_CHECK(w->position(6, 3).empty());
    TEST_CHECK(w->position(10, 12).empty());

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// W6: reset()
// -----------------------------------------------------------------------------
void test_reset() {
    std::cout << "[TEST] W6: reset\n";

    auto w = make_rolled_window();
    w->reset();
    TEST_CHECK(w->empty());
    TEST_CHECK(w->size() == 0);
    TEST_CHECK(w->capacity() == 10);
    TEST_CHECK(w->values().empty());

    w->add(42);
    TEST_CHECK(w->values() == iota(42, 42));

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// W7: Log-style aliases
// -----------------------------------------------------------------------------
void test_log_style_aliases() {
    std::cout << "[TEST] W7: string_buffer and float64_buffer\n";

    auto warnings = make_buffer<window::string_buffer>(100);
    warnings->add("WARN: Application has bad references");
    std::string line = "WARN: second";
    warnings->add(std::move(line));
    const auto tail = warnings->last(10);
    TEST_CHECK(tail.size() == 2);
    TEST_CHECK(tail.front() == "WARN: Application has bad references");
    TEST_CHECK(tail.back() == "WARN: second");

    constexpr double pi = 3.1415926;
    auto floats = make_buffer<window::float64_buffer>(100);
    for (int i = 0; i <= 300; ++i) {
        floats->add(static_cast<double>(i) + pi);
    }
    TEST_CHECK(floats->size() == 100);
    const auto newest = floats->last(10);
    TEST_CHECK(newest.size() == 10);
    TEST_CHECK(newest.front() == 291.0 + pi);
    TEST_CHECK(newest.back() == 300.0 + pi);
    TEST_CHECK(floats->slice(1, 15).size() == 14);
    TEST_CHECK(floats->slice(1, 15).front() == 202.0 + pi);
    TEST_CHECK(floats->position(10, 25).size() == 16);

    floats->reset();
    TEST_CHECK(floats->empty());

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test runner
// -----------------------------------------------------------------------------
#include "tickring/log/logger.hpp"

int main() {
    tickring::log::Logger::instance().set_level(tickring::log::Level::Trace);

    test_construction();
    test_overwrite_oldest();
    test_last();
    test_slice();
    test_position();
    test_reset();
    test_log_style_aliases();

    std::cout << "\n[ROLLING WINDOW TESTS PASSED]\n";
    return 0;
}
