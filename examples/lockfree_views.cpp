// ============================================================================
// Lock-free ring example: snapshot views
//
// Demonstrates:
// - Rings shared by a producer thread and the main thread
// - Full rejections once a ring reaches capacity (nothing is overwritten)
// - Best-effort views taken while the producer is still pushing
// - Draining with pop() and reset()
// ============================================================================
#include <atomic>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "tickring.hpp"
#include "common/cli/ring_params.hpp"

using namespace tickring;


template <typename T>
std::ostream& operator<<(std::ostream& os, const std::vector<T>& items) {
    os << '[';
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i) os << ", ";
        os << items[i];
    }
    return os << ']';
}


int main(int argc, char** argv) {
    const auto params = examples::cli::ring::configure(argc, argv, "tickring lock-free ring views");
    params.dump("Parameters", std::cout);

    using StringRing = lockfree::ring_buffer<std::string>;
    using FloatRing  = lockfree::ring_buffer<double>;

    std::unique_ptr<StringRing> warn;
    std::unique_ptr<FloatRing> floats;
    if (auto err = StringRing::create(params.capacity, warn); err != Error::None) {
        TR_ERROR("Failed to create WARN ring: " << to_string(err));
        return 1;
    }
    if (auto err = FloatRing::create(params.capacity, floats); err != Error::None) {
        TR_ERROR("Failed to create float ring: " << to_string(err));
        return 1;
    }

    // -------------------------------------------------------------------------
    // Producer thread
    // -------------------------------------------------------------------------
    constexpr double pi = 3.1415926;
    std::atomic<std::uint64_t> rejected{0};
    std::atomic<bool> done{false};
    std::thread producer([&] {
        if (warn->push("WARN: Application has bad references") != Error::None) {
            rejected.fetch_add(1, std::memory_order_relaxed);
        }
        for (std::uint64_t i = 0; i <= params.samples; ++i) {
            if (floats->push(static_cast<double>(i) + pi) == Error::Full) {
                rejected.fetch_add(1, std::memory_order_relaxed);
            }
        }
        done.store(true, std::memory_order_release);
    });

    // -------------------------------------------------------------------------
    // Live views while the producer runs
    // -------------------------------------------------------------------------
    std::uint64_t live_views = 0;
    while (!done.load(std::memory_order_acquire)) {
        const auto tail = lockfree::last(*floats, 3);
        if (!tail.empty() && live_views < 5) {
            std::cout << "Live tail (size " << floats->size() << "): " << tail << '\n';
            ++live_views;
        }
        std::this_thread::yield();
    }
    producer.join();

    if (rejected.load() > 0) {
        TR_WARN("Rejected " << rejected.load() << " samples (ring full)");
    }

    // String items own memory, so they are consumed with pop() rather than viewed
    std::string message;
    while (warn->pop(message) == Error::None) {
        std::cout << "WARN ring: " << message << '\n';
    }

    // -------------------------------------------------------------------------
    // Views
    // -------------------------------------------------------------------------
    std::cout << "Last " << params.last << " floats: " << lockfree::last(*floats, params.last) << '\n';
    std::cout << "Float ring capacity: " << floats->capacity() << '\n';
    std::cout << "Float ring size: " << floats->size() << '\n';
    std::cout << "All floats: " << lockfree::values(*floats) << '\n';
    std::cout << "Floats [1, 15): " << lockfree::range(*floats, 1, 15) << '\n';
    std::cout << "Floats [10, 25): " << lockfree::range(*floats, 10, 25) << '\n';

    // -------------------------------------------------------------------------
    // Drain half, then reset
    // -------------------------------------------------------------------------
    double value = 0.0;
    for (std::uint64_t i = floats->size() / 2; i > 0; --i) {
        if (floats->pop(value) != Error::None) {
            break;
        }
    }
    std::cout << "After draining half, oldest: " << lockfree::range(*floats, 0, 1) << '\n';

    floats->telemetry().debug_dump(std::cout);

    floats->reset();
    if (floats->empty()) {
        TR_INFO("Float ring reset");
    }
    return 0;
}
