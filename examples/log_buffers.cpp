// ============================================================================
// Rolling window example: log-style buffers
//
// Demonstrates:
// - One string window per severity (INFO, WARN, ERROR, FATAL)
// - A numeric window that keeps only the most recent samples
// - last(n), values(), slice(begin, end) and position(first, last) views
// - reset()
// ============================================================================
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "tickring.hpp"
#include "common/cli/window_params.hpp"

using namespace tickring;


// -----------------------------------------------------------------------------
// Printing helpers
// -----------------------------------------------------------------------------
template <typename T>
std::ostream& operator<<(std::ostream& os, const std::vector<T>& items) {
    os << '[';
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i) os << ", ";
        os << items[i];
    }
    return os << ']';
}


// -----------------------------------------------------------------------------
// Application state: one window per severity plus a numeric window
// -----------------------------------------------------------------------------
struct App {
    std::mutex mutex;
    std::unique_ptr<window::string_buffer> info;
    std::unique_ptr<window::string_buffer> warn;
    std::unique_ptr<window::string_buffer> error;
    std::unique_ptr<window::string_buffer> fatal;
    std::unique_ptr<window::float64_buffer> floats;

    [[nodiscard]] Error init(std::uint64_t capacity) {
        for (auto* w : {&info, &warn, &error, &fatal}) {
            if (auto err = window::string_buffer::create(capacity, *w); err != Error::None) {
                return err;
            }
        }
        return window::float64_buffer::create(capacity, floats);
    }
};


int main(int argc, char** argv) {
    const auto params = examples::cli::window::configure(argc, argv, "tickring rolling window log buffers");
    params.dump("Parameters", std::cout);

    App app;
    if (auto err = app.init(params.capacity); err != Error::None) {
        TR_ERROR("Failed to create log windows: " << to_string(err));
        return 1;
    }

    // -------------------------------------------------------------------------
    // Simulated log traffic
    // -------------------------------------------------------------------------
    {
        std::lock_guard<std::mutex> lock(app.mutex);
        app.info->add("INFO: Lorem ipsum dolor sit amet, consectetur adipiscing elit");
        app.warn->add("WARN: Application has bad references");
        app.error->add("ERROR: Line count not found");
        app.fatal->add("FATAL: Application failed to compile");
    }

    constexpr double pi = 3.145926;
    for (std::uint64_t i = 0; i <= params.samples; ++i) {
        app.floats->add(static_cast<double>(i) + pi);
    }
    TR_DEBUG("Fed " << params.samples + 1 << " samples into a window of " << app.floats->capacity());

    // -------------------------------------------------------------------------
    // Views
    // -------------------------------------------------------------------------
    std::cout << "Last " << params.last << " INFO messages: "  << app.info->last(params.last)  << '\n';
    std::cout << "Last " << params.last << " WARN messages: "  << app.warn->last(params.last)  << '\n';
    std::cout << "Last " << params.last << " ERROR messages: " << app.error->last(params.last) << '\n';
    std::cout << "Last " << params.last << " FATAL messages: " << app.fatal->last(params.last) << '\n';

    std::cout << "Last " << params.last << " floats: " << app.floats->last(params.last) << '\n';
    std::cout << "Float window capacity: " << app.floats->capacity() << '\n';
    std::cout << "All floats: " << app.floats->values() << '\n';
    std::cout << "Floats [1, 15): " << app.floats->slice(1, 15) << '\n';
    std::cout << "Floats [10, 25]: " << app.floats->position(10, 25) << '\n';

    memory::footprint total;
    total.add(*app.info);
    total.add(*app.warn);
    total.add(*app.error);
    total.add(*app.fatal);
    total.add(*app.floats);
    TR_INFO("Window memory: " << format_bytes(total.total_bytes()));

    app.floats->reset();
    if (app.floats->empty()) {
        TR_INFO("Float window reset");
    }
    return 0;
}
