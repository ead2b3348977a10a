#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include <CLI/CLI.hpp>

#include "tickring/lockfree/ring_buffer.hpp"
#include "tickring/guarded/ring_buffer.hpp"
#include "tickring/config/capacity.hpp"
#include "tickring/format.hpp"
#include "tickring/log/logger.hpp"
#include "common/cli/validators.hpp"

using namespace tickring;


/*
===============================================================================
MPMC Ring Throughput Benchmark
===============================================================================

P producer threads each push K globally unique values, C consumer threads
drain until P*K values were removed. The run is repeated on the lock-free
ring and on the mutex-guarded ring with the same capacity.

Every run is verified: each value must be removed exactly once, otherwise
the benchmark exits with a non-zero status.

Interpretation notes:
  - Publish waits count operations whose publish CAS had to wait for an
    earlier ticket. They grow with the number of threads per core, since a
    preempted ticket holder stalls every later ticket until it runs again.
  - Full/Empty rejections measure producer/consumer imbalance, not
    contention. Callers retry on both.
===============================================================================
*/

struct Params {
    std::uint64_t capacity     = config::bench_ring_capacity;
    int producers              = 4;
    int consumers              = 4;
    std::uint64_t per_producer = 1'000'000;
    bool skip_guarded          = false;
    std::string log_level      = "info";
};

struct Result {
    std::uint64_t consumed{0};
    std::uint64_t duplicates{0};
    std::uint64_t missing{0};
    std::chrono::nanoseconds elapsed{0};
};


template <typename Ring>
Result run(Ring& ring, const Params& p) {
    const std::uint64_t total = static_cast<std::uint64_t>(p.producers) * p.per_producer;
    std::vector<std::atomic<std::uint8_t>> seen(total);
    for (auto& s : seen) {
        s.store(0, std::memory_order_relaxed);
    }

    std::atomic<std::uint64_t> consumed{0};
    std::atomic<bool> go{false};
    std::vector<std::thread> threads;
    threads.reserve(static_cast<std::size_t>(p.producers + p.consumers));

    for (int id = 0; id < p.producers; ++id) {
        threads.emplace_back([&, id] {
            while (!go.load(std::memory_order_acquire)) {}
            const std::uint64_t base = static_cast<std::uint64_t>(id) * p.per_producer;
            for (std::uint64_t i = 0; i < p.per_producer; ++i) {
                while (ring.push(base + i) != Error::None) {
                    std::this_thread::yield();
                }
            }
        });
    }
    for (int id = 0; id < p.consumers; ++id) {
        threads.emplace_back([&] {
            while (!go.load(std::memory_order_acquire)) {}
            std::uint64_t v = 0;
            while (consumed.load(std::memory_order_relaxed) < total) {
                if (ring.pop(v) != Error::None) {
                    std::this_thread::yield();
                    continue;
                }
                seen[v].fetch_add(1, std::memory_order_relaxed);
                consumed.fetch_add(1, std::memory_order_relaxed);
            }
        });
    }

    const auto start = std::chrono::steady_clock::now();
    go.store(true, std::memory_order_release);
    for (auto& t : threads) {
        t.join();
    }
    const auto stop = std::chrono::steady_clock::now();

    Result r;
    r.consumed = consumed.load();
    r.elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(stop - start);
    for (const auto& s : seen) {
        const auto n = s.load(std::memory_order_relaxed);
        if (n == 0) ++r.missing;
        if (n > 1) r.duplicates += n - 1;
    }
    return r;
}


bool report(const char* name, const Result& r, std::uint64_t total) {
    const double secs = static_cast<double>(r.elapsed.count()) / 1e9;
    const double rate = secs > 0.0 ? static_cast<double>(r.consumed) / secs : 0.0;

    std::cout << "\n=== " << name << " ===\n";
    std::cout << "  Items        : " << format_number_exact(r.consumed) << " / " << format_number_exact(total) << '\n';
    std::cout << "  Elapsed      : " << format_duration(static_cast<std::uint64_t>(r.elapsed.count())) << '\n';
    std::cout << "  Throughput   : " << format_throughput(rate) << '\n';
    std::cout << "  Missing      : " << format_number_exact(r.missing) << '\n';
    std::cout << "  Duplicates   : " << format_number_exact(r.duplicates) << '\n';

    if (r.missing != 0 || r.duplicates != 0 || r.consumed != total) {
        TR_ERROR("[BENCH] " << name << " violated exactly-once delivery");
        return false;
    }
    return true;
}


int main(int argc, char** argv) {
    CLI::App app{"tickring MPMC throughput benchmark"};
    Params params{};
    app.add_option("-c,--capacity", params.capacity, "Ring capacity (power of two)")->check(examples::cli::power_of_two_validator)->default_val(params.capacity);
    app.add_option("-p,--producers", params.producers, "Producer threads")->check(CLI::Range(1, 64))->default_val(params.producers);
    app.add_option("-C,--consumers", params.consumers, "Consumer threads")->check(CLI::Range(1, 64))->default_val(params.consumers);
    app.add_option("-k,--per-producer", params.per_producer, "Items pushed by each producer")->check(CLI::PositiveNumber)->default_val(params.per_producer);
    app.add_flag("--skip-guarded", params.skip_guarded, "Only benchmark the lock-free ring");
    app.add_option("-l,--log-level", params.log_level, "Log level: trace | debug | info | warn | error")->check(examples::cli::log_level_validator)->default_val(params.log_level);
    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e, std::cout, std::cerr);
    }
    log::Logger::instance().set_level(params.log_level);

    const std::uint64_t total = static_cast<std::uint64_t>(params.producers) * params.per_producer;
    TR_INFO("[BENCH] " << params.producers << "P/" << params.consumers << "C, capacity "
            << params.capacity << ", " << format_number_exact(total) << " items");

    bool ok = true;

    std::unique_ptr<lockfree::ring_buffer<std::uint64_t>> lockfree_ring;
    if (auto err = lockfree::ring_buffer<std::uint64_t>::create(params.capacity, lockfree_ring); err != Error::None) {
        TR_ERROR("[BENCH] Cannot create lock-free ring: " << to_string(err));
        return EXIT_FAILURE;
    }
    ok &= report("lock-free ring", run(*lockfree_ring, params), total);
    lockfree_ring->telemetry().debug_dump(std::cout);

    if (!params.skip_guarded) {
        std::unique_ptr<guarded::ring_buffer<std::uint64_t>> guarded_ring;
        if (auto err = guarded::ring_buffer<std::uint64_t>::create(params.capacity, guarded_ring); err != Error::None) {
            TR_ERROR("[BENCH] Cannot create guarded ring: " << to_string(err));
            return EXIT_FAILURE;
        }
        ok &= report("guarded ring", run(*guarded_ring, params), total);
    }

    return ok ? EXIT_SUCCESS : EXIT_FAILURE;
}
