#pragma once

#include <string>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <ostream>
#include <string_view>

#include <CLI/CLI.hpp>

#include "tickring/config/capacity.hpp"
#include "tickring/log/logger.hpp"
#include "common/cli/validators.hpp"


namespace tickring::examples::cli::ring {

    // -------------------------------------------------------------
    // Lock-free ring example parameters
    // -------------------------------------------------------------
    struct Params {
        std::uint64_t capacity  = config::log_ring_capacity;
        std::uint64_t samples   = 300;
        std::uint64_t last      = 10;
        std::string log_level   = "info";

        inline void dump(const std::string& header, std::ostream& os) const {
            os << header << ":\n"
               << "  Capacity  : " << capacity << "\n"
               << "  Samples   : " << samples << "\n"
               << "  Last      : " << last << "\n"
               << "  Log Level : " << log_level << "\n";
        }
    };

    [[nodiscard]]
    inline Params configure(int argc, char** argv, std::string_view description) {
        CLI::App app{std::string(description)};
        Params params{};
        app.add_option("-c,--capacity", params.capacity, "Ring capacity (power of two)")->check(power_of_two_validator)->default_val(params.capacity);
        app.add_option("-n,--samples", params.samples, "Numeric samples to offer")->default_val(params.samples);
        app.add_option("--last", params.last, "How many recent entries to print")->default_val(params.last);
        app.add_option("-l,--log-level", params.log_level, "Log level: trace | debug | info | warn | error")->check(log_level_validator)->default_val(params.log_level);
        app.footer(
            "A full ring rejects new samples: the oldest ones are kept\n"
            "until a consumer removes them."
        );
        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            app.exit(e, std::cout, std::cerr);
            std::exit(EXIT_FAILURE);
        }
        log::Logger::instance().set_level(params.log_level);
        return params;
    }

} // namespace tickring::examples::cli::ring
