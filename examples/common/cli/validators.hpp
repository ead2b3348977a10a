#pragma once

#include <array>
#include <exception>
#include <cstdint>
#include <string>
#include <string_view>

#include <CLI/CLI.hpp>


namespace tickring::examples::cli {

// -------------------------------------------------------------
// Lock-free ring capacity validator
// -------------------------------------------------------------
inline auto power_of_two_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        std::uint64_t n = 0;
        try {
            n = std::stoull(value);
        } catch (const std::exception&) {
            return "Capacity must be an unsigned integer";
        }
        if (n != 0 && (n & (n - 1)) == 0) {
            return {};
        }
        return "Capacity must be a non-zero power of two (e.g. 128, 1024)";
    },
    "Power-of-two validator"
);


// -------------------------------------------------------------
// Log level validator
// -------------------------------------------------------------
inline constexpr std::array<std::string_view, 6> valid_log_levels = {
    "trace", "debug", "info", "warn", "error", "fatal"
};

inline auto log_level_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        for (auto level : valid_log_levels) {
            if (value == level) {
                return {};
            }
        }
        return "Log level must be one of: trace, debug, info, warn, error, fatal";
    },
    "Log level validator"
);

} // namespace tickring::examples::cli
