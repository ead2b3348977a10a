#pragma once

#include <string>
#include <format>
#include <cstdint>
#include <algorithm>


namespace tickring {

// Format an operation rate (e.g., "12.3 M ops/s")
inline std::string format_throughput(double value, const char* suffix = "ops/s") {
    static const char* units[] = {"", "K", "M", "G", "T"};
    int unit_index = 0;
    while (value >= 1000.0 && unit_index < 4) {
        value /= 1000.0;
        ++unit_index;
    }
    int precision = (value < 10.0) ? 2 : (value < 100.0) ? 1 : 0;
    return std::format("{:.{}f} {} {}", value, precision, units[unit_index], suffix);
}


// Format a duration given in nanoseconds
// Examples:
//   42            -> "42.0 ns"
//   1'234         -> "1.23 us"
//   3'456'000'000 -> "3.46 s"
inline std::string format_duration(std::uint64_t ns) {
    double value = static_cast<double>(ns);
    const char* unit = "ns";

    if (value >= 1'000.0) {
        value /= 1'000.0;
        unit = "us";
    }
    if (value >= 1'000.0) {
        value /= 1'000.0;
        unit = "ms";
    }
    if (value >= 1'000.0) {
        value /= 1'000.0;
        unit = "s";
    }

    int precision =
        (value < 10.0)  ? 2 :
        (value < 100.0) ? 1 : 0;

    return std::format("{:.{}f} {}", value, precision, unit);
}


// Format an integer with thousands separators
// Example: 6436311 -> "6,436,311"
inline std::string format_number_exact(std::uint64_t value) {
    std::string raw = std::to_string(value);
    std::string formatted;
    formatted.reserve(raw.size() + raw.size() / 3);

    int count = 0;
    for (auto it = raw.rbegin(); it != raw.rend(); ++it) {
        if (count == 3) {
            formatted.push_back(',');
            count = 0;
        }
        formatted.push_back(*it);
        ++count;
    }
    std::reverse(formatted.begin(), formatted.end());
    return formatted;
}


// Format bytes as a scaled human-readable value (binary units)
// Example: 1234567 -> "1.18 MB"
inline std::string format_bytes(std::uint64_t bytes) {
    static const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    double value = static_cast<double>(bytes);
    int unit_index = 0;

    while (value >= 1024.0 && unit_index < 4) {
        value /= 1024.0;
        ++unit_index;
    }

    int precision =
        (value < 10.0)  ? 2 :
        (value < 100.0) ? 1 : 0;

    return std::format("{:.{}f} {}", value, precision, units[unit_index]);
}

} // namespace tickring
