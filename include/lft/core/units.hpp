#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>

namespace lft {

/// "999 B", "1.50 KiB", "12.34 MiB", ...
inline std::string format_bytes(std::uint64_t bytes) {
    static const char* const units[] = {"B", "KiB", "MiB", "GiB", "TiB"};
    if (bytes < 1024) {
        return std::to_string(bytes) + " B";
    }
    double value = static_cast<double>(bytes);
    std::size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < sizeof(units) / sizeof(units[0])) {
        value /= 1024.0;
        ++unit;
    }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << value << " " << units[unit];
    return oss.str();
}

inline std::string format_rate(double bytes_per_second) {
    if (bytes_per_second <= 0.0) {
        return "0 B/s";
    }
    return format_bytes(static_cast<std::uint64_t>(bytes_per_second)) + "/s";
}

inline double bytes_per_second(std::uint64_t bytes, std::chrono::milliseconds elapsed) {
    if (elapsed.count() <= 0) {
        return 0.0;
    }
    return static_cast<double>(bytes) * 1000.0 / static_cast<double>(elapsed.count());
}

} // namespace lft
