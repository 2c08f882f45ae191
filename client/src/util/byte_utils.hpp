#pragma once

#include <cstdint>
#include <optional>
#include <sstream>
#include <string>

namespace byte_utils {

inline std::string format_bytes(std::uint64_t bytes) {
    static const char* units[] = {"B", "KB", "MB", "GB", "TB", "PB"};

    int unit_index = 0;
    std::uint64_t scale = 1ULL;
    while (unit_index < 5 && bytes >= scale * 1024ULL) {
        scale *= 1024ULL;
        ++unit_index;
    }

    double in_unit = static_cast<double>(bytes) / static_cast<double>(scale);

    std::ostringstream oss;
    oss.setf(std::ios::fixed);
    if (unit_index == 0) {
        oss.precision(0);
    } else {
        oss.precision(in_unit < 10.0 ? 2 : (in_unit < 100.0 ? 1 : 0));
    }

    oss << in_unit << ' ' << units[unit_index];
    return oss.str();
}

inline std::string format_rate(double bytes_per_sec) {
    if (bytes_per_sec <= 0.0)
        return "-";
    return format_bytes(static_cast<std::uint64_t>(bytes_per_sec)) + "/s";
}

// Parses a non-negative decimal header value such as Content-Length.
inline std::optional<std::uint64_t> parse_size(const std::string& text) {
    if (text.empty())
        return std::nullopt;
    std::uint64_t value = 0;
    for (char c : text) {
        if (c < '0' || c > '9')
            return std::nullopt;
        std::uint64_t digit = static_cast<std::uint64_t>(c - '0');
        if (value > (UINT64_MAX - digit) / 10)
            return std::nullopt;
        value = value * 10 + digit;
    }
    return value;
}

} // namespace byte_utils
