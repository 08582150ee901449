#pragma once

#include <cstdint>
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

inline std::string format_rate(double bytes_per_second) {
    if (bytes_per_second <= 0.0)
        return "-";
    return format_bytes(static_cast<std::uint64_t>(bytes_per_second)) + "/s";
}

// "1h02m", "3m07s", "12s"; "-" when unknown.
inline std::string format_duration(double seconds) {
    if (seconds <= 0.0)
        return "-";
    auto total = static_cast<std::uint64_t>(seconds + 0.5);
    std::uint64_t h = total / 3600;
    std::uint64_t m = (total % 3600) / 60;
    std::uint64_t s = total % 60;

    std::ostringstream oss;
    oss.fill('0');
    if (h > 0) {
        oss << h << 'h';
        oss.width(2);
        oss << m << 'm';
    } else if (m > 0) {
        oss << m << 'm';
        oss.width(2);
        oss << s << 's';
    } else {
        oss << s << 's';
    }
    return oss.str();
}

} // namespace byte_utils
