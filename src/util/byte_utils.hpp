#pragma once

#include <chrono>
#include <cstdint>
#include <sstream>
#include <string>

namespace byte_utils {

inline std::string format_bytes(std::uint64_t bytes) {
    static const char* units[] = {"B", "KB", "MB", "GB", "TB", "PB", "EB"};

    int unit_index = 0;
    std::uint64_t scale = 1ULL;
    while (unit_index < 6 && bytes / scale >= 1024ULL) {
        scale *= 1024ULL;
        ++unit_index;
    }

    std::ostringstream oss;
    if (unit_index == 0) {
        oss << bytes << ' ' << units[0];
        return oss.str();
    }

    oss.setf(std::ios::fixed);
    oss.precision(1);
    oss << static_cast<double>(bytes) / static_cast<double>(scale) << ' ' << units[unit_index];
    return oss.str();
}

// 850ms, 12.5s, 3.2m, 1.1h
inline std::string format_duration(std::chrono::milliseconds duration) {
    using namespace std::chrono;

    std::ostringstream oss;
    oss.setf(std::ios::fixed);
    auto ms = duration.count();
    if (duration < seconds(1)) {
        oss << ms << "ms";
    } else if (duration < minutes(1)) {
        oss.precision(1);
        oss << static_cast<double>(ms) / 1000.0 << 's';
    } else if (duration < hours(1)) {
        oss.precision(1);
        oss << static_cast<double>(ms) / 60000.0 << 'm';
    } else {
        oss.precision(1);
        oss << static_cast<double>(ms) / 3600000.0 << 'h';
    }
    return oss.str();
}

inline std::string format_speed(std::uint64_t bytes, std::chrono::milliseconds duration) {
    if (duration.count() <= 0) {
        return "0 B/s";
    }
    double per_second = static_cast<double>(bytes) * 1000.0 / static_cast<double>(duration.count());
    return format_bytes(static_cast<std::uint64_t>(per_second)) + "/s";
}

} // namespace byte_utils
