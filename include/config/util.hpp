#pragma once

#include <cctype>
#include <chrono>
#include <stdexcept>
#include <string>

namespace ad::config {

// Upper bound for configured durations; keeps deadlines representable in nanoseconds.
inline constexpr std::chrono::seconds MAX_DURATION = std::chrono::hours(24 * 365 * 100);

// "7d", "12h", "30m", "45s"; a bare number is seconds.
inline std::chrono::seconds parseDuration(const std::string& str) {
    if (str.empty()) throw std::invalid_argument("Duration string cannot be empty");
    if (!std::isdigit(static_cast<unsigned char>(str.front())))
        throw std::invalid_argument("Invalid duration: " + str);

    std::size_t pos = 0;
    unsigned long long value = 0;
    try {
        value = std::stoull(str, &pos);
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid duration: " + str);
    }

    const auto suffix = str.substr(pos);
    unsigned long long unit = 0;
    if (suffix.empty() || suffix == "s" || suffix == "S") unit = 1;
    else if (suffix == "m" || suffix == "M") unit = 60;
    else if (suffix == "h" || suffix == "H") unit = 3600;
    else if (suffix == "d" || suffix == "D") unit = 86400;
    else throw std::invalid_argument("Invalid duration suffix in: " + str);

    if (value > static_cast<unsigned long long>(MAX_DURATION.count()) / unit)
        throw std::invalid_argument("Duration out of range: " + str);

    return std::chrono::seconds(static_cast<std::chrono::seconds::rep>(value * unit));
}

inline std::string durationToString(const std::chrono::seconds& d) {
    const auto s = d.count();
    if (s != 0 && s % 86400 == 0) return std::to_string(s / 86400) + "d";
    if (s != 0 && s % 3600 == 0) return std::to_string(s / 3600) + "h";
    if (s != 0 && s % 60 == 0) return std::to_string(s / 60) + "m";
    return std::to_string(s) + "s";
}

}
