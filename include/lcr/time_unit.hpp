#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string_view>

namespace lcr {

enum class time_unit {
    nanoseconds,
    microseconds,
    milliseconds,
    seconds
};

constexpr const char* to_string(time_unit unit) noexcept {
    switch (unit) {
        case time_unit::nanoseconds:  return "ns";
        case time_unit::microseconds: return "us";
        case time_unit::milliseconds: return "ms";
        case time_unit::seconds:      return "s";
        default:                     return "unknown";
    }
}

// Accepts the short names produced by to_string()
constexpr std::optional<time_unit> parse_time_unit(std::string_view s) noexcept {
    if (s == "ns") return time_unit::nanoseconds;
    if (s == "us") return time_unit::microseconds;
    if (s == "ms") return time_unit::milliseconds;
    if (s == "s")  return time_unit::seconds;
    return std::nullopt;
}

constexpr std::chrono::nanoseconds to_duration(std::int64_t amount, time_unit unit) noexcept {
    switch (unit) {
        case time_unit::seconds:      return std::chrono::seconds(amount);
        case time_unit::milliseconds: return std::chrono::milliseconds(amount);
        case time_unit::microseconds: return std::chrono::microseconds(amount);
        default:                     return std::chrono::nanoseconds(amount);
    }
}

} // namespace lcr
