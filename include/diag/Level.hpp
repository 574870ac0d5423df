#pragma once

#include <string>
#include <string_view>

namespace ad::diag {

// Ordered from least to most verbose.
enum class Level { Error, Warning, Status, Info, Verbose };

std::string to_string(Level level);
Level levelFromString(std::string_view str);

// True when a writer configured at `configured` should receive a message of `msg`.
constexpr bool accepts(const Level configured, const Level msg) {
    return static_cast<int>(msg) <= static_cast<int>(configured);
}

}
