#include "diag/Level.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace ad::diag {

std::string to_string(const Level level) {
    switch (level) {
        case Level::Error: return "error";
        case Level::Warning: return "warning";
        case Level::Status: return "status";
        case Level::Info: return "info";
        case Level::Verbose: return "verbose";
    }
    return "unknown";
}

Level levelFromString(const std::string_view str) {
    std::string s(str);
    std::ranges::transform(s, s.begin(), [](const unsigned char c) { return std::tolower(c); });

    if (s == "error") return Level::Error;
    if (s == "warning" || s == "warn") return Level::Warning;
    if (s == "status") return Level::Status;
    if (s == "info") return Level::Info;
    if (s == "verbose" || s == "debug") return Level::Verbose;
    throw std::invalid_argument("Invalid diagnostic level: " + std::string(str));
}

}
