#pragma once

#include <filesystem>

namespace ad::paths {

namespace detail {
inline std::filesystem::path& logPathOverride() {
    static std::filesystem::path p;
    return p;
}
}

inline std::filesystem::path getConfigPath() { return "/etc/agentdiag/config.yaml"; }

inline std::filesystem::path getLogPath() {
    if (!detail::logPathOverride().empty()) return detail::logPathOverride();
    return "/var/log/agentdiag";
}

inline std::filesystem::path getDiagPath() { return getLogPath() / "diag"; }

inline void setLogPathForTesting() {
    detail::logPathOverride() = std::filesystem::temp_directory_path() / "agentdiag_test_logs";
}

}
