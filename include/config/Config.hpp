#pragma once

#include "config/paths.hpp"
#include "diag/Level.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include <nlohmann/json_fwd.hpp>

namespace ad::config {

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum agent   = spdlog::level::info;   // Startup/shutdown, service lifecycle
    spdlog::level::level_enum diag    = spdlog::level::info;   // Rotation and retention of diagnostic files
    spdlog::level::level_enum sweeper = spdlog::level::info;   // Sweep start, deletions, summaries
    spdlog::level::level_enum config  = spdlog::level::warn;   // Only surface bad or missing values
    spdlog::level::level_enum cli     = spdlog::level::info;
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::debug;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir = paths::getLogPath();
    LogLevelsConfig levels;
};

struct DiagnosticsConfig {
    std::filesystem::path folder = paths::getDiagPath();
    std::string prefix = "agent";
    unsigned int max_lines_per_file = 10000;
    unsigned int files_to_keep = 10;
    diag::Level level = diag::Level::Info;
    bool console = false;
};

struct SweeperConfig {
    std::string name = "diag";
    std::filesystem::path path = paths::getDiagPath();
    std::string extension = "*";
    std::chrono::seconds max_age = std::chrono::hours(24 * 7);
    std::chrono::seconds interval = std::chrono::hours(1);
};

struct Config {
    LoggingConfig logging;
    DiagnosticsConfig diagnostics;
    std::vector<SweeperConfig> sweepers{SweeperConfig{}};
};

Config loadConfig(const std::filesystem::path& path);
void validate(const Config& c);

void to_json(nlohmann::json& j, const Config& c);
void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c);
void to_json(nlohmann::json& j, const LogLevelsConfig& c);
void to_json(nlohmann::json& j, const LoggingConfig& c);
void to_json(nlohmann::json& j, const DiagnosticsConfig& c);
void to_json(nlohmann::json& j, const SweeperConfig& c);

} // namespace ad::config
