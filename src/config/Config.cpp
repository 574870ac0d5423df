#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <stdexcept>
#include <unordered_set>
#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>

namespace ad::config {

Config loadConfig(const std::filesystem::path& path) {
    Config cfg;
    YAML::Node root = YAML::LoadFile(path.string());

    if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);
    if (auto node = root["diagnostics"]) YAML::convert<DiagnosticsConfig>::decode(node, cfg.diagnostics);

    if (auto node = root["sweepers"]) {
        if (!node.IsSequence()) throw std::runtime_error("'sweepers' must be a list");
        cfg.sweepers.clear();
        for (const auto& entry : node) {
            SweeperConfig sc;
            if (!YAML::convert<SweeperConfig>::decode(entry, sc))
                throw std::runtime_error("Invalid sweeper entry in " + path.string());
            cfg.sweepers.push_back(std::move(sc));
        }
    }

    validate(cfg);
    return cfg;
}

void validate(const Config& c) {
    if (c.diagnostics.prefix.empty())
        throw std::invalid_argument("diagnostics.prefix must not be empty");
    if (c.diagnostics.max_lines_per_file == 0)
        throw std::invalid_argument("diagnostics.max_lines_per_file must be greater than zero");
    if (c.diagnostics.files_to_keep == 0)
        throw std::invalid_argument("diagnostics.files_to_keep must be greater than zero");

    std::unordered_set<std::string> names;
    for (const auto& s : c.sweepers) {
        if (s.path.empty()) throw std::invalid_argument("sweeper '" + s.name + "' has an empty path");
        if (s.extension.empty()) throw std::invalid_argument("sweeper '" + s.name + "' has an empty extension");
        if (s.interval.count() <= 0) throw std::invalid_argument("sweeper '" + s.name + "' interval must be positive");
        if (!names.insert(s.name).second) throw std::invalid_argument("duplicate sweeper name: " + s.name);
    }
}

static std::string levelStr(const spdlog::level::level_enum lvl) {
    const auto sv = spdlog::level::to_string_view(lvl);
    return {sv.data(), sv.size()};
}

void to_json(nlohmann::json& j, const Config& c) {
    j = {
        {"logging", c.logging},
        {"diagnostics", c.diagnostics},
        {"sweepers", c.sweepers}
    };
}

void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c) {
    j = {
        {"agent", levelStr(c.agent)},
        {"diag", levelStr(c.diag)},
        {"sweeper", levelStr(c.sweeper)},
        {"config", levelStr(c.config)},
        {"cli", levelStr(c.cli)}
    };
}

void to_json(nlohmann::json& j, const LogLevelsConfig& c) {
    j = {
        {"console_log_level", levelStr(c.console_log_level)},
        {"file_log_level", levelStr(c.file_log_level)},
        {"subsystem_levels", c.subsystem_levels}
    };
}

void to_json(nlohmann::json& j, const LoggingConfig& c) {
    j = {
        {"log_dir", c.log_dir.string()},
        {"log_levels", c.levels}
    };
}

void to_json(nlohmann::json& j, const DiagnosticsConfig& c) {
    j = {
        {"folder", c.folder.string()},
        {"prefix", c.prefix},
        {"max_lines_per_file", c.max_lines_per_file},
        {"files_to_keep", c.files_to_keep},
        {"level", diag::to_string(c.level)},
        {"console", c.console}
    };
}

void to_json(nlohmann::json& j, const SweeperConfig& c) {
    j = {
        {"name", c.name},
        {"path", c.path.string()},
        {"extension", c.extension},
        {"max_age_seconds", c.max_age.count()},
        {"interval_seconds", c.interval.count()}
    };
}

} // namespace ad::config
