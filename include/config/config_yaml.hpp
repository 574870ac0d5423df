#pragma once

#include "config/Config.hpp"
#include "config/util.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace ad::config;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

static spdlog::level::level_enum parseSpdLevel(const std::string& str) {
    const auto lvl = spdlog::level::from_str(str);
    if (lvl == spdlog::level::off && str != "off")
        throw std::invalid_argument("Invalid log level: " + str);
    return lvl;
}

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["agent"]   = to_std_string(spdlog::level::to_string_view(rhs.agent));
        node["diag"]    = to_std_string(spdlog::level::to_string_view(rhs.diag));
        node["sweeper"] = to_std_string(spdlog::level::to_string_view(rhs.sweeper));
        node["config"]  = to_std_string(spdlog::level::to_string_view(rhs.config));
        node["cli"]     = to_std_string(spdlog::level::to_string_view(rhs.cli));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.agent = parseSpdLevel(node["agent"].as<std::string>("info"));
        rhs.diag = parseSpdLevel(node["diag"].as<std::string>("info"));
        rhs.sweeper = parseSpdLevel(node["sweeper"].as<std::string>("info"));
        rhs.config = parseSpdLevel(node["config"].as<std::string>("warning"));
        rhs.cli = parseSpdLevel(node["cli"].as<std::string>("info"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = parseSpdLevel(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = parseSpdLevel(node["file_log_level"].as<std::string>("debug"));
        if (node["subsystem_levels"]) rhs.subsystem_levels = node["subsystem_levels"].as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["log_levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>(ad::paths::getLogPath().string());
        if (node["log_levels"]) rhs.levels = node["log_levels"].as<LogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<DiagnosticsConfig> {
    static Node encode(const DiagnosticsConfig& rhs) {
        Node node;
        node["folder"] = rhs.folder.string();
        node["prefix"] = rhs.prefix;
        node["max_lines_per_file"] = rhs.max_lines_per_file;
        node["files_to_keep"] = rhs.files_to_keep;
        node["level"] = ad::diag::to_string(rhs.level);
        node["console"] = rhs.console;
        return node;
    }

    static bool decode(const Node& node, DiagnosticsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.folder = node["folder"].as<std::string>(ad::paths::getDiagPath().string());
        rhs.prefix = node["prefix"].as<std::string>("agent");
        rhs.max_lines_per_file = node["max_lines_per_file"].as<unsigned int>(10000);
        rhs.files_to_keep = node["files_to_keep"].as<unsigned int>(10);
        rhs.level = ad::diag::levelFromString(node["level"].as<std::string>("info"));
        rhs.console = node["console"].as<bool>(false);
        return true;
    }
};

template<>
struct convert<SweeperConfig> {
    static Node encode(const SweeperConfig& rhs) {
        Node node;
        node["name"] = rhs.name;
        node["path"] = rhs.path.string();
        node["extension"] = rhs.extension;
        node["max_age"] = durationToString(rhs.max_age);
        node["interval"] = durationToString(rhs.interval);
        return node;
    }

    static bool decode(const Node& node, SweeperConfig& rhs) {
        if (!node.IsMap()) return false;
        if (!node["path"]) throw std::runtime_error("Sweeper entry is missing 'path'");
        rhs.path = node["path"].as<std::string>();
        rhs.name = node["name"].as<std::string>(rhs.path.filename().string());
        rhs.extension = node["extension"].as<std::string>("*");
        rhs.max_age = parseDuration(node["max_age"].as<std::string>("7d"));
        rhs.interval = parseDuration(node["interval"].as<std::string>("1h"));
        return true;
    }
};

}
