#include "log/Registry.hpp"
#include "config/Config.hpp"

#include <stdexcept>

namespace ad::log {

void Registry::init(const config::LoggingConfig& cnf) {
    if (initialized_) {
        spdlog::warn("[log::Registry] Already initialized, ignoring second init()");
        return;
    }

    log_dir_ = cnf.log_dir;
    main_log_path_ = log_dir_ / "agentdiag.log";

    namespace fs = std::filesystem;
    if (!fs::exists(log_dir_)) fs::create_directories(log_dir_);

    // console
    console_sink_ = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink_->set_level(cnf.levels.console_log_level);
    console_sink_->set_color_mode(spdlog::color_mode::automatic);
    console_sink_->set_pattern(LOG_FORMAT);

    // main file sink (rotating)
    main_file_sink_ = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        main_log_path_.string(), main_max_bytes_, main_max_files_);
    main_file_sink_->set_level(cnf.levels.file_log_level);
    main_file_sink_->set_pattern(LOG_FORMAT);

    auto makeLogger = [&](const std::string& name, const spdlog::level::level_enum lvl) {
        const auto logger = std::make_shared<spdlog::logger>(
            name, spdlog::sinks_init_list{console_sink_, main_file_sink_});
        logger->set_level(lvl);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    };

    // keep in sync with LOGGER_NAMES
    const auto& sub_levels = cnf.levels.subsystem_levels;
    makeLogger("agent",   sub_levels.agent);
    makeLogger("diag",    sub_levels.diag);
    makeLogger("sweeper", sub_levels.sweeper);
    makeLogger("config",  sub_levels.config);
    makeLogger("cli",     sub_levels.cli);

    initialized_ = true;
    get("agent")->debug("[log::Registry] Initialized, writing to {}", main_log_path_.string());
}

void Registry::shutdown() {
    if (!initialized_) return;
    for (const auto* name : LOGGER_NAMES) {
        if (const auto lg = spdlog::get(name)) lg->flush();
        spdlog::drop(name);
    }
    console_sink_.reset();
    main_file_sink_.reset();
    initialized_ = false;
}

std::shared_ptr<spdlog::logger> Registry::get(const std::string& name) {
    auto logger = spdlog::get(name);
    if (!logger) {
        if (!initialized_) throw std::runtime_error("[log::Registry] Registry not initialized, cannot get logger: " + name);
        throw std::runtime_error("[log::Registry] Logger not found: " + name);
    }
    return logger;
}

std::shared_ptr<spdlog::logger> Registry::getOrDefault(const std::string& name) {
    if (!initialized_) return spdlog::default_logger();
    return get(name);
}

bool Registry::isInitialized() { return initialized_; }

}
