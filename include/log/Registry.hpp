#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace ad::config { struct LoggingConfig; }

namespace ad::log {

class Registry {
public:
    // Initialize all loggers with sinks/levels.
    static void init(const config::LoggingConfig& cnf);

    // Drop every registered logger and sink; init() may be called again afterwards.
    static void shutdown();

    // Generic access by name
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Like get(), but before init() (or after shutdown()) returns spdlog's default logger.
    static std::shared_ptr<spdlog::logger> getOrDefault(const std::string& name);

    // Subsystem shorthands; usable whether or not the registry is initialized
    static std::shared_ptr<spdlog::logger> agent()   { return getOrDefault("agent"); }
    static std::shared_ptr<spdlog::logger> diag()    { return getOrDefault("diag"); }
    static std::shared_ptr<spdlog::logger> sweeper() { return getOrDefault("sweeper"); }
    static std::shared_ptr<spdlog::logger> config()  { return getOrDefault("config"); }
    static std::shared_ptr<spdlog::logger> cli()     { return getOrDefault("cli"); }

    [[nodiscard]] static bool isInitialized();

    [[nodiscard]] static const std::filesystem::path& mainLogPath() { return main_log_path_; }

private:
    static constexpr const char* LOGGER_NAMES[] = {"agent", "diag", "sweeper", "config", "cli"};
    static constexpr const auto* LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

    static inline bool initialized_ = false;

    static inline std::filesystem::path log_dir_;
    static inline std::filesystem::path main_log_path_;

    static inline std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> console_sink_;
    static inline std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> main_file_sink_;

    static inline size_t main_max_bytes_ = 10 * 1024 * 1024; // 10 MiB
    static inline size_t main_max_files_ = 5;
};

}
