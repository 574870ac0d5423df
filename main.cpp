// Diagnostics
#include "diag/ConsoleWriter.hpp"
#include "diag/Dispatcher.hpp"
#include "diag/RollingFileWriter.hpp"
#include "diag/Sweeper.hpp"

// Services
#include "services/ServiceManager.hpp"

// Misc
#include "config/ConfigRegistry.hpp"
#include "config/paths.hpp"
#include "config/util.hpp"
#include "log/Registry.hpp"

// Libraries
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <fmt/core.h>
#include <nlohmann/json.hpp>
#include <unistd.h>

using namespace ad::config;
using namespace ad::diag;
using namespace ad::log;
using namespace ad::services;

namespace {
std::atomic shouldExit = false;

void signalHandler(const int) { shouldExit = true; }

constexpr int EXIT_USAGE = 2;

void usage() {
    std::cerr << "usage: agentdiag [--config <path>] <command> [args...]\n"
                 "commands:\n"
                 "  run                                  start configured sweepers until SIGINT/SIGTERM\n"
                 "  sweep <path> <ext> <maxAgeSeconds>   run one sweep now and print the deleted count\n"
                 "  write <message...>                   append one line through the rolling writer\n"
                 "  config                               print the effective config as JSON\n";
}

Config resolveConfig(const std::string& explicitPath) {
    if (!explicitPath.empty()) return loadConfig(explicitPath);
    if (std::filesystem::exists(ad::paths::getConfigPath())) return loadConfig(ad::paths::getConfigPath());
    return Config{};
}

RollingFileWriter::Options writerOptions(const DiagnosticsConfig& d) {
    return {
        .folder = d.folder,
        .prefix = d.prefix,
        .max_lines_per_file = d.max_lines_per_file,
        .files_to_keep = d.files_to_keep,
        .level = d.level
    };
}

int run() {
    const auto& cfg = ConfigRegistry::get();

    Dispatcher trace;
    trace.addWriter(std::make_shared<RollingFileWriter>(writerOptions(cfg.diagnostics)));
    if (cfg.diagnostics.console) trace.addWriter(std::make_shared<ConsoleWriter>(cfg.diagnostics.level));

    ServiceManager services(cfg.sweepers);

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    Registry::agent()->info("[*] Starting {} sweeper(s)...", services.serviceNames().size());
    services.startAll();
    trace.status(fmt::format("agentdiag started, pid {}\n", ::getpid()));

    while (!shouldExit) std::this_thread::sleep_for(std::chrono::milliseconds(250));

    Registry::agent()->info("[*] Shutting down...");
    services.stopAll();
    trace.status("agentdiag stopped\n");
    trace.end();

    Registry::agent()->info("[✓] Shut down cleanly.");
    return EXIT_SUCCESS;
}

int sweepOnce(const std::vector<std::string>& args) {
    if (args.size() != 3) {
        usage();
        return EXIT_USAGE;
    }

    std::chrono::seconds maxAge{};
    try {
        maxAge = parseDuration(args[2]);
    } catch (const std::invalid_argument& e) {
        std::cerr << "agentdiag: sweep: bad maxAgeSeconds '" << args[2] << "': " << e.what() << "\n";
        usage();
        return EXIT_USAGE;
    }

    Sweeper sweeper("Sweeper:cli", {
        .path = args[0],
        .extension = args[1],
        .max_age = maxAge
    });

    const auto result = sweeper.sweep();
    fmt::print("{}\n", result.deleted);
    return EXIT_SUCCESS;
}

int writeLine(const std::vector<std::string>& args) {
    if (args.empty()) {
        usage();
        return EXIT_USAGE;
    }

    std::string line;
    for (const auto& a : args) {
        if (!line.empty()) line += ' ';
        line += a;
    }
    line += '\n';

    RollingFileWriter writer(writerOptions(ConfigRegistry::get().diagnostics));
    writer.write(line);
    writer.end();
    Registry::cli()->debug("[write] appended to {}", writer.activePath()->string());
    return EXIT_SUCCESS;
}

int printConfig() {
    const nlohmann::json j = ConfigRegistry::get();
    fmt::print("{}\n", j.dump(2));
    return EXIT_SUCCESS;
}
}

int main(const int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);

    std::string configPath;
    if (args.size() >= 2 && args[0] == "--config") {
        configPath = args[1];
        args.erase(args.begin(), args.begin() + 2);
    }

    if (args.empty()) {
        usage();
        return EXIT_USAGE;
    }

    const std::string command = args.front();
    args.erase(args.begin());

    if (command != "run" && command != "sweep" && command != "write" && command != "config") {
        usage();
        return EXIT_USAGE;
    }

    try {
        ConfigRegistry::init(resolveConfig(configPath));
        Registry::init(ConfigRegistry::get().logging);

        int rc = EXIT_SUCCESS;
        if (command == "run") rc = run();
        else if (command == "sweep") rc = sweepOnce(args);
        else if (command == "write") rc = writeLine(args);
        else rc = printConfig();

        Registry::shutdown();
        return rc;
    } catch (const std::exception& e) {
        if (Registry::isInitialized()) Registry::cli()->error("[-] {} failed: {}", command, e.what());
        else std::cerr << "agentdiag: " << command << " failed: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }
}
