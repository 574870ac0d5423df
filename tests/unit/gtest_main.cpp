#include <gtest/gtest.h>
#include <filesystem>
#include <iostream>

#include "config/Config.hpp"
#include "log/Registry.hpp"

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    try {
        ad::paths::setLogPathForTesting();

        ad::config::LoggingConfig logging;
        logging.log_dir = ad::paths::getLogPath();
        logging.levels.console_log_level = spdlog::level::warn;
        ad::log::Registry::init(logging);

    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize agentdiag test environment: " << e.what() << std::endl;
        return 1;
    }

    return RUN_ALL_TESTS();
}
