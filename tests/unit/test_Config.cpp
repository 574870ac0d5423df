#include <gtest/gtest.h>
#include "config/Config.hpp"
#include "config/util.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;
using namespace std::chrono_literals;
using namespace ad::config;

class ConfigTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "agentdiag_config" /
                   ::testing::UnitTest::GetInstance()->current_test_info()->name();
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
    }

    void TearDown() override { fs::remove_all(test_dir); }

    fs::path writeYaml(const std::string& body) const {
        const auto p = test_dir / "config.yaml";
        std::ofstream(p) << body;
        return p;
    }
};

TEST(DurationTest, ParsesSuffixes) {
    EXPECT_EQ(parseDuration("45"), 45s);
    EXPECT_EQ(parseDuration("45s"), 45s);
    EXPECT_EQ(parseDuration("30m"), 30min);
    EXPECT_EQ(parseDuration("12h"), 12h);
    EXPECT_EQ(parseDuration("7d"), std::chrono::hours(7 * 24));
}

TEST(DurationTest, RejectsGarbage) {
    EXPECT_THROW(parseDuration(""), std::invalid_argument);
    EXPECT_THROW(parseDuration("-5s"), std::invalid_argument);
    EXPECT_THROW(parseDuration("5w"), std::invalid_argument);
    EXPECT_THROW(parseDuration("soon"), std::invalid_argument);
}

TEST(DurationTest, RejectsValuesBeyondTheUpperBound) {
    EXPECT_EQ(parseDuration("36500d"), MAX_DURATION);
    EXPECT_THROW(parseDuration("36501d"), std::invalid_argument);
    EXPECT_THROW(parseDuration("999999999999999d"), std::invalid_argument);
    EXPECT_THROW(parseDuration("99999999999999999999999"), std::invalid_argument);
    EXPECT_THROW(parseDuration("-1"), std::invalid_argument);
}

TEST(DurationTest, FormatsLargestWholeUnit) {
    EXPECT_EQ(durationToString(std::chrono::hours(48)), "2d");
    EXPECT_EQ(durationToString(3h), "3h");
    EXPECT_EQ(durationToString(90s), "90s");
    EXPECT_EQ(durationToString(120s), "2m");
    EXPECT_EQ(durationToString(0s), "0s");
}

TEST_F(ConfigTest, EmptyFileKeepsDefaults) {
    const auto cfg = loadConfig(writeYaml("{}\n"));

    EXPECT_EQ(cfg.diagnostics.prefix, "agent");
    EXPECT_EQ(cfg.diagnostics.max_lines_per_file, 10000u);
    EXPECT_EQ(cfg.diagnostics.files_to_keep, 10u);
    ASSERT_EQ(cfg.sweepers.size(), 1u);
    EXPECT_EQ(cfg.sweepers[0].extension, "*");
    EXPECT_EQ(cfg.sweepers[0].max_age, std::chrono::hours(24 * 7));
}

TEST_F(ConfigTest, LoadsAllSections) {
    const auto cfg = loadConfig(writeYaml(R"(
logging:
  log_dir: /tmp/agentdiag-logs
  log_levels:
    console_log_level: warn
    subsystem_levels:
      sweeper: debug
diagnostics:
  folder: /tmp/agentdiag-diag
  prefix: worker
  max_lines_per_file: 500
  files_to_keep: 3
  level: verbose
  console: true
sweepers:
  - name: traces
    path: /tmp/agentdiag-traces
    extension: log
    max_age: 2d
    interval: 30m
  - path: /tmp/agentdiag-dumps
)"));

    EXPECT_EQ(cfg.logging.log_dir, fs::path("/tmp/agentdiag-logs"));
    EXPECT_EQ(cfg.logging.levels.console_log_level, spdlog::level::warn);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.sweeper, spdlog::level::debug);

    EXPECT_EQ(cfg.diagnostics.prefix, "worker");
    EXPECT_EQ(cfg.diagnostics.max_lines_per_file, 500u);
    EXPECT_EQ(cfg.diagnostics.files_to_keep, 3u);
    EXPECT_EQ(cfg.diagnostics.level, ad::diag::Level::Verbose);
    EXPECT_TRUE(cfg.diagnostics.console);

    ASSERT_EQ(cfg.sweepers.size(), 2u);
    EXPECT_EQ(cfg.sweepers[0].name, "traces");
    EXPECT_EQ(cfg.sweepers[0].extension, "log");
    EXPECT_EQ(cfg.sweepers[0].max_age, std::chrono::hours(48));
    EXPECT_EQ(cfg.sweepers[0].interval, 30min);
    EXPECT_EQ(cfg.sweepers[1].name, "agentdiag-dumps");
    EXPECT_EQ(cfg.sweepers[1].interval, 1h);
}

TEST_F(ConfigTest, RejectsInvalidValues) {
    EXPECT_THROW(loadConfig(writeYaml("diagnostics:\n  files_to_keep: 0\n")), std::invalid_argument);
    EXPECT_THROW(loadConfig(writeYaml("diagnostics:\n  prefix: \"\"\n")), std::invalid_argument);
    EXPECT_THROW(loadConfig(writeYaml("diagnostics:\n  level: shouty\n")), std::invalid_argument);
    EXPECT_THROW(loadConfig(writeYaml("logging:\n  log_levels:\n    console_log_level: nope\n")),
                 std::invalid_argument);
    EXPECT_THROW(loadConfig(writeYaml("sweepers:\n  - path: /tmp/x\n    interval: 0s\n")), std::invalid_argument);
    EXPECT_THROW(loadConfig(writeYaml("sweepers:\n  - name: x\n")), std::runtime_error);
    EXPECT_THROW(loadConfig(writeYaml("sweepers:\n  path: /tmp/x\n")), std::runtime_error);
}

TEST_F(ConfigTest, RejectsDuplicateSweeperNames) {
    EXPECT_THROW(loadConfig(writeYaml(R"(
sweepers:
  - name: a
    path: /tmp/one
  - name: a
    path: /tmp/two
)")), std::invalid_argument);
}

TEST(ConfigJsonTest, SerializesDurationsAsSeconds) {
    Config cfg;
    cfg.sweepers[0].max_age = 90s;
    cfg.sweepers[0].interval = 2min;

    const nlohmann::json j = cfg;
    EXPECT_EQ(j["sweepers"][0]["max_age_seconds"], 90);
    EXPECT_EQ(j["sweepers"][0]["interval_seconds"], 120);
    EXPECT_EQ(j["diagnostics"]["level"], "info");
    EXPECT_EQ(j["logging"]["log_levels"]["subsystem_levels"]["config"], "warning");
}
