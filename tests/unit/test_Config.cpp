#include <gtest/gtest.h>
#include "config/Config.hpp"
#include "util/paths.hpp"

#include <cstdlib>
#include <nlohmann/json.hpp>
#include <stdexcept>

using namespace ds::config;
using namespace std::chrono;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override { clearEnv(); }
    void TearDown() override { clearEnv(); }

    static void clearEnv() {
        for (const auto* name : {"PREVIEW_QUEUE_BUFFER_SIZE", "PREVIEW_JOB_MAX_ATTEMPTS", "GOTENBERG_URL",
                                 "DB_HOST", "DB_PORT", "DB_USER", "DB_PASSWORD", "DB_NAME", "DOCSHARE_CONFIG"})
            unsetenv(name);
    }
};

TEST_F(ConfigTest, EmptyDocumentYieldsDefaults) {
    const auto cfg = loadConfigFromString("{}");
    EXPECT_EQ(cfg.preview.queue_buffer_size, 100u);
    EXPECT_EQ(cfg.preview.max_attempts, 3u);
    ASSERT_EQ(cfg.preview.retry_delays.size(), 3u);
    EXPECT_EQ(cfg.preview.retry_delays[0], seconds(30));
    EXPECT_EQ(cfg.preview.retry_delays[1], minutes(2));
    EXPECT_EQ(cfg.preview.retry_delays[2], minutes(10));
    EXPECT_EQ(cfg.preview.worker_count, 1u);
    EXPECT_EQ(cfg.preview.sweep_interval, minutes(5));
    EXPECT_EQ(cfg.gotenberg.url, "http://localhost:3000");
    EXPECT_EQ(cfg.gotenberg.timeout, seconds(120));
    EXPECT_EQ(cfg.database.port, 5432);
}

TEST_F(ConfigTest, ParsesPreviewSection) {
    const auto cfg = loadConfigFromString(R"(
preview:
  queue_buffer_size: 8
  max_attempts: 5
  retry_delays_seconds: [1, 2]
  worker_count: 2
  sweep_interval_minutes: 1
gotenberg:
  url: http://gotenberg:3000
  timeout_seconds: 30
storage:
  root: /srv/docs
)");
    EXPECT_EQ(cfg.preview.queue_buffer_size, 8u);
    EXPECT_EQ(cfg.preview.max_attempts, 5u);
    ASSERT_EQ(cfg.preview.retry_delays.size(), 2u);
    EXPECT_EQ(cfg.preview.retry_delays[1], seconds(2));
    EXPECT_EQ(cfg.preview.worker_count, 2u);
    EXPECT_EQ(cfg.preview.sweep_interval, minutes(1));
    EXPECT_EQ(cfg.gotenberg.url, "http://gotenberg:3000");
    EXPECT_EQ(cfg.gotenberg.timeout, seconds(30));
    EXPECT_EQ(cfg.storage.root, "/srv/docs");
    EXPECT_EQ(cfg.storage.preview_root, "/var/lib/docshare/previews");
}

TEST_F(ConfigTest, ZeroQueueSizeIsAllowed) {
    const auto cfg = loadConfigFromString("preview:\n  queue_buffer_size: 0\n");
    EXPECT_EQ(cfg.preview.queue_buffer_size, 0u);
}

TEST_F(ConfigTest, ParsesLogLevels) {
    const auto cfg = loadConfigFromString(R"(
logging:
  log_levels:
    console_log_level: debug
    subsystem_levels:
      preview: trace
)");
    EXPECT_EQ(cfg.logging.levels.console_log_level, spdlog::level::debug);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.preview, spdlog::level::trace);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.db, spdlog::level::err);
}

TEST_F(ConfigTest, EnvironmentOverridesFile) {
    setenv("PREVIEW_QUEUE_BUFFER_SIZE", "7", 1);
    setenv("PREVIEW_JOB_MAX_ATTEMPTS", "9", 1);
    setenv("GOTENBERG_URL", "http://converter:3000", 1);
    setenv("DB_PORT", "6543", 1);

    const auto cfg = loadConfigFromString("preview:\n  queue_buffer_size: 50\n  max_attempts: 2\n");
    EXPECT_EQ(cfg.preview.queue_buffer_size, 7u);
    EXPECT_EQ(cfg.preview.max_attempts, 9u);
    EXPECT_EQ(cfg.gotenberg.url, "http://converter:3000");
    EXPECT_EQ(cfg.database.port, 6543);
}

TEST_F(ConfigTest, MalformedEnvironmentValueThrows) {
    setenv("PREVIEW_JOB_MAX_ATTEMPTS", "lots", 1);
    EXPECT_THROW(loadConfigFromString("{}"), std::runtime_error);
}

TEST_F(ConfigTest, NegativeEnvironmentValueThrows) {
    setenv("PREVIEW_QUEUE_BUFFER_SIZE", "-1", 1);
    EXPECT_THROW(loadConfigFromString("{}"), std::runtime_error);
}

TEST_F(ConfigTest, TrailingCharactersInEnvironmentValueThrow) {
    setenv("PREVIEW_JOB_MAX_ATTEMPTS", "3abc", 1);
    EXPECT_THROW(loadConfigFromString("{}"), std::runtime_error);
}

TEST_F(ConfigTest, OutOfRangeEnvironmentValueThrows) {
    setenv("DB_PORT", "70000", 1);
    EXPECT_THROW(loadConfigFromString("{}"), std::runtime_error);

    setenv("DB_PORT", "65535", 1);
    EXPECT_EQ(loadConfigFromString("{}").database.port, 65535);

    setenv("PREVIEW_QUEUE_BUFFER_SIZE", "4294967296", 1);
    EXPECT_THROW(loadConfigFromString("{}"), std::runtime_error);
}

TEST_F(ConfigTest, RejectsZeroSweepInterval) {
    EXPECT_THROW(loadConfigFromString("preview:\n  sweep_interval_minutes: 0\n"), std::runtime_error);
}

TEST_F(ConfigTest, RejectsNegativeSweepInterval) {
    EXPECT_THROW(loadConfigFromString("preview:\n  sweep_interval_minutes: -5\n"), std::runtime_error);
}

TEST_F(ConfigTest, ConfigPathOverrideWinsOverEnvironment) {
    setenv("DOCSHARE_CONFIG", "/srv/env.yaml", 1);
    EXPECT_EQ(ds::paths::getConfigPath(), "/srv/env.yaml");

    ds::paths::setConfigPath("/srv/cli.yaml");
    EXPECT_EQ(ds::paths::getConfigPath(), "/srv/cli.yaml");

    ds::paths::setConfigPath({});
    EXPECT_EQ(ds::paths::getConfigPath(), "/srv/env.yaml");
}

TEST_F(ConfigTest, RejectsZeroMaxAttempts) {
    EXPECT_THROW(loadConfigFromString("preview:\n  max_attempts: 0\n"), std::runtime_error);
}

TEST_F(ConfigTest, RejectsEmptyRetrySchedule) {
    EXPECT_THROW(loadConfigFromString("preview:\n  retry_delays_seconds: []\n"), std::runtime_error);
}

TEST_F(ConfigTest, RejectsZeroWorkers) {
    EXPECT_THROW(loadConfigFromString("preview:\n  worker_count: 0\n"), std::runtime_error);
}

TEST_F(ConfigTest, JsonViewOmitsPassword) {
    auto cfg = loadConfigFromString("database:\n  password: hunter2\n");
    EXPECT_EQ(cfg.database.password, "hunter2");

    const nlohmann::json j = cfg;
    EXPECT_FALSE(j.at("database").contains("password"));
    EXPECT_EQ(j.at("preview").at("retry_delays_seconds"), nlohmann::json::array({30, 120, 600}));
}
