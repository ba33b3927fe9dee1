#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include <nlohmann/json_fwd.hpp>

namespace ds::config {

struct DatabaseConfig {
    std::string host = "localhost";
    uint16_t port = 5432;
    std::string name = "docshare";
    std::string user = "docshare";
    std::string password;
    std::string sslmode = "disable";
    unsigned int pool_size = 4;
};

struct PreviewConfig {
    unsigned int queue_buffer_size = 100;
    unsigned int max_attempts = 3;
    std::vector<std::chrono::seconds> retry_delays = {
        std::chrono::seconds(30), std::chrono::minutes(2), std::chrono::minutes(10)
    };
    unsigned int worker_count = 1; // >1 gives up the one-conversion-per-file guarantee
    std::chrono::minutes sweep_interval = std::chrono::minutes(5);
};

struct GotenbergConfig {
    std::string url = "http://localhost:3000";
    std::chrono::seconds timeout = std::chrono::seconds(120);
};

struct StorageConfig {
    std::filesystem::path root = "/var/lib/docshare/storage";
    std::filesystem::path preview_root = "/var/lib/docshare/previews";
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum docshare = spdlog::level::info;   // Startup, shutdown, service state
    spdlog::level::level_enum preview  = spdlog::level::info;   // Job lifecycle events
    spdlog::level::level_enum convert  = spdlog::level::warn;   // Conversion backend failures
    spdlog::level::level_enum db       = spdlog::level::err;    // Unreachable DB, failed tx
    spdlog::level::level_enum types    = spdlog::level::err;    // Rows that fail to parse
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::warn;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    LogLevelsConfig levels;
};

struct Config {
    DatabaseConfig database;
    PreviewConfig preview;
    GotenbergConfig gotenberg;
    StorageConfig storage;
    LoggingConfig logging;

    void validate() const;
};

Config loadConfig(const std::filesystem::path& path);
Config loadConfigFromString(const std::string& yaml);
void applyEnvOverrides(Config& cfg);

void to_json(nlohmann::json& j, const Config& c);
void from_json(const nlohmann::json& j, Config& c);
void to_json(nlohmann::json& j, const DatabaseConfig& c);
void from_json(const nlohmann::json& j, DatabaseConfig& c);
void to_json(nlohmann::json& j, const PreviewConfig& c);
void from_json(const nlohmann::json& j, PreviewConfig& c);
void to_json(nlohmann::json& j, const GotenbergConfig& c);
void from_json(const nlohmann::json& j, GotenbergConfig& c);
void to_json(nlohmann::json& j, const StorageConfig& c);
void from_json(const nlohmann::json& j, StorageConfig& c);
void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c);
void from_json(const nlohmann::json& j, SubsystemLogLevelsConfig& c);
void to_json(nlohmann::json& j, const LogLevelsConfig& c);
void from_json(const nlohmann::json& j, LogLevelsConfig& c);
void to_json(nlohmann::json& j, const LoggingConfig& c);
void from_json(const nlohmann::json& j, LoggingConfig& c);

} // namespace ds::config
