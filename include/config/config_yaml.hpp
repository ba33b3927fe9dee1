#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace ds::config;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<DatabaseConfig> {
    static Node encode(const DatabaseConfig& rhs) {
        Node node;
        node["host"] = rhs.host;
        node["port"] = rhs.port;
        node["name"] = rhs.name;
        node["user"] = rhs.user;
        node["sslmode"] = rhs.sslmode;
        node["pool_size"] = rhs.pool_size;
        // password is never written back
        return node;
    }

    static bool decode(const Node& node, DatabaseConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.host = node["host"].as<std::string>("localhost");
        rhs.port = node["port"].as<uint16_t>(5432);
        rhs.name = node["name"].as<std::string>("docshare");
        rhs.user = node["user"].as<std::string>("docshare");
        rhs.password = node["password"].as<std::string>("");
        rhs.sslmode = node["sslmode"].as<std::string>("disable");
        rhs.pool_size = node["pool_size"].as<unsigned int>(4);
        return true;
    }
};

template<>
struct convert<PreviewConfig> {
    static Node encode(const PreviewConfig& rhs) {
        Node node;
        node["queue_buffer_size"] = rhs.queue_buffer_size;
        node["max_attempts"] = rhs.max_attempts;
        std::vector<long> delays;
        for (const auto& d : rhs.retry_delays) delays.push_back(static_cast<long>(d.count()));
        node["retry_delays_seconds"] = delays;
        node["worker_count"] = rhs.worker_count;
        node["sweep_interval_minutes"] = static_cast<long>(rhs.sweep_interval.count());
        return node;
    }

    static bool decode(const Node& node, PreviewConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.queue_buffer_size = node["queue_buffer_size"].as<unsigned int>(100);
        rhs.max_attempts = node["max_attempts"].as<unsigned int>(3);
        if (const auto delays = node["retry_delays_seconds"]) {
            rhs.retry_delays.clear();
            for (const auto& d : delays) rhs.retry_delays.emplace_back(d.as<long>());
        }
        rhs.worker_count = node["worker_count"].as<unsigned int>(1);
        rhs.sweep_interval = std::chrono::minutes(node["sweep_interval_minutes"].as<long>(5));
        return true;
    }
};

template<>
struct convert<GotenbergConfig> {
    static Node encode(const GotenbergConfig& rhs) {
        Node node;
        node["url"] = rhs.url;
        node["timeout_seconds"] = static_cast<long>(rhs.timeout.count());
        return node;
    }

    static bool decode(const Node& node, GotenbergConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.url = node["url"].as<std::string>("http://localhost:3000");
        rhs.timeout = std::chrono::seconds(node["timeout_seconds"].as<long>(120));
        return true;
    }
};

template<>
struct convert<StorageConfig> {
    static Node encode(const StorageConfig& rhs) {
        Node node;
        node["root"] = rhs.root.string();
        node["preview_root"] = rhs.preview_root.string();
        return node;
    }

    static bool decode(const Node& node, StorageConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.root = node["root"].as<std::string>("/var/lib/docshare/storage");
        rhs.preview_root = node["preview_root"].as<std::string>("/var/lib/docshare/previews");
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["docshare"] = to_std_string(spdlog::level::to_string_view(rhs.docshare));
        node["preview"]  = to_std_string(spdlog::level::to_string_view(rhs.preview));
        node["convert"]  = to_std_string(spdlog::level::to_string_view(rhs.convert));
        node["db"]       = to_std_string(spdlog::level::to_string_view(rhs.db));
        node["types"]    = to_std_string(spdlog::level::to_string_view(rhs.types));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.docshare = spdlog::level::from_str(node["docshare"].as<std::string>("info"));
        rhs.preview = spdlog::level::from_str(node["preview"].as<std::string>("info"));
        rhs.convert = spdlog::level::from_str(node["convert"].as<std::string>("warning"));
        rhs.db = spdlog::level::from_str(node["db"].as<std::string>("error"));
        rhs.types = spdlog::level::from_str(node["types"].as<std::string>("error"));
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
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("warning"));
        if (node["subsystem_levels"]) rhs.subsystem_levels = node["subsystem_levels"].as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        if (node["log_levels"]) rhs.levels = node["log_levels"].as<LogLevelsConfig>();
        return true;
    }
};

}
