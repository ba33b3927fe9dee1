#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <charconv>
#include <cstdlib>
#include <limits>
#include <stdexcept>
#include <string>
#include <string_view>
#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>

namespace ds::config {

namespace {

Config decodeRoot(const YAML::Node& root) {
    Config cfg;

    if (auto node = root["database"]) YAML::convert<DatabaseConfig>::decode(node, cfg.database);
    if (auto node = root["preview"]) YAML::convert<PreviewConfig>::decode(node, cfg.preview);
    if (auto node = root["gotenberg"]) YAML::convert<GotenbergConfig>::decode(node, cfg.gotenberg);
    if (auto node = root["storage"]) YAML::convert<StorageConfig>::decode(node, cfg.storage);
    if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);

    applyEnvOverrides(cfg);
    cfg.validate();
    return cfg;
}

template <typename T>
void overrideUnsigned(const char* name, T& target) {
    const char* env = std::getenv(name);
    if (!env || !*env) return;

    const std::string_view raw(env);
    unsigned long long value = 0;
    const auto [end, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), value);

    // from_chars rejects a sign, so only digits reach the range check
    if (ec != std::errc{} || end != raw.data() + raw.size() || value > std::numeric_limits<T>::max())
        throw std::runtime_error(std::string("Invalid value for ") + name + ": " + env);

    target = static_cast<T>(value);
}

void overrideString(const char* name, std::string& target) {
    if (const char* env = std::getenv(name); env && *env) target = env;
}

}

void Config::validate() const {
    if (preview.max_attempts == 0)
        throw std::runtime_error("preview.max_attempts must be at least 1");
    if (preview.retry_delays.empty())
        throw std::runtime_error("preview.retry_delays_seconds must contain at least one delay");
    for (const auto& d : preview.retry_delays)
        if (d.count() < 0) throw std::runtime_error("preview.retry_delays_seconds must not be negative");
    if (preview.sweep_interval.count() <= 0)
        throw std::runtime_error("preview.sweep_interval_minutes must be at least 1");
    if (preview.worker_count == 0)
        throw std::runtime_error("preview.worker_count must be at least 1");
    if (database.pool_size == 0)
        throw std::runtime_error("database.pool_size must be at least 1");
}

Config loadConfig(const std::filesystem::path& path) {
    return decodeRoot(YAML::LoadFile(path.string()));
}

Config loadConfigFromString(const std::string& yaml) {
    return decodeRoot(YAML::Load(yaml));
}

void applyEnvOverrides(Config& cfg) {
    overrideUnsigned("PREVIEW_QUEUE_BUFFER_SIZE", cfg.preview.queue_buffer_size);
    overrideUnsigned("PREVIEW_JOB_MAX_ATTEMPTS", cfg.preview.max_attempts);
    overrideString("GOTENBERG_URL", cfg.gotenberg.url);
    overrideString("DB_HOST", cfg.database.host);
    overrideUnsigned("DB_PORT", cfg.database.port);
    overrideString("DB_USER", cfg.database.user);
    overrideString("DB_PASSWORD", cfg.database.password);
    overrideString("DB_NAME", cfg.database.name);
}

void to_json(nlohmann::json& j, const Config& c) {
    j = {
        {"database", c.database},
        {"preview", c.preview},
        {"gotenberg", c.gotenberg},
        {"storage", c.storage},
        {"logging", c.logging}
    };
}

void from_json(const nlohmann::json& j, Config& c) {
    j.at("database").get_to(c.database);
    j.at("preview").get_to(c.preview);
    j.at("gotenberg").get_to(c.gotenberg);
    j.at("storage").get_to(c.storage);
    j.at("logging").get_to(c.logging);
}

void to_json(nlohmann::json& j, const DatabaseConfig& c) {
    j = {
        {"host", c.host},
        {"port", c.port},
        {"name", c.name},
        {"user", c.user},
        {"sslmode", c.sslmode},
        {"pool_size", c.pool_size}
        // Do not serialize password
    };
}

void from_json(const nlohmann::json& j, DatabaseConfig& c) {
    c.host = j.value("host", "localhost");
    c.port = j.value("port", 5432);
    c.name = j.value("name", "docshare");
    c.user = j.value("user", "docshare");
    c.sslmode = j.value("sslmode", "disable");
    c.pool_size = j.value("pool_size", 4u);
}

void to_json(nlohmann::json& j, const PreviewConfig& c) {
    std::vector<long> delays;
    for (const auto& d : c.retry_delays) delays.push_back(static_cast<long>(d.count()));
    j = {
        {"queue_buffer_size", c.queue_buffer_size},
        {"max_attempts", c.max_attempts},
        {"retry_delays_seconds", delays},
        {"worker_count", c.worker_count},
        {"sweep_interval_minutes", c.sweep_interval.count()}
    };
}

void from_json(const nlohmann::json& j, PreviewConfig& c) {
    c.queue_buffer_size = j.value("queue_buffer_size", 100u);
    c.max_attempts = j.value("max_attempts", 3u);
    if (j.contains("retry_delays_seconds")) {
        c.retry_delays.clear();
        for (const auto& d : j.at("retry_delays_seconds")) c.retry_delays.emplace_back(d.get<long>());
    }
    c.worker_count = j.value("worker_count", 1u);
    c.sweep_interval = std::chrono::minutes(j.value("sweep_interval_minutes", 5L));
}

void to_json(nlohmann::json& j, const GotenbergConfig& c) {
    j = {
        {"url", c.url},
        {"timeout_seconds", c.timeout.count()}
    };
}

void from_json(const nlohmann::json& j, GotenbergConfig& c) {
    c.url = j.value("url", "http://localhost:3000");
    c.timeout = std::chrono::seconds(j.value("timeout_seconds", 120L));
}

void to_json(nlohmann::json& j, const StorageConfig& c) {
    j = {
        {"root", c.root.string()},
        {"preview_root", c.preview_root.string()}
    };
}

void from_json(const nlohmann::json& j, StorageConfig& c) {
    c.root = j.value("root", "/var/lib/docshare/storage");
    c.preview_root = j.value("preview_root", "/var/lib/docshare/previews");
}

void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c) {
    j = {
        {"docshare", c.docshare},
        {"preview", c.preview},
        {"convert", c.convert},
        {"db", c.db},
        {"types", c.types}
    };
}

void from_json(const nlohmann::json& j, SubsystemLogLevelsConfig& c) {
    c.docshare = j.value("docshare", spdlog::level::info);
    c.preview = j.value("preview", spdlog::level::info);
    c.convert = j.value("convert", spdlog::level::warn);
    c.db = j.value("db", spdlog::level::err);
    c.types = j.value("types", spdlog::level::err);
}

void to_json(nlohmann::json& j, const LogLevelsConfig& c) {
    j = {
        {"console_log_level", c.console_log_level},
        {"file_log_level", c.file_log_level},
        {"subsystem_levels", c.subsystem_levels}
    };
}

void from_json(const nlohmann::json& j, LogLevelsConfig& c) {
    c.console_log_level = j.value("console_log_level", spdlog::level::info);
    c.file_log_level = j.value("file_log_level", spdlog::level::warn);
    if (j.contains("subsystem_levels")) j.at("subsystem_levels").get_to(c.subsystem_levels);
}

void to_json(nlohmann::json& j, const LoggingConfig& c) {
    j = {
        {"levels", c.levels}
    };
}

void from_json(const nlohmann::json& j, LoggingConfig& c) {
    if (j.contains("levels")) j.at("levels").get_to(c.levels);
}

} // namespace ds::config
