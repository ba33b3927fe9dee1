#include "db/DBConnection.hpp"
#include "config/Config.hpp"
#include "log/Registry.hpp"

#include <sstream>

namespace ds::db {

DBConnection::DBConnection(const config::DatabaseConfig& cfg)
    : conn_(std::make_unique<pqxx::connection>(connectionString(cfg))) {
    log::Registry::db()->debug("[DBConnection] Connected to {}:{}/{}", cfg.host, cfg.port, cfg.name);
}

pqxx::connection& DBConnection::get() const { return *conn_; }

std::string DBConnection::connectionString(const config::DatabaseConfig& cfg) {
    std::ostringstream oss;
    oss << "host=" << cfg.host
        << " port=" << cfg.port
        << " dbname=" << cfg.name
        << " user=" << cfg.user
        << " sslmode=" << cfg.sslmode
        // timestamps are exchanged as UTC text
        << " options='-c timezone=UTC'";
    if (!cfg.password.empty()) oss << " password=" << cfg.password;
    return oss.str();
}

void DBConnection::initPrepared() const {
    initPreparedPreviewJobs();
    initPreparedFiles();
}

} // namespace ds::db
