#pragma once

#include <memory>
#include <string>
#include <pqxx/connection>

namespace ds::config { struct DatabaseConfig; }

namespace ds::db {

class DBConnection {
  public:
    explicit DBConnection(const config::DatabaseConfig& cfg);

    [[nodiscard]] pqxx::connection& get() const;

    void initPrepared() const;

    static std::string connectionString(const config::DatabaseConfig& cfg);

  private:
    std::unique_ptr<pqxx::connection> conn_;

    void initPreparedPreviewJobs() const;
    void initPreparedFiles() const;
};

} // namespace ds::db
