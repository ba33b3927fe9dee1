#pragma once

#include "db/DBConnection.hpp"
#include "config/Config.hpp"

#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <vector>

namespace ds::db {

class DBPool {
  public:
    explicit DBPool(const config::DatabaseConfig& cfg) : size_(cfg.pool_size) {
        for (size_t i = 0; i < size_; ++i) pool_.push(std::make_unique<DBConnection>(cfg));
    }

    std::unique_ptr<DBConnection> acquire() {
        std::unique_lock lock(mtx_);
        cv_.wait(lock, [&]() { return !pool_.empty(); });
        auto conn = std::move(pool_.front());
        pool_.pop();
        return conn;
    }

    void release(std::unique_ptr<DBConnection> conn) {
        {
            std::lock_guard lock(mtx_);
            pool_.push(std::move(conn));
        }
        cv_.notify_one();
    }

    // Prepared statements are per connection; run once the schema exists.
    void initPreparedStatements() {
        std::vector<std::unique_ptr<DBConnection>> all;
        for (size_t i = 0; i < size_; ++i) all.push_back(acquire());
        try {
            for (const auto& conn : all) conn->initPrepared();
        } catch (...) {
            for (auto& conn : all) release(std::move(conn));
            throw;
        }
        for (auto& conn : all) release(std::move(conn));
    }

  private:
    size_t size_;
    std::queue<std::unique_ptr<DBConnection>> pool_;
    std::mutex mtx_;
    std::condition_variable cv_;
};

} // namespace ds::db
