#pragma once

#include "preview/job/Store.hpp"

namespace ds::db::adapter {

// preview::job::Store over the pooled Postgres connections
class PgJobStore final : public preview::job::Store {
public:
    void create(const preview::job::JobPtr& job) override;
    void update(const preview::job::JobPtr& job) override;

    [[nodiscard]] preview::job::JobPtr findById(const std::string& id) override;
    [[nodiscard]] preview::job::JobPtr findLatest(const std::string& fileId,
                                                  const std::vector<preview::job::Job::Status>& statuses) override;
    [[nodiscard]] std::vector<preview::job::JobPtr> findStale(std::time_t updatedBefore) override;
    [[nodiscard]] std::vector<preview::job::JobPtr> findDue(std::time_t now) override;
};

}
