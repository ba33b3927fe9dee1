#pragma once

#include "preview/job/Job.hpp"

#include <ctime>
#include <string>
#include <vector>

namespace ds::preview::job {

// Durable home of preview jobs. Implementations report failures by throwing.
class Store {
public:
    virtual ~Store() = default;

    // Assigns id, created_at and updated_at on the passed job.
    virtual void create(const JobPtr& job) = 0;

    // Writes the mutable columns of the row with job->id and refreshes job->updated_at.
    virtual void update(const JobPtr& job) = 0;

    [[nodiscard]] virtual JobPtr findById(const std::string& id) = 0;

    // Most recently created job for the file whose status is in `statuses`
    // (any status when empty), or nullptr.
    [[nodiscard]] virtual JobPtr findLatest(const std::string& fileId,
                                            const std::vector<Job::Status>& statuses = {}) = 0;

    // processing jobs not touched since `updatedBefore`
    [[nodiscard]] virtual std::vector<JobPtr> findStale(std::time_t updatedBefore) = 0;

    // pending jobs with no next_retry_at or one <= now, plus failed jobs with
    // attempts left whose next_retry_at <= now
    [[nodiscard]] virtual std::vector<JobPtr> findDue(std::time_t now) = 0;
};

}
