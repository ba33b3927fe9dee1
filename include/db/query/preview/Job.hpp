#pragma once

#include "preview/job/Job.hpp"

#include <ctime>
#include <memory>
#include <string>
#include <vector>

namespace ds::db::query::preview {

class Job {
    using J = ds::preview::job::Job;

public:
    using JobPtr = std::shared_ptr<J>;

    static void create(const JobPtr& job);
    static void update(const JobPtr& job);

    static JobPtr getById(const std::string& id);
    static JobPtr getLatestForFile(const std::string& fileId);
    static JobPtr getLatestForFile(const std::string& fileId, const std::vector<J::Status>& statuses);

    static std::vector<JobPtr> listStale(std::time_t updatedBefore);
    static std::vector<JobPtr> listDue(std::time_t now);
};

}
