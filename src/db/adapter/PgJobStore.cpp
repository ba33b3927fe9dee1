#include "db/adapter/PgJobStore.hpp"
#include "db/query/preview/Job.hpp"

using namespace ds::db::adapter;
using namespace ds::preview::job;
using JobQueries = ds::db::query::preview::Job;

void PgJobStore::create(const JobPtr& job) { JobQueries::create(job); }

void PgJobStore::update(const JobPtr& job) { JobQueries::update(job); }

JobPtr PgJobStore::findById(const std::string& id) { return JobQueries::getById(id); }

JobPtr PgJobStore::findLatest(const std::string& fileId, const std::vector<Job::Status>& statuses) {
    return JobQueries::getLatestForFile(fileId, statuses);
}

std::vector<JobPtr> PgJobStore::findStale(const std::time_t updatedBefore) {
    return JobQueries::listStale(updatedBefore);
}

std::vector<JobPtr> PgJobStore::findDue(const std::time_t now) { return JobQueries::listDue(now); }
