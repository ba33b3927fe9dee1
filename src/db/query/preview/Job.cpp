#include "db/query/preview/Job.hpp"
#include "db/Transactions.hpp"
#include "util/timestamp.hpp"
#include "util/uuid.hpp"

using namespace ds::preview::job;
using namespace ds::db;
using namespace ds::util;

using JobQueries = ds::db::query::preview::Job;

namespace {

JobQueries::JobPtr firstOrNull(const pqxx::result& res) {
    if (res.empty()) return nullptr;
    return std::make_shared<Job>(res.one_row());
}

std::string joinStatuses(const std::vector<Job::Status>& statuses) {
    std::string out;
    for (const auto& s : statuses) {
        if (!out.empty()) out += ',';
        out += Job::toString(s);
    }
    return out;
}

}

void JobQueries::create(const JobPtr& job) {
    if (job->id.empty()) job->id = generateUuid();

    const pqxx::params p {
        job->id,
        job->file_id,
        job->requested_by_id,
        std::string(J::toString(job->status)),
        job->attempts,
        job->max_attempts
    };

    Transactions::exec("PreviewJobQueries::create", [&](pqxx::work& txn) {
        const auto res = txn.exec(pqxx::prepped{"preview_job.insert"}, p);
        if (res.empty()) throw std::runtime_error("Failed to create preview job for file " + job->file_id);
        const auto row = res.one_row();
        job->created_at = parsePostgresTimestamp(row["created_at"].as<std::string>());
        job->updated_at = parsePostgresTimestamp(row["updated_at"].as<std::string>());
    });
}

void JobQueries::update(const JobPtr& job) {
    Transactions::exec("PreviewJobQueries::update", [&](pqxx::work& txn) {
        const auto res = txn.exec(pqxx::prepped{"preview_job.update"}, job->getUpdateParams());
        if (res.empty()) throw std::runtime_error("Preview job not found: " + job->id);
        job->updated_at = parsePostgresTimestamp(res.one_row()["updated_at"].as<std::string>());
    });
}

JobQueries::JobPtr JobQueries::getById(const std::string& id) {
    return Transactions::exec("PreviewJobQueries::getById", [&](pqxx::work& txn) {
        return firstOrNull(txn.exec(pqxx::prepped{"preview_job.get_by_id"}, pqxx::params{id}));
    });
}

JobQueries::JobPtr JobQueries::getLatestForFile(const std::string& fileId) {
    return Transactions::exec("PreviewJobQueries::getLatestForFile", [&](pqxx::work& txn) {
        return firstOrNull(txn.exec(pqxx::prepped{"preview_job.latest_for_file"}, pqxx::params{fileId}));
    });
}

JobQueries::JobPtr JobQueries::getLatestForFile(const std::string& fileId, const std::vector<J::Status>& statuses) {
    if (statuses.empty()) return getLatestForFile(fileId);

    return Transactions::exec("PreviewJobQueries::getLatestForFileInStatus", [&](pqxx::work& txn) {
        const pqxx::params p { fileId, joinStatuses(statuses) };
        return firstOrNull(txn.exec(pqxx::prepped{"preview_job.latest_for_file_in_status"}, p));
    });
}

std::vector<JobQueries::JobPtr> JobQueries::listStale(const std::time_t updatedBefore) {
    return Transactions::exec("PreviewJobQueries::listStale", [&](pqxx::work& txn) {
        const auto res = txn.exec(pqxx::prepped{"preview_job.list_stale"}, pqxx::params{timestampToString(updatedBefore)});
        return jobs_from_pqxx_res(res);
    });
}

std::vector<JobQueries::JobPtr> JobQueries::listDue(const std::time_t now) {
    return Transactions::exec("PreviewJobQueries::listDue", [&](pqxx::work& txn) {
        const auto res = txn.exec(pqxx::prepped{"preview_job.list_due"}, pqxx::params{timestampToString(now)});
        return jobs_from_pqxx_res(res);
    });
}
