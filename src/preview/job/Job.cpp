#include "preview/job/Job.hpp"
#include "util/timestamp.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <cctype>
#include <nlohmann/json.hpp>
#include <pqxx/row>
#include <pqxx/result>

namespace {
    std::string lowerCopy(std::string_view sv) {
        std::string s(sv);
        std::ranges::transform(s.begin(), s.end(), s.begin(),
                               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    std::time_t timestampOrZero(const pqxx::row& r, const char* col) {
        const auto f = r[col];
        return f.is_null() ? 0 : ds::util::parsePostgresTimestamp(f.as<std::string>());
    }
}

using namespace ds::preview::job;
using namespace ds::util;

Job::Job(const pqxx::row& row)
    : id(row["id"].as<std::string>())
    , file_id(row["file_id"].as<std::string>())
    , requested_by_id(row["requested_by_id"].as<std::optional<std::string>>())
    , attempts(row["attempts"].as<uint32_t>(0))
    , max_attempts(row["max_attempts"].as<uint32_t>(3))
    , last_error(row["last_error"].as<std::optional<std::string>>())
    , started_at(timestampOrZero(row, "started_at"))
    , completed_at(timestampOrZero(row, "completed_at"))
    , next_retry_at(timestampOrZero(row, "next_retry_at"))
    , created_at(timestampOrZero(row, "created_at"))
    , updated_at(timestampOrZero(row, "updated_at"))
{
    const auto raw = row["status"].as<std::string>();
    if (!tryParseStatus(raw, status))
        throw std::runtime_error("Unknown preview job status '" + raw + "' for job " + id);
}

std::string_view Job::toString(const Status s) noexcept {
    switch (s) {
        case Status::PENDING:    return "pending";
        case Status::PROCESSING: return "processing";
        case Status::COMPLETED:  return "completed";
        case Status::FAILED:     return "failed";
        default:                 return "pending";
    }
}

bool Job::tryParseStatus(const std::string_view in, Status& out) noexcept {
    const std::string s = lowerCopy(in);
    if (s == "pending")    { out = Status::PENDING; return true; }
    if (s == "processing") { out = Status::PROCESSING; return true; }
    if (s == "completed")  { out = Status::COMPLETED; return true; }
    if (s == "failed")     { out = Status::FAILED; return true; }
    return false;
}

pqxx::params Job::getUpdateParams() const {
    return {
        id,
        std::string(toString(status)),
        attempts,
        max_attempts,
        last_error,
        nullableTimestamp(started_at),
        nullableTimestamp(completed_at),
        nullableTimestamp(next_retry_at)
    };
}

void ds::preview::job::to_json(nlohmann::json& j, const Job& job) {
    j = {
        {"id", job.id},
        {"fileID", job.file_id},
        {"status", std::string(Job::toString(job.status))},
        {"attempts", job.attempts},
        {"maxAttempts", job.max_attempts},
        {"createdAt", timestampToString(job.created_at)},
        {"updatedAt", timestampToString(job.updated_at)}
    };

    if (job.requested_by_id) j["requestedByID"] = *job.requested_by_id;
    if (job.last_error) j["lastError"] = *job.last_error;
    if (job.started_at) j["startedAt"] = timestampToString(job.started_at);
    if (job.completed_at) j["completedAt"] = timestampToString(job.completed_at);
    if (job.next_retry_at) j["nextRetryAt"] = timestampToString(job.next_retry_at);
}

std::vector<JobPtr> ds::preview::job::jobs_from_pqxx_res(const pqxx::result& res) {
    std::vector<JobPtr> jobs;
    for (const auto& row : res) {
        try {
            jobs.push_back(std::make_shared<Job>(row));
        } catch (const std::exception& ex) {
            log::Registry::types()->error("[PreviewJob] Failed to parse job from database row: {}", ex.what());
        }
    }
    return jobs;
}
