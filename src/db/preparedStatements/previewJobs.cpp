#include "db/DBConnection.hpp"

using namespace ds::db;

void DBConnection::initPreparedPreviewJobs() const {
    static constexpr auto COLUMNS = R"SQL(
        id, file_id, requested_by_id, status, attempts, max_attempts, last_error,
        started_at, completed_at, next_retry_at, created_at, updated_at
    )SQL";

    const std::string columns(COLUMNS);

    conn_->prepare("preview_job.insert",
                   R"SQL(
            INSERT INTO preview_jobs
            (
                id,
                file_id,
                requested_by_id,
                status,
                attempts,
                max_attempts
            )
            VALUES ($1, $2, $3, $4, $5, $6)
            RETURNING created_at, updated_at;
        )SQL");

    conn_->prepare("preview_job.update",
                   R"SQL(
            UPDATE preview_jobs
            SET status        = $2,
                attempts      = $3,
                max_attempts  = $4,
                last_error    = $5,
                started_at    = $6,
                completed_at  = $7,
                next_retry_at = $8,
                updated_at    = NOW()
            WHERE id = $1
            RETURNING updated_at;
        )SQL");

    conn_->prepare("preview_job.get_by_id",
                   "SELECT " + columns + " FROM preview_jobs WHERE id = $1");

    conn_->prepare("preview_job.latest_for_file",
                   "SELECT " + columns + R"SQL(
            FROM preview_jobs
            WHERE file_id = $1
            ORDER BY created_at DESC
            LIMIT 1
        )SQL");

    // $2 is a comma separated status list
    conn_->prepare("preview_job.latest_for_file_in_status",
                   "SELECT " + columns + R"SQL(
            FROM preview_jobs
            WHERE file_id = $1
              AND status = ANY (string_to_array($2, ','))
            ORDER BY created_at DESC
            LIMIT 1
        )SQL");

    conn_->prepare("preview_job.list_stale",
                   "SELECT " + columns + R"SQL(
            FROM preview_jobs
            WHERE status = 'processing'
              AND updated_at < $1
            ORDER BY updated_at
        )SQL");

    conn_->prepare("preview_job.list_due",
                   "SELECT " + columns + R"SQL(
            FROM preview_jobs
            WHERE (status = 'pending' AND (next_retry_at IS NULL OR next_retry_at <= $1))
               OR (status = 'failed' AND attempts < max_attempts AND next_retry_at <= $1)
            ORDER BY created_at
        )SQL");
}
