#include "db/Schema.hpp"
#include "db/Transactions.hpp"

void ds::db::schema::initTablesIfNotExists() {
    Transactions::exec("Schema::initTablesIfNotExists", [&](pqxx::work& txn) {
        txn.exec(R"(
CREATE TABLE IF NOT EXISTS preview_jobs
(
    id               UUID          PRIMARY KEY,
    file_id          UUID          NOT NULL,
    requested_by_id  UUID,
    status           VARCHAR(20)   NOT NULL DEFAULT 'pending',
    attempts         INTEGER       NOT NULL DEFAULT 0,
    max_attempts     INTEGER       NOT NULL DEFAULT 3,
    last_error       TEXT,
    next_retry_at    TIMESTAMPTZ,
    started_at       TIMESTAMPTZ,
    completed_at     TIMESTAMPTZ,
    created_at       TIMESTAMPTZ   NOT NULL DEFAULT NOW(),
    updated_at       TIMESTAMPTZ   NOT NULL DEFAULT NOW(),
    CONSTRAINT preview_jobs_status_check
        CHECK (status IN ('pending', 'processing', 'completed', 'failed'))
);
        )");

        txn.exec("CREATE INDEX IF NOT EXISTS idx_preview_jobs_file_id ON preview_jobs (file_id, created_at DESC)");
        txn.exec("CREATE INDEX IF NOT EXISTS idx_preview_jobs_status ON preview_jobs (status)");
        txn.exec("CREATE INDEX IF NOT EXISTS idx_preview_jobs_next_retry_at ON preview_jobs (next_retry_at)");
        txn.exec("CREATE INDEX IF NOT EXISTS idx_preview_jobs_requested_by_id ON preview_jobs (requested_by_id)");
    });
}
