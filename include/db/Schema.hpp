#pragma once

namespace ds::db::schema {

// Creates preview_jobs and its indexes if missing. The files table belongs to
// the platform's own migrations and must already exist.
void initTablesIfNotExists();

}
