#include "db/DBConnection.hpp"

using namespace ds::db;

void DBConnection::initPreparedFiles() const {
    conn_->prepare("files.get_by_id",
                   R"SQL(
            SELECT id, owner_id, name, mime_type, size, is_directory,
                   storage_path, thumbnail_path, updated_at
            FROM files
            WHERE id = $1
              AND deleted_at IS NULL
        )SQL");

    conn_->prepare("files.set_thumbnail_path",
                   R"SQL(
            UPDATE files
            SET thumbnail_path = $2
            WHERE id = $1
        )SQL");
}
