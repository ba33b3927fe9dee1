#include "db/adapter/PgFileCatalog.hpp"
#include "db/query/fs/File.hpp"

using namespace ds::db::adapter;

std::shared_ptr<ds::fs::model::File> PgFileCatalog::getFile(const std::string& fileId) {
    return query::fs::File::getFileById(fileId);
}
