#include "db/query/fs/File.hpp"
#include "db/Transactions.hpp"
#include "fs/model/File.hpp"

using FileQueries = ds::db::query::fs::File;
using namespace ds::db;

FileQueries::FilePtr FileQueries::getFileById(const std::string& id) {
    return Transactions::exec("FileQueries::getFileById", [&](pqxx::work& txn) -> FilePtr {
        const auto res = txn.exec(pqxx::prepped{"files.get_by_id"}, pqxx::params{id});
        if (res.empty()) return nullptr;
        return std::make_shared<F>(res.one_row());
    });
}

void FileQueries::setThumbnailPath(const std::string& id, const std::string& thumbnailPath) {
    Transactions::exec("FileQueries::setThumbnailPath", [&](pqxx::work& txn) {
        txn.exec(pqxx::prepped{"files.set_thumbnail_path"}, pqxx::params{id, thumbnailPath});
    });
}
