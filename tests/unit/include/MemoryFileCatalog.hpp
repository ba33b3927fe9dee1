#pragma once

#include "preview/FileCatalog.hpp"

#include <map>
#include <mutex>
#include <stdexcept>

namespace ds::test {

class MemoryFileCatalog final : public preview::FileCatalog {
public:
    bool failLookups = false;

    void add(const std::string& id, const std::string& name, const bool isDirectory = false) {
        fs::model::File f;
        f.id = id;
        f.owner_id = "owner-1";
        f.name = name;
        f.is_directory = isDirectory;
        f.storage_path = "owner-1/" + id;
        std::scoped_lock lock(mutex_);
        files_[id] = f;
    }

    std::shared_ptr<fs::model::File> getFile(const std::string& fileId) override {
        std::scoped_lock lock(mutex_);
        if (failLookups) throw std::runtime_error("lookup timed out");
        const auto it = files_.find(fileId);
        return it == files_.end() ? nullptr : std::make_shared<fs::model::File>(it->second);
    }

private:
    std::mutex mutex_;
    std::map<std::string, fs::model::File> files_;
};

}
