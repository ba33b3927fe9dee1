#pragma once

#include <memory>
#include <string>

namespace ds::fs::model { struct File; }

namespace ds::db::query::fs {

class File {
    using F = ds::fs::model::File;

public:
    using FilePtr = std::shared_ptr<F>;

    static FilePtr getFileById(const std::string& id);

    static void setThumbnailPath(const std::string& id, const std::string& thumbnailPath);
};

}
