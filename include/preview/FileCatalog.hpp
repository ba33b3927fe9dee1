#pragma once

#include "fs/model/File.hpp"

#include <memory>
#include <string>

namespace ds::preview {

class FileCatalog {
public:
    virtual ~FileCatalog() = default;

    // nullptr when the file no longer exists
    [[nodiscard]] virtual std::shared_ptr<fs::model::File> getFile(const std::string& fileId) = 0;
};

}
