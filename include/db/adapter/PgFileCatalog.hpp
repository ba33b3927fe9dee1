#pragma once

#include "preview/FileCatalog.hpp"

namespace ds::db::adapter {

class PgFileCatalog final : public preview::FileCatalog {
public:
    [[nodiscard]] std::shared_ptr<fs::model::File> getFile(const std::string& fileId) override;
};

}
