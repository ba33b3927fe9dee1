#pragma once

#include "preview/Converter.hpp"
#include "config/Config.hpp"

#include <filesystem>
#include <string>

namespace ds::preview {

// Renders office documents to PDF through Gotenberg's LibreOffice route.
class GotenbergConverter final : public Converter {
public:
    static constexpr const char* CONVERT_ROUTE = "/forms/libreoffice/convert";
    static constexpr size_t MAX_ERROR_BODY = 2048;

    GotenbergConverter(config::GotenbergConfig gotenberg, config::StorageConfig storage);

    std::string convert(const fs::model::File& file) override;

    [[nodiscard]] std::string endpoint() const;

    // "<owner>/previews/<id>.pdf", relative to the preview root
    [[nodiscard]] static std::string previewPathFor(const fs::model::File& file, const std::string& previewId);

private:
    config::GotenbergConfig gotenberg_;
    config::StorageConfig storage_;

    std::string render(const fs::model::File& file, const std::filesystem::path& source) const;
    void writeArtifact(const std::filesystem::path& dest, const std::string& pdf) const;
};

}
