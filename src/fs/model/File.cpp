#include "fs/model/File.hpp"
#include "util/timestamp.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <pqxx/row>

using namespace ds::fs::model;

namespace {
constexpr std::array<std::string_view, 6> OFFICE_EXTENSIONS = {
    ".docx", ".xlsx", ".pptx", ".odt", ".ods", ".odp"
};
}

File::File(const pqxx::row& row)
    : id(row.at("id").as<std::string>()),
      owner_id(row.at("owner_id").as<std::string>()),
      name(row.at("name").as<std::string>()),
      mime_type(row.at("mime_type").as<std::optional<std::string>>()),
      size_bytes(row.at("size").as<uint64_t>(0)),
      is_directory(row.at("is_directory").as<bool>(false)),
      storage_path(row.at("storage_path").as<std::string>("")),
      thumbnail_path(row.at("thumbnail_path").as<std::optional<std::string>>()),
      updated_at(row.at("updated_at").is_null() ? 0 : util::parsePostgresTimestamp(row.at("updated_at").as<std::string>())) {}

std::string File::extension() const {
    auto ext = std::filesystem::path(name).extension().string();
    std::ranges::transform(ext, ext.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

bool File::isOfficeDocument() const {
    const auto ext = extension();
    return std::ranges::find(OFFICE_EXTENSIONS, ext) != OFFICE_EXTENSIONS.end();
}
