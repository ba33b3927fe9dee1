#pragma once

#include <cstdint>
#include <ctime>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace pqxx { class row; }

namespace ds::fs::model {

// Read-side view of a stored document; only what the preview pipeline needs.
struct File {
    std::string id;
    std::string owner_id;
    std::string name;
    std::optional<std::string> mime_type;
    uint64_t size_bytes{0};
    bool is_directory{false};
    std::filesystem::path storage_path;
    std::optional<std::string> thumbnail_path;
    std::time_t updated_at{0};

    File() = default;
    explicit File(const pqxx::row& row);

    [[nodiscard]] std::string extension() const;
    [[nodiscard]] bool isOfficeDocument() const;
};

}
