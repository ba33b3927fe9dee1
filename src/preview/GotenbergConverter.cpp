#include "preview/GotenbergConverter.hpp"
#include "db/query/fs/File.hpp"
#include "log/Registry.hpp"
#include "util/curlWrappers.hpp"
#include "util/uuid.hpp"

#include <fmt/format.h>
#include <fstream>
#include <stdexcept>

using namespace ds::preview;
using namespace ds::util;

GotenbergConverter::GotenbergConverter(config::GotenbergConfig gotenberg, config::StorageConfig storage)
    : gotenberg_(std::move(gotenberg)), storage_(std::move(storage)) {
    if (gotenberg_.url.empty()) throw std::invalid_argument("Gotenberg URL must not be empty");
}

std::string GotenbergConverter::endpoint() const {
    auto base = gotenberg_.url;
    while (!base.empty() && base.back() == '/') base.pop_back();
    return base + CONVERT_ROUTE;
}

std::string GotenbergConverter::previewPathFor(const fs::model::File& file, const std::string& previewId) {
    return fmt::format("{}/previews/{}.pdf", file.owner_id, previewId);
}

std::string GotenbergConverter::convert(const fs::model::File& file) {
    if (file.is_directory) throw std::runtime_error("cannot preview a directory");

    // pdf, images and text are served as they are
    if (!file.isOfficeDocument()) return file.storage_path.string();

    const auto source = storage_.root / file.storage_path;
    if (!std::filesystem::exists(source))
        throw std::runtime_error("source object missing: " + source.string());

    const auto pdf = render(file, source);

    const auto previewPath = previewPathFor(file, generateUuid());
    const auto dest = storage_.preview_root / previewPath;
    writeArtifact(dest, pdf);

    db::query::fs::File::setThumbnailPath(file.id, previewPath);

    log::Registry::convert()->debug("[GotenbergConverter] Rendered {} ({} bytes) to {}", file.id, pdf.size(), dest.string());
    return dest.string();
}

std::string GotenbergConverter::render(const fs::model::File& file, const std::filesystem::path& source) const {
    CurlEasy h;
    Mime form(h);
    form.addFile("files", source.string(), file.name);

    const auto url = endpoint();
    const auto resp = performCurl(h, [&](CURL* c) {
        curl_easy_setopt(c, CURLOPT_URL, url.c_str());
        curl_easy_setopt(c, CURLOPT_MIMEPOST, form.get());
        curl_easy_setopt(c, CURLOPT_TIMEOUT, static_cast<long>(gotenberg_.timeout.count()));
    });

    if (resp.curl != CURLE_OK) {
        log::Registry::convert()->warn("[GotenbergConverter] Request for {} failed: {}", file.id, curl_easy_strerror(resp.curl));
        throw std::runtime_error(std::string("gotenberg request failed: ") + curl_easy_strerror(resp.curl));
    }

    if (!resp.ok()) {
        log::Registry::convert()->warn("[GotenbergConverter] HTTP {} converting {}", resp.http, file.id);
        throw std::runtime_error("gotenberg conversion failed: " + resp.body.substr(0, MAX_ERROR_BODY));
    }

    return resp.body;
}

void GotenbergConverter::writeArtifact(const std::filesystem::path& dest, const std::string& pdf) const {
    std::filesystem::create_directories(dest.parent_path());

    std::ofstream out(dest, std::ios::binary | std::ios::trunc);
    if (!out) throw std::runtime_error("Unable to open preview for writing: " + dest.string());
    out.write(pdf.data(), static_cast<std::streamsize>(pdf.size()));
    if (!out) throw std::runtime_error("Failed writing preview: " + dest.string());
}
