#include <gtest/gtest.h>
#include "preview/GotenbergConverter.hpp"

#include <filesystem>
#include <unistd.h>

using namespace ds::preview;
using namespace ds::config;
namespace fs = std::filesystem;

class GotenbergConverterTest : public ::testing::Test {
protected:
    fs::path root;

    void SetUp() override {
        root = fs::temp_directory_path() / ("docshare_convert_" + std::to_string(::getpid()));
        fs::create_directories(root);
    }

    void TearDown() override { fs::remove_all(root); }

    GotenbergConverter makeConverter(const std::string& url = "http://gotenberg:3000/") const {
        GotenbergConfig g;
        g.url = url;
        StorageConfig s;
        s.root = root / "storage";
        s.preview_root = root / "previews";
        return {g, s};
    }

    static ds::fs::model::File file(const std::string& name, const bool dir = false) {
        ds::fs::model::File f;
        f.id = "file-1";
        f.owner_id = "owner-1";
        f.name = name;
        f.is_directory = dir;
        f.storage_path = "owner-1/" + name;
        return f;
    }
};

TEST_F(GotenbergConverterTest, EndpointDropsTrailingSlash) {
    EXPECT_EQ(makeConverter().endpoint(), "http://gotenberg:3000/forms/libreoffice/convert");
    EXPECT_EQ(makeConverter("http://gotenberg:3000").endpoint(), "http://gotenberg:3000/forms/libreoffice/convert");
}

TEST_F(GotenbergConverterTest, EmptyUrlRejected) {
    EXPECT_THROW(makeConverter(""), std::invalid_argument);
}

TEST_F(GotenbergConverterTest, DirectoryCannotBePreviewed) {
    auto conv = makeConverter();
    try {
        conv.convert(file("reports", true));
        FAIL() << "expected directory conversion to throw";
    } catch (const std::runtime_error& e) {
        EXPECT_STREQ(e.what(), "cannot preview a directory");
    }
}

TEST_F(GotenbergConverterTest, NonOfficeFileIsItsOwnPreview) {
    auto conv = makeConverter();
    EXPECT_EQ(conv.convert(file("scan.pdf")), "owner-1/scan.pdf");
    EXPECT_EQ(conv.convert(file("photo.PNG")), "owner-1/photo.PNG");
}

TEST_F(GotenbergConverterTest, MissingSourceFails) {
    auto conv = makeConverter();
    EXPECT_THROW(conv.convert(file("Budget.XLSX")), std::runtime_error);
    EXPECT_FALSE(fs::exists(root / "previews"));
}

TEST_F(GotenbergConverterTest, PreviewPathIsScopedToOwner) {
    EXPECT_EQ(GotenbergConverter::previewPathFor(file("a.docx"), "abc"), "owner-1/previews/abc.pdf");
}

TEST(FileModelTest, OfficeExtensionsAreCaseInsensitive) {
    ds::fs::model::File f;
    for (const auto* name : {"a.docx", "b.XLSX", "c.pptx", "d.odt", "e.ods", "f.Odp"}) {
        f.name = name;
        EXPECT_TRUE(f.isOfficeDocument()) << name;
    }
    for (const auto* name : {"a.doc", "b.pdf", "noext", "archive.docx.zip"}) {
        f.name = name;
        EXPECT_FALSE(f.isOfficeDocument()) << name;
    }
}
