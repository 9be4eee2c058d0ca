#include <catch2/catch.hpp>
#include "tools/image_read.hpp"
#include "util.hpp"
#include "test_helpers.hpp"

using namespace toolcore;
namespace fs = std::filesystem;

namespace {

const UnixPlatform kUnix{};

ImageRead images(std::vector<std::string> paths) {
    return ImageRead{std::move(paths)};
}

} // namespace

TEST_CASE("ImageRead: supported extensions", "[image_read]") {
    for (const char* ok : {"a.png", "a.jpg", "a.jpeg", "a.gif", "a.webp", "A.PNG", "dir/b.JpEg"}) {
        REQUIRE(is_supported_image_type(ok));
    }
    for (const char* bad : {"a.txt", "a.bmp", "a.tiff", "png", "a.", "noext"}) {
        REQUIRE_FALSE(is_supported_image_type(bad));
    }
}

TEST_CASE("ImageRead: parses paths", "[image_read]") {
    auto read = ImageRead::from_json({{"paths", {"a.png", "b.gif"}}});
    REQUIRE(read.paths.size() == 2);
    REQUIRE_THROWS_AS(ImageRead::from_json({{"paths", "a.png"}}), std::invalid_argument);
    REQUIRE_THROWS_AS(ImageRead::from_json({{"paths", {1, 2}}}), std::invalid_argument);
}

TEST_CASE("ImageRead: valid images pass validation", "[image_read]") {
    TempDir dir;
    MockSystemProvider provider(dir.path);
    write_file(dir / "a.png", "\x89PNG");
    write_file(dir / "b.jpg", "\xFF\xD8\xFF");

    REQUIRE_FALSE(images({"a.png", "b.jpg"}).validate(provider, kUnix).has_value());
}

TEST_CASE("ImageRead: validation reports every problem", "[image_read]") {
    TempDir dir;
    MockSystemProvider provider(dir.path);
    write_file(dir / "notes.txt", "text");
    fs::create_directory(dir / "folder.png");
    write_file(dir / "big.png", "");
    fs::resize_file(dir / "big.png", kMaxImageSizeBytes + 1);
    write_file(dir / "ok.png", "x");

    auto err = images({"notes.txt", "missing.png", "folder.png", "big.png", "ok.png"})
                   .validate(provider, kUnix);
    REQUIRE(err.has_value());

    auto lines = split(*err, '\n');
    REQUIRE(lines.size() == 4);
    REQUIRE(lines[0].find("notes.txt' is not a supported image type") != std::string::npos);
    REQUIRE(lines[1].find("failed to read file metadata") != std::string::npos);
    REQUIRE(lines[2].find("folder.png' is not a file") != std::string::npos);
    REQUIRE(lines[3].find("greater than the max supported size") != std::string::npos);
}

TEST_CASE("ImageRead: size limit is inclusive", "[image_read]") {
    TempDir dir;
    MockSystemProvider provider(dir.path);
    write_file(dir / "edge.webp", "");
    fs::resize_file(dir / "edge.webp", kMaxImageSizeBytes);

    REQUIRE_FALSE(images({"edge.webp"}).validate(provider, kUnix).has_value());
}

TEST_CASE("ImageRead: broken symlink fails validation", "[image_read]") {
    TempDir dir;
    MockSystemProvider provider(dir.path);
    fs::create_symlink(dir / "gone.png", dir / "link.png");

    auto err = images({"link.png"}).validate(provider, kUnix);
    REQUIRE(err.has_value());
    REQUIRE(err->find("is not a file") != std::string::npos);
}

TEST_CASE("ImageRead: execute returns one image per path", "[image_read]") {
    TempDir dir;
    MockSystemProvider provider(dir.path);
    write_file(dir / "a.png", std::string("\x89PNG\r\n", 6));
    write_file(dir / "b.gif", "GIF89a");

    auto result = images({"a.png", "b.gif"}).execute(provider, kUnix);
    REQUIRE(result.ok());
    const auto& items = result.value().items;
    REQUIRE(items.size() == 2);

    REQUIRE(items[0].kind == ToolExecutionOutputItem::Kind::Image);
    REQUIRE(items[0].image->format == ImageFormat::Png);
    REQUIRE(items[0].image->bytes.size() == 6);
    REQUIRE(items[0].image->bytes[0] == 0x89);

    REQUIRE(items[1].image->format == ImageFormat::Gif);
    REQUIRE(std::string(items[1].image->bytes.begin(), items[1].image->bytes.end()) == "GIF89a");
}

TEST_CASE("ImageRead: any failing path fails the whole call", "[image_read]") {
    TempDir dir;
    MockSystemProvider provider(dir.path);
    write_file(dir / "a.png", "x");

    auto result = images({"a.png", "gone.png", "also-gone.jpg"}).execute(provider, kUnix);
    REQUIRE_FALSE(result.ok());
    REQUIRE(result.error().kind == ToolExecutionError::Kind::Custom);
    auto lines = split(result.error().to_string(), '\n');
    REQUIRE(lines.size() == 2);
    REQUIRE(lines[0].find("gone.png") != std::string::npos);
    REQUIRE(lines[1].find("also-gone.jpg") != std::string::npos);
}

TEST_CASE("ImageRead: description lists supported formats", "[image_read]") {
    auto description = ImageRead::description();
    REQUIRE(description.find("png, jpeg, gif, webp") != std::string::npos);
    REQUIRE(description.find("{IMAGE_FORMATS}") == std::string::npos);
}

TEST_CASE("ImageRead: macOS screenshot names use a narrow no-break space", "[image_read]") {
    MacPlatform mac;
    const std::string typed = "/Users/me/Desktop/Screenshot 2024-01-05 at 1.23.45 PM.png";
    auto fixed = mac.pre_process_image_path(typed);
    REQUIRE(fixed == "/Users/me/Desktop/Screenshot 2024-01-05 at 1.23.45\xE2\x80\xAFPM.png");

    REQUIRE(mac.pre_process_image_path("/tmp/photo 1.png") == "/tmp/photo 1.png");
    REQUIRE(kUnix.pre_process_image_path(typed) == typed);
}
