#include <catch2/catch.hpp>
#include "tools/fs_read.hpp"
#include "test_helpers.hpp"

using namespace toolcore;
namespace fs = std::filesystem;

namespace {

std::string read_text(const FsRead& read, const MockSystemProvider& provider,
                      uint64_t max_bytes = kDefaultFsReadMaxBytes) {
    auto result = read.execute(provider, max_bytes);
    REQUIRE(result.ok());
    return result.value().items[0].text;
}

} // namespace

TEST_CASE("FsRead: parses arguments", "[fs_read]") {
    auto read = FsRead::from_json({{"path", "a.txt"}, {"offset", 2}, {"limit", 5}});
    REQUIRE(read.path == "a.txt");
    REQUIRE(read.offset == 2u);
    REQUIRE(read.limit == 5u);

    auto plain = FsRead::from_json({{"path", "a.txt"}});
    REQUIRE_FALSE(plain.offset.has_value());
    REQUIRE_FALSE(plain.limit.has_value());

    REQUIRE_THROWS_AS(FsRead::from_json({{"file", "a.txt"}}), std::invalid_argument);
    REQUIRE_THROWS_AS(FsRead::from_json({{"path", "a"}, {"offset", -1}}), std::invalid_argument);
}

TEST_CASE("FsRead: validation", "[fs_read]") {
    TempDir dir;
    MockSystemProvider provider(dir.path);
    write_file(dir / "a.txt", "x");
    fs::create_directory(dir / "sub");

    REQUIRE_FALSE(FsRead{"a.txt", std::nullopt, std::nullopt}.validate(provider).has_value());

    auto empty = FsRead{"", std::nullopt, std::nullopt}.validate(provider);
    REQUIRE(empty.has_value());
    REQUIRE(*empty == "Path must not be empty");

    auto missing = FsRead{"nope.txt", std::nullopt, std::nullopt}.validate(provider);
    REQUIRE(missing.has_value());
    REQUIRE(missing->find("Path does not exist") != std::string::npos);

    auto directory = FsRead{"sub", std::nullopt, std::nullopt}.validate(provider);
    REQUIRE(directory.has_value());
    REQUIRE(directory->find("Path is not a file") != std::string::npos);
}

TEST_CASE("FsRead: home directory expansion", "[fs_read]") {
    TempDir dir;
    MockSystemProvider provider("/", dir.path);
    write_file(dir / "notes.md", "home notes");

    REQUIRE(read_text(FsRead{"~/notes.md", std::nullopt, std::nullopt}, provider) == "home notes");
}

TEST_CASE("FsRead: whole file by default", "[fs_read]") {
    TempDir dir;
    MockSystemProvider provider(dir.path);
    write_file(dir / "a.txt", "one\ntwo\nthree\n");

    REQUIRE(read_text(FsRead{"a.txt", std::nullopt, std::nullopt}, provider) ==
            "one\ntwo\nthree\n");
}

TEST_CASE("FsRead: offset and limit select lines", "[fs_read]") {
    TempDir dir;
    MockSystemProvider provider(dir.path);
    write_file(dir / "a.txt", "one\ntwo\nthree\nfour");

    REQUIRE(read_text(FsRead{"a.txt", 1, 2}, provider) == "two\nthree\n");
    REQUIRE(read_text(FsRead{"a.txt", 2, std::nullopt}, provider) == "three\nfour");
    REQUIRE(read_text(FsRead{"a.txt", std::nullopt, 1}, provider) == "one\n");
    REQUIRE(read_text(FsRead{"a.txt", 10, std::nullopt}, provider).empty());
}

TEST_CASE("FsRead: large files are truncated", "[fs_read]") {
    TempDir dir;
    MockSystemProvider provider(dir.path);
    write_file(dir / "big.txt", std::string(500, 'a'));

    auto text = read_text(FsRead{"big.txt", std::nullopt, std::nullopt}, provider, 100);
    REQUIRE(text.size() == 100);
    const std::string suffix = "\n... (file truncated)";
    REQUIRE(text.substr(text.size() - suffix.size()) == suffix);
}

TEST_CASE("FsRead: invalid utf-8 is replaced", "[fs_read]") {
    TempDir dir;
    MockSystemProvider provider(dir.path);
    write_file(dir / "bin.txt", "ok\xFF");

    REQUIRE(read_text(FsRead{"bin.txt", std::nullopt, std::nullopt}, provider) ==
            "ok\xEF\xBF\xBD");
}

TEST_CASE("FsRead: missing file fails at execution", "[fs_read]") {
    TempDir dir;
    MockSystemProvider provider(dir.path);

    auto result = FsRead{"gone.txt", std::nullopt, std::nullopt}.execute(provider, 100);
    REQUIRE_FALSE(result.ok());
    REQUIRE(result.error().kind == ToolExecutionError::Kind::Io);
    REQUIRE(result.error().message.find("gone.txt") != std::string::npos);
    REQUIRE(result.error().source.has_value());
    REQUIRE(*result.error().source == std::errc::no_such_file_or_directory);
}
