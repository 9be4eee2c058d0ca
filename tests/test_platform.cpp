#include <catch2/catch.hpp>
#include "platform.hpp"
#include "system_provider.hpp"
#include "test_helpers.hpp"

using namespace toolcore;

// ── Listing format ───────────────────────────────────────────────

TEST_CASE("format_mode: permission triplets", "[platform]") {
    REQUIRE(format_mode(0644) == "rw-r--r--");
    REQUIRE(format_mode(0755) == "rwxr-xr-x");
    REQUIRE(format_mode(0) == "---------");
    REQUIRE(format_mode(0100600) == "rw-------");
}

TEST_CASE("format_file_type: symlink wins", "[platform]") {
    EntryMetadata md;
    md.is_dir = true;
    REQUIRE(format_file_type(md) == 'd');
    md.is_symlink = true;
    REQUIRE(format_file_type(md) == 'l');

    EntryMetadata file;
    file.is_file = true;
    REQUIRE(format_file_type(file) == '-');
}

TEST_CASE("format_listing_time: UTC month day time", "[platform]") {
    // 2024-01-05 13:07:00 UTC
    REQUIRE(format_listing_time(1704460020) == "Jan 05 13:07");
    REQUIRE(format_listing_time(0) == "Jan 01 00:00");
}

TEST_CASE("UnixPlatform: long row layout", "[platform]") {
    UnixPlatform unix_platform;
    EntryMetadata md;
    md.is_file = true;
    md.mode = 0644;
    md.nlink = 1;
    md.uid = 501;
    md.gid = 20;
    md.size = 42;
    md.last_modified = 0;

    REQUIRE(unix_platform.format_entry(md, "/tmp/a.txt") ==
            "-rw-r--r-- 1 501 20 42 Jan 01 00:00 /tmp/a.txt");
    REQUIRE(unix_platform.listing_header().has_value());
    REQUIRE(unix_platform.newline() == "\n");
}

TEST_CASE("WindowsPlatform: short rows and no header", "[platform]") {
    WindowsPlatform windows;
    EntryMetadata md;
    md.is_dir = true;
    md.size = 0;
    md.last_modified = 0;

    REQUIRE(windows.format_entry(md, "C:\\dir") == "d 0 Jan 01 00:00 C:\\dir");
    REQUIRE_FALSE(windows.listing_header().has_value());
    REQUIRE(windows.newline() == "\r\n");
    REQUIRE(windows.default_shell() == "pwsh");
}

// ── Path canonicalization ────────────────────────────────────────

TEST_CASE("canonicalize_path: relative, home and variables", "[platform]") {
    MockSystemProvider provider("/work", "/home/me");
    provider.env["PROJ"] = "proj";

    REQUIRE(canonicalize_path("a/../b.txt", provider).value().string() == "/work/b.txt");
    REQUIRE(canonicalize_path("~/x", provider).value().string() == "/home/me/x");
    REQUIRE(canonicalize_path("~", provider).value().string() == "/home/me");
    REQUIRE(canonicalize_path("$PROJ/src", provider).value().string() == "/work/proj/src");
    REQUIRE(canonicalize_path("/abs/${PROJ}", provider).value().string() == "/abs/proj");
    REQUIRE(canonicalize_path("/a/./b/", provider).value().string() == "/a/b");
}

TEST_CASE("canonicalize_path: unknown variable is an error", "[platform]") {
    MockSystemProvider provider("/work");
    auto result = canonicalize_path("$MISSING/x", provider);
    REQUIRE_FALSE(result.ok());
    REQUIRE(result.error().find("MISSING") != std::string::npos);
}
