#include <catch2/catch.hpp>
#include "tools/fs_write.hpp"
#include "test_helpers.hpp"

using namespace toolcore;

namespace {

const UnixPlatform kUnix{};

ToolExecutionResult run(const FsWrite& write, const MockSystemProvider& provider,
                        FileLineTracker* tracker = nullptr) {
    return write.execute(provider, kUnix, tracker);
}

} // namespace

// ═══ Parsing ═════════════════════════════════════════════════════

TEST_CASE("FsWrite: parses each command", "[fs_write]") {
    auto create = FsWrite::from_json({{"command", "create"}, {"path", "a.txt"}, {"content", "hi"}});
    REQUIRE(std::holds_alternative<FileCreate>(create.command()));
    REQUIRE(create.path() == "a.txt");

    auto rep = FsWrite::from_json({{"command", "strReplace"}, {"path", "a.txt"},
                                   {"oldStr", "x"}, {"newStr", "y"}, {"replaceAll", true}});
    REQUIRE(std::get<StrReplace>(rep.command()).replace_all);

    auto ins = FsWrite::from_json({{"command", "insert"}, {"path", "a.txt"},
                                   {"content", "z"}, {"insertLine", 3}});
    REQUIRE(std::get<Insert>(ins.command()).insert_line == 3u);

    auto append = FsWrite::from_json({{"command", "insert"}, {"path", "a.txt"}, {"content", "z"}});
    REQUIRE_FALSE(std::get<Insert>(append.command()).insert_line.has_value());
}

TEST_CASE("FsWrite: shape errors throw", "[fs_write]") {
    REQUIRE_THROWS_AS(FsWrite::from_json({{"command", "delete"}, {"path", "a"}}),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(FsWrite::from_json({{"command", "create"}, {"path", "a"}}),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(FsWrite::from_json({{"command", "strReplace"}, {"path", "a"}, {"oldStr", "x"}}),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(FsWrite::from_json(nlohmann::json::array()), std::invalid_argument);
}

// ═══ Validation ══════════════════════════════════════════════════

TEST_CASE("FsWrite: validation rules", "[fs_write]") {
    TempDir dir;
    MockSystemProvider provider(dir.path);
    write_file(dir / "exists.txt", "x");

    REQUIRE_FALSE(FsWrite(FileCreate{"new.txt", ""}).validate(provider).has_value());

    auto empty_path = FsWrite(FileCreate{"", "x"}).validate(provider);
    REQUIRE(empty_path.has_value());

    auto missing = FsWrite(StrReplace{"missing.txt", "a", "b", false}).validate(provider);
    REQUIRE(missing.has_value());
    REQUIRE(missing->find("must exist") != std::string::npos);

    REQUIRE_FALSE(FsWrite(StrReplace{"exists.txt", "a", "b", false}).validate(provider).has_value());

    auto empty_insert = FsWrite(Insert{"exists.txt", "", std::nullopt}).validate(provider);
    REQUIRE(empty_insert.has_value());
    REQUIRE(empty_insert->find("must not be empty") != std::string::npos);
}

// ═══ Create ══════════════════════════════════════════════════════

TEST_CASE("FsWrite: create makes missing parent directories", "[fs_write]") {
    TempDir dir;
    REQUIRE_FALSE(dir.path.empty());
    MockSystemProvider provider(dir.path);

    auto result = run(FsWrite(FileCreate{"a/b/file.txt", "hi"}), provider);
    REQUIRE(result.ok());
    REQUIRE(std::filesystem::is_directory(dir / "a/b"));
    REQUIRE(read_file(dir / "a/b/file.txt") == "hi");

    // Default output is one empty text item
    REQUIRE(result.value().items.size() == 1);
    REQUIRE(result.value().items[0].text.empty());
}

TEST_CASE("FsWrite: create overwrites existing content", "[fs_write]") {
    TempDir dir;
    MockSystemProvider provider(dir.path);
    write_file(dir / "f.txt", "old content that is longer");

    REQUIRE(run(FsWrite(FileCreate{"f.txt", "new"}), provider).ok());
    REQUIRE(read_file(dir / "f.txt") == "new");
}

// ═══ StrReplace ══════════════════════════════════════════════════

TEST_CASE("FsWrite: single occurrence replaced, rest untouched", "[fs_write]") {
    TempDir dir;
    MockSystemProvider provider(dir.path);
    write_file(dir / "f.txt", "alpha\nbeta\ngamma\n");

    REQUIRE(run(FsWrite(StrReplace{"f.txt", "beta", "BETA", false}), provider).ok());
    REQUIRE(read_file(dir / "f.txt") == "alpha\nBETA\ngamma\n");
}

TEST_CASE("FsWrite: no occurrences is an error", "[fs_write]") {
    TempDir dir;
    MockSystemProvider provider(dir.path);
    write_file(dir / "f.txt", "alpha");

    auto result = run(FsWrite(StrReplace{"f.txt", "zeta", "x", false}), provider);
    REQUIRE_FALSE(result.ok());
    REQUIRE(result.error().to_string() == "no occurrences of \"zeta\" were found");
    REQUIRE(read_file(dir / "f.txt") == "alpha");
}

TEST_CASE("FsWrite: multiple occurrences need replaceAll", "[fs_write]") {
    TempDir dir;
    MockSystemProvider provider(dir.path);
    write_file(dir / "f.txt", "x1 x2 x3");

    auto result = run(FsWrite(StrReplace{"f.txt", "x", "y", false}), provider);
    REQUIRE_FALSE(result.ok());
    REQUIRE(result.error().to_string().find("3 occurrences") != std::string::npos);
    REQUIRE(read_file(dir / "f.txt") == "x1 x2 x3");

    REQUIRE(run(FsWrite(StrReplace{"f.txt", "x", "y", true}), provider).ok());
    REQUIRE(read_file(dir / "f.txt") == "y1 y2 y3");
}

// ═══ Insert ══════════════════════════════════════════════════════

TEST_CASE("FsWrite: insert after L complete lines", "[fs_write]") {
    TempDir dir;
    MockSystemProvider provider(dir.path);

    write_file(dir / "f.txt", "one\ntwo\nthree\n");
    REQUIRE(run(FsWrite(Insert{"f.txt", "new", 1}), provider).ok());
    REQUIRE(read_file(dir / "f.txt") == "one\nnew\ntwo\nthree\n");

    write_file(dir / "f.txt", "one\ntwo\nthree\n");
    REQUIRE(run(FsWrite(Insert{"f.txt", "new\n", 0}), provider).ok());
    REQUIRE(read_file(dir / "f.txt") == "new\none\ntwo\nthree\n");
}

TEST_CASE("FsWrite: insert line past the end clamps", "[fs_write]") {
    TempDir dir;
    MockSystemProvider provider(dir.path);
    write_file(dir / "f.txt", "one\ntwo\n");

    REQUIRE(run(FsWrite(Insert{"f.txt", "end", 99}), provider).ok());
    REQUIRE(read_file(dir / "f.txt") == "one\ntwo\nend\n");
}

TEST_CASE("FsWrite: insert after an unterminated last line", "[fs_write]") {
    TempDir dir;
    MockSystemProvider provider(dir.path);

    write_file(dir / "f.txt", "one\ntwo");
    REQUIRE(run(FsWrite(Insert{"f.txt", "three", 2}), provider).ok());
    REQUIRE(read_file(dir / "f.txt") == "one\ntwo\nthree\n");

    write_file(dir / "f.txt", "one\ntwo");
    REQUIRE(run(FsWrite(Insert{"f.txt", "mid", 1}), provider).ok());
    REQUIRE(read_file(dir / "f.txt") == "one\nmid\ntwo");
}

TEST_CASE("FsWrite: append ensures a trailing newline first", "[fs_write]") {
    TempDir dir;
    MockSystemProvider provider(dir.path);

    write_file(dir / "f.txt", "one\ntwo");
    REQUIRE(run(FsWrite(Insert{"f.txt", "three", std::nullopt}), provider).ok());
    REQUIRE(read_file(dir / "f.txt") == "one\ntwo\nthree");

    write_file(dir / "f.txt", "one\n");
    REQUIRE(run(FsWrite(Insert{"f.txt", "two", std::nullopt}), provider).ok());
    REQUIRE(read_file(dir / "f.txt") == "one\ntwo");
}

TEST_CASE("FsWrite: append to an empty file adds no newline", "[fs_write]") {
    TempDir dir;
    MockSystemProvider provider(dir.path);
    write_file(dir / "f.txt", "");

    REQUIRE(run(FsWrite(Insert{"f.txt", "first", std::nullopt}), provider).ok());
    REQUIRE(read_file(dir / "f.txt") == "first");
}

TEST_CASE("FsWrite: insert into a missing file is an io error", "[fs_write]") {
    TempDir dir;
    MockSystemProvider provider(dir.path);

    auto result = run(FsWrite(Insert{"missing.txt", "x", std::nullopt}), provider);
    REQUIRE_FALSE(result.ok());
    REQUIRE(result.error().kind == ToolExecutionError::Kind::Io);
    REQUIRE(result.error().to_string().find("failed to read") != std::string::npos);
}

// ═══ FileLineTracker ═════════════════════════════════════════════

TEST_CASE("FileLineTracker: first write attributes nothing to the user", "[fs_write]") {
    TempDir dir;
    MockSystemProvider provider(dir.path);
    write_file(dir / "f.txt", "a\nb\nc\n");

    FileLineTracker tracker;
    REQUIRE(tracker.is_first_write);
    REQUIRE(run(FsWrite(StrReplace{"f.txt", "b", "B", false}), provider, &tracker).ok());

    REQUIRE_FALSE(tracker.is_first_write);
    REQUIRE(tracker.before_fswrite_lines == 3);
    REQUIRE(tracker.after_fswrite_lines == 3);
    REQUIRE(tracker.lines_by_user() == 0);
    REQUIRE(tracker.lines_added_by_agent == 1);
    REQUIRE(tracker.lines_removed_by_agent == 1);
    REQUIRE(tracker.lines_by_agent() == 2);
}

TEST_CASE("FileLineTracker: user edits between writes", "[fs_write]") {
    TempDir dir;
    MockSystemProvider provider(dir.path);
    write_file(dir / "f.txt", "a\nb\n");

    FileLineTracker tracker;
    REQUIRE(run(FsWrite(Insert{"f.txt", "c", std::nullopt}), provider, &tracker).ok());
    REQUIRE(tracker.after_fswrite_lines == 3);
    REQUIRE(tracker.lines_added_by_agent == 1);
    REQUIRE(tracker.lines_removed_by_agent == 0);

    // Someone else adds two lines
    write_file(dir / "f.txt", "a\nb\nc\nd\ne\n");

    REQUIRE(run(FsWrite(StrReplace{"f.txt", "a\n", "", false}), provider, &tracker).ok());
    REQUIRE(tracker.prev_fswrite_lines == 3);
    REQUIRE(tracker.before_fswrite_lines == 5);
    REQUIRE(tracker.after_fswrite_lines == 4);
    REQUIRE(tracker.lines_by_user() == 2);
    REQUIRE(tracker.lines_added_by_agent == 0);
    REQUIRE(tracker.lines_removed_by_agent == 1);
}

TEST_CASE("FileLineTracker: failed write leaves tracker untouched", "[fs_write]") {
    TempDir dir;
    MockSystemProvider provider(dir.path);
    write_file(dir / "f.txt", "a\n");

    FileLineTracker tracker;
    REQUIRE_FALSE(run(FsWrite(StrReplace{"f.txt", "zzz", "y", false}), provider, &tracker).ok());
    REQUIRE(tracker.is_first_write);
    REQUIRE(tracker.after_fswrite_lines == 0);
}
