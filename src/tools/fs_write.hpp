#pragma once
#include "../platform.hpp"
#include "../system_provider.hpp"
#include "../tool_result.hpp"
#include <cstdint>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>

namespace toolcore {

// Per-file line statistics across fsWrite uses within one session.
struct FileLineTracker {
    // Line count at the end of the last fsWrite
    size_t prev_fswrite_lines = 0;
    // Line count before the current fsWrite
    size_t before_fswrite_lines = 0;
    // Line count after the current fsWrite
    size_t after_fswrite_lines = 0;
    size_t lines_added_by_agent = 0;
    size_t lines_removed_by_agent = 0;
    bool is_first_write = true;

    int64_t lines_by_user() const {
        return static_cast<int64_t>(before_fswrite_lines) - static_cast<int64_t>(prev_fswrite_lines);
    }

    int64_t lines_by_agent() const {
        return static_cast<int64_t>(lines_added_by_agent + lines_removed_by_agent);
    }

    // Record a write that turned `before` into `after`.
    void record_write(const std::string& before, const std::string& after);
};

struct FileCreate {
    std::string path;
    std::string content;
};

struct StrReplace {
    std::string path;
    std::string old_str;
    std::string new_str;
    bool replace_all = false;
};

struct Insert {
    std::string path;
    std::string content;
    std::optional<uint64_t> insert_line;
};

class FsWrite {
public:
    using Command = std::variant<FileCreate, StrReplace, Insert>;

    FsWrite(Command command) : command_(std::move(command)) {}

    static FsWrite from_json(const nlohmann::json& args);

    static std::string description();
    static const char* input_schema();

    const Command& command() const { return command_; }
    const std::string& path() const;

    Result<std::filesystem::path, std::string> canonical_path(const SystemProvider& provider) const;

    std::optional<std::string> validate(const SystemProvider& provider) const;

    // `tracker` may be null when the caller does not keep write statistics.
    ToolExecutionResult execute(const SystemProvider& provider, const Platform& platform,
                                FileLineTracker* tracker) const;

private:
    Command command_;
};

} // namespace toolcore
