#include "fs_write.hpp"
#include "tool_util.hpp"
#include "../util.hpp"
#include <algorithm>
#include <cerrno>
#include <fstream>
#include <sstream>

namespace toolcore {

namespace fs = std::filesystem;

namespace {

std::error_code last_io_error() {
    int err = errno;
    if (err == 0) return std::make_error_code(std::errc::io_error);
    return std::error_code(err, std::generic_category());
}

std::optional<std::error_code> read_text(const fs::path& path, std::string& out) {
    errno = 0;
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) return last_io_error();
    std::ostringstream ss;
    ss << file.rdbuf();
    if (file.bad()) return last_io_error();
    out = ss.str();
    return std::nullopt;
}

std::optional<std::error_code> write_text(const fs::path& path, const std::string& content) {
    errno = 0;
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) return last_io_error();
    file << content;
    file.close();
    if (file.fail()) return last_io_error();
    return std::nullopt;
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    for (auto& line : lines_with_endings(text)) {
        if (!line.empty() && line.back() == '\n') line.pop_back();
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(std::move(line));
    }
    return lines;
}

std::string apply_insert(const Insert& ins, std::string file, const std::string& newline) {
    if (!ins.insert_line) {
        if (!file.empty() && !ends_with(file, newline)) file += newline;
        file += ins.content;
        return file;
    }

    uint64_t line_count = count_lines(file);
    uint64_t insert_line = std::min<uint64_t>(*ins.insert_line, line_count);

    size_t offset = 0;
    auto lines = lines_with_endings(file);
    for (uint64_t i = 0; i < insert_line; ++i) {
        offset += lines[static_cast<size_t>(i)].size();
    }

    // Inserting after an unterminated last line: terminate it first.
    if (offset == file.size() && !file.empty() && !ends_with(file, newline)) {
        file += newline;
        offset = file.size();
    }

    std::string content = ins.content;
    if (!ends_with(content, newline)) content += newline;
    file.insert(offset, content);
    return file;
}

} // namespace

void FileLineTracker::record_write(const std::string& before, const std::string& after) {
    size_t before_lines = count_lines(before);
    prev_fswrite_lines = is_first_write ? before_lines : after_fswrite_lines;
    before_fswrite_lines = before_lines;
    after_fswrite_lines = count_lines(after);

    auto a = split_lines(before);
    auto b = split_lines(after);
    size_t prefix = 0;
    while (prefix < a.size() && prefix < b.size() && a[prefix] == b[prefix]) ++prefix;
    size_t suffix = 0;
    while (suffix < a.size() - prefix && suffix < b.size() - prefix &&
           a[a.size() - 1 - suffix] == b[b.size() - 1 - suffix]) {
        ++suffix;
    }
    lines_removed_by_agent = a.size() - prefix - suffix;
    lines_added_by_agent = b.size() - prefix - suffix;
    is_first_write = false;
}

FsWrite FsWrite::from_json(const nlohmann::json& args) {
    require_object(args);
    std::string command = require_string(args, "command");
    std::string path = require_string(args, "path");

    if (command == "create") {
        return FsWrite(FileCreate{path, require_string(args, "content")});
    }
    if (command == "strReplace") {
        return FsWrite(StrReplace{path,
                                  require_string(args, "oldStr"),
                                  require_string(args, "newStr"),
                                  optional_bool(args, "replaceAll", false)});
    }
    if (command == "insert") {
        return FsWrite(Insert{path, require_string(args, "content"),
                              optional_unsigned(args, "insertLine")});
    }
    throw std::invalid_argument("unknown variant `" + command +
                                "`, expected one of `create`, `strReplace`, `insert`");
}

const std::string& FsWrite::path() const {
    return std::visit([](const auto& cmd) -> const std::string& { return cmd.path; }, command_);
}

Result<fs::path, std::string> FsWrite::canonical_path(const SystemProvider& provider) const {
    return canonicalize_path(path(), provider);
}

std::optional<std::string> FsWrite::validate(const SystemProvider& provider) const {
    std::vector<std::string> errors;

    if (path().empty()) {
        errors.push_back("Path must not be empty");
    }

    if (std::holds_alternative<StrReplace>(command_) && !path().empty()) {
        auto resolved = canonical_path(provider);
        if (!resolved) return resolved.error();
        std::error_code ec;
        if (!fs::exists(resolved.value(), ec)) {
            errors.push_back(
                "The provided path must exist in order to replace or insert contents into it");
        }
    } else if (const auto* ins = std::get_if<Insert>(&command_)) {
        if (ins->content.empty()) {
            errors.push_back("Content to insert must not be empty");
        }
    }

    return join_errors(errors);
}

ToolExecutionResult FsWrite::execute(const SystemProvider& provider, const Platform& platform,
                                     FileLineTracker* tracker) const {
    auto resolved = canonical_path(provider);
    if (!resolved) return ToolExecutionError::custom(resolved.error());
    const fs::path& file_path = resolved.value();

    bool is_create = std::holds_alternative<FileCreate>(command_);
    std::error_code exists_ec;
    bool existed = fs::exists(file_path, exists_ec);

    std::string before;
    if (!is_create || existed) {
        if (auto ec = read_text(file_path, before)) {
            return ToolExecutionError::io("failed to read " + file_path.string(), *ec);
        }
    }

    std::string after;
    if (const auto* create = std::get_if<FileCreate>(&command_)) {
        auto parent = file_path.parent_path();
        std::error_code ec;
        if (!parent.empty() && !fs::exists(parent, ec)) {
            fs::create_directories(parent, ec);
            if (ec) {
                return ToolExecutionError::io("failed to create directory " + parent.string(), ec);
            }
        }
        after = create->content;
    } else if (const auto* rep = std::get_if<StrReplace>(&command_)) {
        size_t matches = count_occurrences(before, rep->old_str);
        if (matches == 0) {
            return ToolExecutionError::custom("no occurrences of \"" + rep->old_str +
                                              "\" were found");
        }
        if (matches == 1) {
            after = before;
            after.replace(after.find(rep->old_str), rep->old_str.size(), rep->new_str);
        } else {
            if (!rep->replace_all) {
                return ToolExecutionError::custom(std::to_string(matches) +
                                                  " occurrences of old_str were found when only 1 is expected");
            }
            after = replace_all(before, rep->old_str, rep->new_str);
        }
    } else {
        after = apply_insert(std::get<Insert>(command_), before, platform.newline());
    }

    if (auto ec = write_text(file_path, after)) {
        return ToolExecutionError::io("failed to write to " + file_path.string(), *ec);
    }

    if (tracker) tracker->record_write(before, after);
    return ToolExecutionOutput();
}

std::string FsWrite::description() {
    return R"(A tool for creating and editing text files.

WHEN TO USE THIS TOOL:
- Use when you need to create a new file, or modify an existing file
- Perfect for updating text-based file formats

HOW TO USE:
- Provide the path to the file you want to create or modify
- Specify the operation to perform: one of `create`, `strReplace`, or `insert`
- Use `create` to create a new file. Required parameter is `content`. Parent directories are created if they are missing.
- Use `strReplace` to replace text in an existing file. `oldStr` must match exactly once unless `replaceAll` is set.
- Use `insert` to insert content at a specific line, or append content to the end of a file.

TIPS:
- To append content to the end of a file, use `insert` with no `insertLine`
)";
}

const char* FsWrite::input_schema() {
    return R"json({
    "type": "object",
    "properties": {
        "command": {
            "type": "string",
            "enum": ["create", "strReplace", "insert"],
            "description": "The command to run. Allowed options are: `create`, `strReplace`, `insert`"
        },
        "path": {
            "type": "string",
            "description": "Path to the file"
        },
        "content": {
            "type": "string",
            "description": "Required parameter of `create` and `insert` commands."
        },
        "oldStr": {
            "type": "string",
            "description": "Required parameter of `strReplace` containing the exact text in `path` to replace."
        },
        "newStr": {
            "type": "string",
            "description": "Required parameter of `strReplace` containing the replacement text."
        },
        "replaceAll": {
            "type": "boolean",
            "description": "Optional parameter of `strReplace`. Default is false. When true, every occurrence of `oldStr` is replaced."
        },
        "insertLine": {
            "type": "integer",
            "description": "Optional parameter of `insert`. 0-indexed line after which `content` is inserted. When omitted, `content` is appended on a new line at the end of the file."
        }
    },
    "required": ["command", "path"]
})json";
}

} // namespace toolcore
