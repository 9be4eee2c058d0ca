#include "fs_read.hpp"
#include "tool_util.hpp"
#include "../util.hpp"
#include <filesystem>

namespace toolcore {

FsRead FsRead::from_json(const nlohmann::json& args) {
    require_object(args);
    FsRead read;
    read.path = require_string(args, "path");
    read.offset = optional_unsigned(args, "offset");
    read.limit = optional_unsigned(args, "limit");
    return read;
}

std::optional<std::string> FsRead::validate(const SystemProvider& provider) const {
    if (path.empty()) return std::string("Path must not be empty");
    auto resolved = canonicalize_path(path, provider);
    if (!resolved) return resolved.error();

    std::error_code ec;
    auto status = std::filesystem::status(resolved.value(), ec);
    if (!std::filesystem::exists(status)) {
        return "Path does not exist: " + resolved.value().string();
    }
    if (!std::filesystem::is_regular_file(status)) {
        return "Path is not a file: " + resolved.value().string();
    }
    return std::nullopt;
}

ToolExecutionResult FsRead::execute(const SystemProvider& provider, uint64_t max_bytes) const {
    auto resolved = canonicalize_path(path, provider);
    if (!resolved) return ToolExecutionError::custom(resolved.error());

    auto read = read_file_with_max_limit(resolved.value().string(), max_bytes,
                                         "\n... (file truncated)");
    if (!read) return ToolExecutionError::io(read.error().context, read.error().source);

    std::string content = std::move(read.value().content);
    if (!offset && !limit) return ToolExecutionOutput::text(std::move(content));

    auto lines = lines_with_endings(content);
    uint64_t start = offset.value_or(0);
    std::string selected;
    for (uint64_t i = start; i < lines.size(); ++i) {
        if (limit && i - start >= *limit) break;
        selected += lines[i];
    }
    return ToolExecutionOutput::text(std::move(selected));
}

std::string FsRead::description() {
    return R"(A tool for reading files.

HOW TO USE:
- Provide the path to the file you want to read
- Optionally provide offset (0-indexed first line) and limit (number of lines) to read part of a file

LIMITATIONS:
- Files larger than 250KB are truncated
)";
}

const char* FsRead::input_schema() {
    return R"json({
    "type": "object",
    "properties": {
        "path": {
            "type": "string",
            "description": "Path to the file"
        },
        "offset": {
            "type": "integer",
            "description": "Line to start reading from, 0-indexed"
        },
        "limit": {
            "type": "integer",
            "description": "Maximum number of lines to read"
        }
    },
    "required": ["path"]
})json";
}

} // namespace toolcore
