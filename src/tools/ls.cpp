#include "ls.hpp"
#include "tool_util.hpp"
#include "../util.hpp"
#include <algorithm>
#include <cerrno>
#include <deque>
#include <iostream>
#include <sys/stat.h>

namespace toolcore {

namespace fs = std::filesystem;

const std::vector<std::string> kLsNeverDescend = {
    "node_modules", "bin", "build", "dist", "out", ".cache", ".git",
};

namespace {

struct Entry {
    fs::path path;
    EntryMetadata metadata;
};

std::optional<std::error_code> stat_entry(const fs::path& path, EntryMetadata& out) {
    struct stat st {};
    if (::lstat(path.c_str(), &st) != 0) {
        return std::error_code(errno, std::generic_category());
    }
    out.is_dir = S_ISDIR(st.st_mode);
    out.is_file = S_ISREG(st.st_mode);
    out.is_symlink = S_ISLNK(st.st_mode);
    out.mode = static_cast<uint32_t>(st.st_mode);
    out.nlink = static_cast<uint64_t>(st.st_nlink);
    out.uid = static_cast<uint32_t>(st.st_uid);
    out.gid = static_cast<uint32_t>(st.st_gid);
    out.size = static_cast<uint64_t>(st.st_size);
    out.last_modified = static_cast<int64_t>(st.st_mtime);
    return std::nullopt;
}

} // namespace

Ls Ls::from_json(const nlohmann::json& args) {
    require_object(args);
    Ls ls;
    ls.path = require_string(args, "path");
    if (auto depth = optional_unsigned(args, "depth")) {
        ls.depth = static_cast<size_t>(*depth);
    }
    ls.ignore = optional_string_array(args, "ignore");
    return ls;
}

bool Ls::matches_ignore_patterns(const std::string& entry_path) const {
    if (!ignore) return false;
    return matches_any_pattern(*ignore, entry_path);
}

std::optional<std::string> Ls::validate(const SystemProvider& provider) const {
    auto resolved = canonicalize_path(path, provider);
    if (!resolved) return resolved.error();
    const auto& dir = resolved.value();

    std::error_code ec;
    auto status = fs::status(dir, ec);
    if (!fs::exists(status)) {
        return "Directory not found: " + dir.string();
    }
    if (!fs::is_directory(status)) {
        return "Path is not a directory: " + dir.string();
    }
    return std::nullopt;
}

ToolExecutionResult Ls::execute(const SystemProvider& provider, const Platform& platform) const {
    auto resolved = canonicalize_path(path, provider);
    if (!resolved) return ToolExecutionError::custom(resolved.error());

    const size_t depth_limit = max_depth();

    // Lines placed before the listing rows
    std::vector<std::string> prefix;
    std::vector<std::string> rows;

    if (auto header = platform.listing_header()) {
        prefix.push_back(*header);
    }

    std::deque<std::pair<fs::path, size_t>> dir_queue;
    dir_queue.emplace_back(resolved.value(), 0);
    bool truncated = false;

    while (!dir_queue.empty() && !truncated) {
        auto [dir_path, depth] = dir_queue.front();
        dir_queue.pop_front();
        if (depth > depth_limit) break;

        std::vector<Entry> entries;
        bool exceeded_threshold = false;

        std::error_code ec;
        fs::directory_iterator it(dir_path, ec);
        if (ec) {
            return ToolExecutionError::io(
                "failed to read directory path '" + dir_path.string() + "'", ec);
        }
        for (; it != fs::directory_iterator(); it.increment(ec)) {
            if (ec) break;
            const fs::path entry_path = it->path();
            if (matches_ignore_patterns(entry_path.string())) continue;

            if (entries.size() >= kMaxEntryCountPerDir) {
                exceeded_threshold = true;
                break;
            }

            Entry entry{entry_path, {}};
            if (auto stat_ec = stat_entry(entry_path, entry.metadata)) {
                if (*stat_ec == std::errc::no_such_file_or_directory) {
                    // Removed while the directory was being read.
                    continue;
                }
                return ToolExecutionError::io(
                    "failed to get metadata for " + entry_path.string(), *stat_ec);
            }
            entries.push_back(std::move(entry));
        }
        if (ec) {
            return ToolExecutionError::io(
                "failed to get next entry in '" + dir_path.string() + "'", ec);
        }

        // Most recently modified first
        std::stable_sort(entries.begin(), entries.end(), [](const Entry& a, const Entry& b) {
            return a.metadata.last_modified < b.metadata.last_modified;
        });
        std::reverse(entries.begin(), entries.end());

        for (const auto& entry : entries) {
            if (rows.size() >= kMaxLsEntries) {
                prefix.push_back("Directory at " + dir_path.string() + " was truncated (has total " +
                                 std::to_string(entries.size()) +
                                 (exceeded_threshold ? "+" : "") + " entries)");
                truncated = true;
                break;
            }

            rows.push_back(platform.format_entry(entry.metadata, entry.path.string()));

            if (entry.metadata.is_dir && depth + 1 <= depth_limit &&
                !matches_any_pattern(kLsNeverDescend, entry.path.string())) {
                dir_queue.emplace_back(entry.path, depth + 1);
            }
        }
    }

    if (truncated) {
        std::cerr << "[ls] Listing of " << resolved.value().string() << " truncated at "
                  << kMaxLsEntries << " entries\n";
    }

    std::string output;
    for (const auto& line : prefix) {
        output += line;
        output += '\n';
    }
    for (size_t i = 0; i < rows.size(); ++i) {
        if (i > 0) output += '\n';
        output += rows[i];
    }
    return ToolExecutionOutput::text(std::move(output));
}

std::string Ls::description() {
    return R"(A tool for listing directory contents.

HOW TO USE:
- Provide the path to the directory you want to view
- Optionally provide a depth to recursively list directory contents
- Optionally provide a list of glob patterns to exclude files and directories from the listing

LIMITATIONS:
- Only 1000 entries will be returned
- Directories containing over 10000 entries will be truncated
- node_modules, bin, build, dist, out, .cache and .git directories are listed but not descended into
)";
}

const char* Ls::input_schema() {
    return R"json({
    "type": "object",
    "properties": {
        "path": {
            "type": "string",
            "description": "Path to the directory"
        },
        "depth": {
            "type": "integer",
            "description": "Depth of a recursive directory listing",
            "default": 0
        },
        "ignore": {
            "type": "array",
            "description": "List of glob patterns to ignore",
            "items": {
                "type": "string",
                "description": "Glob pattern to ignore"
            }
        }
    },
    "required": ["path"]
})json";
}

} // namespace toolcore
