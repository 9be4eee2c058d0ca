#pragma once
#include <string>
#include <vector>
#include <map>
#include <cstdint>
#include <optional>
#include <functional>
#include <system_error>
#include "result.hpp"

namespace toolcore {

uint64_t epoch_seconds();

// 16 hex chars
std::string generate_id();

// Trim whitespace
std::string trim(const std::string& s);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delim);

// Simple string replace (all occurrences)
std::string replace_all(const std::string& str, const std::string& from, const std::string& to);

// Number of non-overlapping occurrences of `needle` in `haystack`
size_t count_occurrences(const std::string& haystack, const std::string& needle);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Line count with the usual "lines()" semantics: a trailing terminator does
// not start a new line, and "" has zero lines.
size_t count_lines(const std::string& text);

// Split into lines, each keeping its terminator.
std::vector<std::string> lines_with_endings(const std::string& text);

// ── UTF-8 safe truncation ────────────────────────────────────────

// Longest prefix of `s` that is at most `max_bytes` long and does not end
// inside a multi-byte character.
std::string truncate_safe(const std::string& s, size_t max_bytes);

// Truncates `s` to at most `max_bytes`, ending it with `suffix` when it was
// cut. If `suffix` alone is larger than `max_bytes`, `s` becomes a truncated
// suffix.
void truncate_safe_in_place(std::string& s, size_t max_bytes, const std::string& suffix);

// Replace invalid UTF-8 sequences with U+FFFD.
std::string to_utf8_lossy(const std::string& bytes);

struct BoundedRead {
    std::string content;
    uint64_t bytes_truncated = 0;
};

struct FileReadError {
    std::string context;
    std::error_code source;
};

// Reads at most `max_file_length` bytes of a file. When the file is longer,
// the content ends with `truncated_suffix` and never exceeds
// `max_file_length` bytes; `bytes_truncated` counts the bytes dropped
// including the room taken by the suffix.
Result<BoundedRead, FileReadError> read_file_with_max_limit(const std::string& path,
                                                          uint64_t max_file_length,
                                                          const std::string& truncated_suffix);

// ── Environment expansion ────────────────────────────────────────

using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

// Replace every ${env:NAME} inside the values of `env_vars`. Unknown
// variables are left as ${NAME}.
void expand_env_vars(std::map<std::string, std::string>& env_vars, const EnvLookup& lookup);

// ── Misc ─────────────────────────────────────────────────────────

// Shell-style glob match where '*' also crosses '/'.
bool glob_match(const std::string& pattern, const std::string& text);

// True when any pattern matches the full path or its final component.
bool matches_any_pattern(const std::vector<std::string>& patterns, const std::string& path);

std::string base64_encode(const unsigned char* data, size_t len);

} // namespace toolcore
