#include "util.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <fnmatch.h>
#include <ctime>
#include <fstream>
#include <random>
#include <regex>
#include <sstream>
#include <sys/stat.h>

namespace toolcore {

uint64_t epoch_seconds() {
    return static_cast<uint64_t>(std::time(nullptr));
}

std::string generate_id() {
    static std::random_device rd;
    static std::mt19937_64 gen(rd());
    std::uniform_int_distribution<uint64_t> dist;
    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(dist(gen)));
    return buf;
}

std::string trim(const std::string& s) {
    auto start = s.begin();
    while (start != s.end() && std::isspace(static_cast<unsigned char>(*start))) {
        ++start;
    }
    auto end = s.end();
    while (end != start && std::isspace(static_cast<unsigned char>(*(end - 1)))) {
        --end;
    }
    return std::string(start, end);
}

std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> result;
    std::istringstream stream(s);
    std::string token;
    while (std::getline(stream, token, delim)) {
        result.push_back(token);
    }
    return result;
}

std::string replace_all(const std::string& str, const std::string& from, const std::string& to) {
    if (from.empty()) return str;
    std::string result = str;
    size_t pos = 0;
    while ((pos = result.find(from, pos)) != std::string::npos) {
        result.replace(pos, from.size(), to);
        pos += to.size();
    }
    return result;
}

size_t count_occurrences(const std::string& haystack, const std::string& needle) {
    if (needle.empty()) return 0;
    size_t count = 0;
    size_t pos = 0;
    while ((pos = haystack.find(needle, pos)) != std::string::npos) {
        ++count;
        pos += needle.size();
    }
    return count;
}

std::string expand_home(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            return std::string(home) + path.substr(1);
        }
    }
    return path;
}

size_t count_lines(const std::string& text) {
    if (text.empty()) return 0;
    size_t lines = static_cast<size_t>(std::count(text.begin(), text.end(), '\n'));
    if (text.back() != '\n') ++lines;
    return lines;
}

std::vector<std::string> lines_with_endings(const std::string& text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start < text.size()) {
        size_t nl = text.find('\n', start);
        if (nl == std::string::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, nl - start + 1));
        start = nl + 1;
    }
    return lines;
}

// ── UTF-8 ────────────────────────────────────────────────────────

static bool is_continuation_byte(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

std::string truncate_safe(const std::string& s, size_t max_bytes) {
    if (s.size() <= max_bytes) return s;
    size_t end = max_bytes;
    while (end > 0 && is_continuation_byte(static_cast<unsigned char>(s[end]))) {
        --end;
    }
    return s.substr(0, end);
}

void truncate_safe_in_place(std::string& s, size_t max_bytes, const std::string& suffix) {
    if (s.size() <= max_bytes) return;

    if (suffix.size() > max_bytes) {
        s = truncate_safe(suffix, max_bytes);
        return;
    }

    s = truncate_safe(s, max_bytes - suffix.size()) + suffix;
}

std::string to_utf8_lossy(const std::string& bytes) {
    static const char* kReplacement = "\xEF\xBF\xBD";
    std::string out;
    out.reserve(bytes.size());

    size_t i = 0;
    const size_t n = bytes.size();
    while (i < n) {
        auto c = static_cast<unsigned char>(bytes[i]);
        if (c < 0x80) {
            out += static_cast<char>(c);
            ++i;
            continue;
        }

        size_t len = 0;
        uint32_t min_cp = 0;
        if (c >= 0xC2 && c <= 0xDF) { len = 2; min_cp = 0x80; }
        else if (c >= 0xE0 && c <= 0xEF) { len = 3; min_cp = 0x800; }
        else if (c >= 0xF0 && c <= 0xF4) { len = 4; min_cp = 0x10000; }

        if (len == 0) {
            out += kReplacement;
            ++i;
            continue;
        }

        // Consume the longest valid prefix of the sequence; a broken
        // sequence becomes one replacement character.
        uint32_t cp = c & (0xFF >> (len + 1));
        size_t j = 1;
        for (; j < len && i + j < n; ++j) {
            auto cc = static_cast<unsigned char>(bytes[i + j]);
            if (!is_continuation_byte(cc)) break;
            cp = (cp << 6) | (cc & 0x3F);
        }

        if (j == len && cp >= min_cp && cp <= 0x10FFFF && !(cp >= 0xD800 && cp <= 0xDFFF)) {
            out.append(bytes, i, len);
        } else {
            out += kReplacement;
        }
        i += j;
    }
    return out;
}

Result<BoundedRead, FileReadError> read_file_with_max_limit(const std::string& path,
                                                            uint64_t max_file_length,
                                                            const std::string& truncated_suffix) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return FileReadError{"failed to open file at '" + path + "'",
                             std::error_code(errno, std::generic_category())};
    }

    struct stat st {};
    if (::stat(path.c_str(), &st) != 0) {
        return FileReadError{"failed to query file metadata at '" + path + "'",
                             std::error_code(errno, std::generic_category())};
    }
    auto file_size = static_cast<uint64_t>(st.st_size);

    std::string raw(static_cast<size_t>(std::min<uint64_t>(file_size, max_file_length)), '\0');
    file.read(raw.data(), static_cast<std::streamsize>(raw.size()));
    if (file.bad()) {
        return FileReadError{"failed to read from file at '" + path + "'",
                             std::make_error_code(std::errc::io_error)};
    }
    raw.resize(static_cast<size_t>(file.gcount()));

    BoundedRead result;
    result.content = to_utf8_lossy(raw);

    if (file_size <= max_file_length) {
        return result;
    }

    if (truncated_suffix.size() > max_file_length) {
        result.content.clear();
        result.bytes_truncated = file_size;
        return result;
    }

    result.bytes_truncated = file_size - max_file_length + truncated_suffix.size();
    result.content =
        truncate_safe(result.content, static_cast<size_t>(max_file_length) - truncated_suffix.size()) +
        truncated_suffix;
    return result;
}

// ── Environment expansion ────────────────────────────────────────

void expand_env_vars(std::map<std::string, std::string>& env_vars, const EnvLookup& lookup) {
    static const std::regex placeholder(R"(\$\{env:([^}]+)\})");

    for (auto& [key, value] : env_vars) {
        std::string expanded;
        auto begin = std::sregex_iterator(value.begin(), value.end(), placeholder);
        auto end = std::sregex_iterator();
        size_t last = 0;
        for (auto it = begin; it != end; ++it) {
            const auto& match = *it;
            expanded.append(value, last, static_cast<size_t>(match.position(0)) - last);
            std::string var_name = match[1].str();
            auto resolved = lookup(var_name);
            expanded += resolved ? *resolved : "${" + var_name + "}";
            last = static_cast<size_t>(match.position(0) + match.length(0));
        }
        expanded.append(value, last, std::string::npos);
        value = std::move(expanded);
    }
}

// ── Misc ─────────────────────────────────────────────────────────

bool glob_match(const std::string& pattern, const std::string& text) {
    return ::fnmatch(pattern.c_str(), text.c_str(), 0) == 0;
}

bool matches_any_pattern(const std::vector<std::string>& patterns, const std::string& path) {
    std::string name = path;
    auto slash = path.find_last_of('/');
    if (slash != std::string::npos) name = path.substr(slash + 1);

    for (const auto& pattern : patterns) {
        if (glob_match(pattern, path) || glob_match(pattern, name)) return true;
    }
    return false;
}

std::string base64_encode(const unsigned char* data, size_t len) {
    static const char* alphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    std::string out;
    out.reserve(((len + 2) / 3) * 4);

    size_t i = 0;
    while (i + 3 <= len) {
        uint32_t n = (static_cast<uint32_t>(data[i]) << 16) |
                     (static_cast<uint32_t>(data[i + 1]) << 8) |
                     static_cast<uint32_t>(data[i + 2]);
        out.push_back(alphabet[(n >> 18) & 63]);
        out.push_back(alphabet[(n >> 12) & 63]);
        out.push_back(alphabet[(n >> 6) & 63]);
        out.push_back(alphabet[n & 63]);
        i += 3;
    }

    if (i < len) {
        uint32_t n = static_cast<uint32_t>(data[i]) << 16;
        if (i + 1 < len) n |= static_cast<uint32_t>(data[i + 1]) << 8;
        out.push_back(alphabet[(n >> 18) & 63]);
        out.push_back(alphabet[(n >> 12) & 63]);
        out.push_back(i + 1 < len ? alphabet[(n >> 6) & 63] : '=');
        out.push_back('=');
    }
    return out;
}

} // namespace toolcore
