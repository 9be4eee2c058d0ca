#pragma once
#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <string>

namespace toolcore {

struct ShellConfig {
    std::string path; // empty = platform default
    std::map<std::string, std::string> env;
    uint64_t max_output_bytes = 100000;
};

struct FsReadConfig {
    uint64_t max_bytes = 250000;
};

struct SessionConfig {
    uint64_t max_idle_seconds = 3600;
};

struct Config {
    ShellConfig shell;
    FsReadConfig fs_read;
    SessionConfig session;

    // Load from ~/.toolcore/config.json
    static Config load();

    // Load from an explicit file. A missing or malformed file yields the
    // defaults.
    static Config load_from(const std::string& path);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Build a Config from JSON already merged with the defaults. Keys with
    // the wrong type keep their default value.
    static Config from_json(const nlohmann::json& j);
};

// Recursively add keys from `defaults` that `existing` lacks.
nlohmann::json merge_defaults(const nlohmann::json& existing, const nlohmann::json& defaults);

} // namespace toolcore
