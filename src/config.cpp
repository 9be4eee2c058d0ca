#include "config.hpp"
#include "util.hpp"

#include <fstream>
#include <iostream>

namespace toolcore {

namespace {

// Non-negative integer at `key`, if present with that type.
bool read_unsigned(const nlohmann::json& obj, const char* key, uint64_t& out) {
    if (!obj.contains(key)) return false;
    const auto& v = obj[key];
    if (v.is_number_unsigned()) {
        out = v.get<uint64_t>();
        return true;
    }
    if (v.is_number_integer() && v.get<int64_t>() >= 0) {
        out = static_cast<uint64_t>(v.get<int64_t>());
        return true;
    }
    return false;
}

} // namespace

nlohmann::json Config::defaults_json() {
    return {
        {"shell", {
            {"path", ""},
            {"env", nlohmann::json::object()},
            {"max_output_bytes", 100000}
        }},
        {"fs_read", {
            {"max_bytes", 250000}
        }},
        {"session", {
            {"max_idle_seconds", 3600}
        }}
    };
}

nlohmann::json merge_defaults(const nlohmann::json& existing, const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;

    if (j.contains("shell") && j["shell"].is_object()) {
        auto& s = j["shell"];
        if (s.contains("path") && s["path"].is_string())
            cfg.shell.path = s["path"].get<std::string>();
        if (s.contains("env") && s["env"].is_object()) {
            for (auto& [name, value] : s["env"].items()) {
                if (value.is_string()) {
                    cfg.shell.env[name] = value.get<std::string>();
                } else {
                    std::cerr << "[config] Ignoring non-string shell.env value for " << name
                              << "\n";
                }
            }
        }
        read_unsigned(s, "max_output_bytes", cfg.shell.max_output_bytes);
    }

    if (j.contains("fs_read") && j["fs_read"].is_object()) {
        auto& f = j["fs_read"];
        read_unsigned(f, "max_bytes", cfg.fs_read.max_bytes);
    }

    if (j.contains("session") && j["session"].is_object()) {
        auto& s = j["session"];
        read_unsigned(s, "max_idle_seconds", cfg.session.max_idle_seconds);
    }

    return cfg;
}

Config Config::load_from(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return from_json(defaults_json());
    }

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        std::cerr << "[config] Malformed config " << path << ", using defaults: " << e.what()
                  << "\n";
        return from_json(defaults_json());
    }
    if (!j.is_object()) {
        std::cerr << "[config] Config " << path << " is not an object, using defaults\n";
        return from_json(defaults_json());
    }
    return from_json(merge_defaults(j, defaults_json()));
}

Config Config::load() {
    return load_from(expand_home("~/.toolcore/config.json"));
}

} // namespace toolcore
