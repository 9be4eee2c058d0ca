#pragma once
#include "../tool_result.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

// Field accessors used by the built-in tools' from_json. Shape mismatches
// throw std::invalid_argument; Tool::parse turns them into SchemaFailure.

namespace toolcore {

inline void require_object(const nlohmann::json& args) {
    if (!args.is_object()) {
        throw std::invalid_argument("expected an object, found " + args.dump());
    }
}

inline std::string require_string(const nlohmann::json& args, const char* field) {
    if (!args.contains(field)) {
        throw std::invalid_argument(std::string("missing field `") + field + "`");
    }
    if (!args[field].is_string()) {
        throw std::invalid_argument(std::string("field `") + field + "` must be a string");
    }
    return args[field].get<std::string>();
}

inline std::optional<uint64_t> optional_unsigned(const nlohmann::json& args, const char* field) {
    if (!args.contains(field) || args[field].is_null()) return std::nullopt;
    if (!args[field].is_number_integer() || args[field].get<int64_t>() < 0) {
        throw std::invalid_argument(std::string("field `") + field +
                                    "` must be a non-negative integer");
    }
    return args[field].get<uint64_t>();
}

inline bool optional_bool(const nlohmann::json& args, const char* field, bool fallback) {
    if (!args.contains(field) || args[field].is_null()) return fallback;
    if (!args[field].is_boolean()) {
        throw std::invalid_argument(std::string("field `") + field + "` must be a boolean");
    }
    return args[field].get<bool>();
}

inline std::vector<std::string> require_string_array(const nlohmann::json& args, const char* field) {
    if (!args.contains(field)) {
        throw std::invalid_argument(std::string("missing field `") + field + "`");
    }
    const auto& value = args[field];
    if (!value.is_array()) {
        throw std::invalid_argument(std::string("field `") + field + "` must be an array");
    }
    std::vector<std::string> out;
    for (const auto& item : value) {
        if (!item.is_string()) {
            throw std::invalid_argument(std::string("field `") + field +
                                        "` must only contain strings");
        }
        out.push_back(item.get<std::string>());
    }
    return out;
}

inline std::optional<std::vector<std::string>> optional_string_array(const nlohmann::json& args,
                                                                     const char* field) {
    if (!args.contains(field) || args[field].is_null()) return std::nullopt;
    return require_string_array(args, field);
}

// Join validation problems into one message, or nothing when there are none.
inline std::optional<std::string> join_errors(const std::vector<std::string>& errors) {
    if (errors.empty()) return std::nullopt;
    std::string out;
    for (size_t i = 0; i < errors.size(); ++i) {
        if (i > 0) out += "\n";
        out += errors[i];
    }
    return out;
}

} // namespace toolcore
