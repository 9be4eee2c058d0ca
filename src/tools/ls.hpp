#pragma once
#include "../platform.hpp"
#include "../system_provider.hpp"
#include "../tool_result.hpp"
#include <cstddef>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace toolcore {

// Directory names never descended into during recursive listings. They are
// still listed as entries.
extern const std::vector<std::string> kLsNeverDescend;

// Maximum number of listing rows returned across the whole traversal.
constexpr size_t kMaxLsEntries = 1000;

// Maximum number of entries read from a single directory.
constexpr size_t kMaxEntryCountPerDir = 10000;

struct Ls {
    std::string path;
    std::optional<size_t> depth;
    std::optional<std::vector<std::string>> ignore;

    static constexpr size_t kDefaultDepth = 0;

    static Ls from_json(const nlohmann::json& args);

    static std::string description();
    static const char* input_schema();

    std::optional<std::string> validate(const SystemProvider& provider) const;
    ToolExecutionResult execute(const SystemProvider& provider, const Platform& platform) const;

    size_t max_depth() const { return depth.value_or(kDefaultDepth); }
    bool matches_ignore_patterns(const std::string& entry_path) const;
};

} // namespace toolcore
