#pragma once
#include "../system_provider.hpp"
#include "../tool_result.hpp"
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace toolcore {

constexpr uint64_t kDefaultFsReadMaxBytes = 250000;

struct FsRead {
    std::string path;
    std::optional<uint64_t> offset; // first line, 0-indexed
    std::optional<uint64_t> limit;  // number of lines

    static FsRead from_json(const nlohmann::json& args);

    static std::string description();
    static const char* input_schema();

    std::optional<std::string> validate(const SystemProvider& provider) const;

    // Reads at most `max_bytes` bytes, then applies offset and limit.
    ToolExecutionResult execute(const SystemProvider& provider, uint64_t max_bytes) const;
};

} // namespace toolcore
