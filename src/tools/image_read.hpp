#pragma once
#include "../platform.hpp"
#include "../system_provider.hpp"
#include "../tool_result.hpp"
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace toolcore {

constexpr uint64_t kMaxImageSizeBytes = 10 * 1024 * 1024;

struct ImageRead {
    std::vector<std::string> paths;

    static ImageRead from_json(const nlohmann::json& args);

    static std::string description();
    static const char* input_schema();

    // Checks every path and reports all problems together.
    std::optional<std::string> validate(const SystemProvider& provider,
                                        const Platform& platform) const;
    ToolExecutionResult execute(const SystemProvider& provider, const Platform& platform) const;

    // Canonicalized and platform-normalized paths, in input order.
    Result<std::vector<std::string>, std::string> processed_paths(const SystemProvider& provider,
                                                                  const Platform& platform) const;
};

bool is_supported_image_type(const std::string& path);

// Reads one image after re-checking its format and size.
Result<ImageBlock, std::string> read_image(const std::string& path);

} // namespace toolcore
