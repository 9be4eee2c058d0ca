#pragma once
#include "../platform.hpp"
#include "../system_provider.hpp"
#include "../tool_result.hpp"
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace toolcore {

// Environment variable selecting the shell binary.
constexpr const char* kShellEnvVar = "TOOLCORE_CHAT_SHELL";

constexpr const char* kUserAgentEnvVar = "TOOLCORE_USER_AGENT";
constexpr const char* kUserAgentAppName = "toolcore-agent";
constexpr const char* kUserAgentVersionKey = "TOOLCORE_USER_AGENT_VERSION";

struct ExecuteCmdOptions {
    // Shell used when kShellEnvVar is unset; empty means the platform default.
    std::string shell;
    // Extra variables for the child. Values may use ${env:NAME}.
    std::map<std::string, std::string> env;
    size_t max_output_bytes = 100000;
};

struct ExecuteCmd {
    std::string command;

    static ExecuteCmd from_json(const nlohmann::json& args);

    static std::string description();
    static const char* input_schema();

    std::optional<std::string> validate() const;

    // A non-zero exit status is a normal result, not an error.
    ToolExecutionResult execute(const SystemProvider& provider, const Platform& platform,
                                const ExecuteCmdOptions& options) const;

    std::string resolve_shell(const SystemProvider& provider, const Platform& platform,
                              const ExecuteCmdOptions& options) const;

    // Injected variables after ${env:NAME} expansion.
    static std::map<std::string, std::string> child_env(const SystemProvider& provider,
                                                        const ExecuteCmdOptions& options);
};

} // namespace toolcore
