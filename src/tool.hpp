#pragma once
#include "platform.hpp"
#include "result.hpp"
#include "system_provider.hpp"
#include "tool_name.hpp"
#include "tool_result.hpp"
#include "tools/execute_cmd.hpp"
#include "tools/fs_read.hpp"
#include "tools/fs_write.hpp"
#include "tools/image_read.hpp"
#include "tools/ls.hpp"
#include "tools/mcp.hpp"
#include "tools/unimplemented.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace toolcore {

// Field stripped from every argument object before typed parsing.
constexpr const char* kToolUsePurposeField = "toolUsePurpose";

// Raised when a declared but unwired built-in is asked to do anything.
class UnimplementedToolError : public std::logic_error {
public:
    explicit UnimplementedToolError(const std::string& variant)
        : std::logic_error("built-in tool '" + variant + "' is not implemented") {}
};

struct ToolParseError {
    enum class Kind { NameDoesNotExist, SchemaFailure, InvalidArgs, Other };

    Kind kind = Kind::Other;
    std::string message;

    static ToolParseError name_does_not_exist(std::string name);
    static ToolParseError schema_failure(std::string message);
    static ToolParseError invalid_args(std::string message);
    static ToolParseError other(std::string message);

    std::string to_string() const;
};

// Per-session mutable state shared by tool executions.
struct ToolState {
    // Keyed by canonical file path
    std::unordered_map<std::string, FileLineTracker> file_line_trackers;

    const FileLineTracker* find_tracker(const std::string& path) const;
};

// Everything a built-in needs from its surroundings to run.
struct ExecutionContext {
    const SystemProvider& provider;
    const Platform& platform;
    ExecuteCmdOptions shell;
    uint64_t fs_read_max_bytes = kDefaultFsReadMaxBytes;
    ToolState* state = nullptr; // write statistics are skipped when null
};

class BuiltInTool {
public:
    using Payload = std::variant<FsRead, FsWrite, Grep, Ls, Mkdir, ImageRead, ExecuteCmd,
                                 Introspect, SpawnSubagent>;

    BuiltInTool(Payload payload) : payload_(std::move(payload)) {}

    // Typed parse of `args` for `name`. Throws std::invalid_argument when the
    // arguments do not have the tool's shape.
    static BuiltInTool from_parts(BuiltInToolName name, const nlohmann::json& args);

    const Payload& payload() const { return payload_; }

    BuiltInToolName tool_name() const;
    CanonicalToolName canonical_tool_name() const { return tool_name(); }

    std::optional<std::string> validate(const SystemProvider& provider,
                                        const Platform& platform) const;

    ToolExecutionResult execute(const ExecutionContext& ctx) const;

private:
    Payload payload_;
};

using ToolKind = std::variant<BuiltInTool, McpTool>;

// A parsed call, ready to validate and execute.
struct Tool {
    std::optional<std::string> tool_use_purpose;
    ToolKind kind;

    static Result<Tool, ToolParseError> parse(const CanonicalToolName& name, nlohmann::json args);

    CanonicalToolName canonical_tool_name() const;

    bool is_builtin() const { return std::holds_alternative<BuiltInTool>(kind); }
    bool is_mcp() const { return std::holds_alternative<McpTool>(kind); }
    const BuiltInTool& builtin() const { return std::get<BuiltInTool>(kind); }
    const McpTool& mcp() const { return std::get<McpTool>(kind); }
};

// One canonical name per BuiltInToolName, in declaration order.
std::vector<CanonicalToolName> builtin_tool_names();

ToolSpec generate_tool_spec(BuiltInToolName name);

// Specs for every built-in, in builtin_tool_names() order.
std::vector<ToolSpec> builtin_tool_specs();

} // namespace toolcore
