#pragma once
#include "config.hpp"
#include "platform.hpp"
#include "system_provider.hpp"
#include "tool.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace toolcore {

class EventBus;    // forward declaration
class McpRegistry; // forward declaration

struct ToolCall {
    std::string id;
    std::string name; // canonical string form
    nlohmann::json arguments = nlohmann::json::object();
};

enum class ToolCallStatus { Success, ParseFailed, ValidationFailed, ExecutionFailed };

std::string to_string(ToolCallStatus status);

struct ToolCallOutcome {
    std::string tool_call_id;
    std::string tool_name;
    ToolCallStatus status = ToolCallStatus::Success;
    ToolExecutionOutput output;
    std::string error; // empty on success
    std::optional<std::string> tool_use_purpose;

    bool success() const { return status == ToolCallStatus::Success; }
};

// Runs single tool calls: resolve name, parse, validate, execute.
class Dispatcher {
public:
    Dispatcher(const SystemProvider& provider, const Platform& platform, Config config);

    // Optional collaborators, not owned.
    void set_mcp_registry(McpRegistry* registry) { mcp_registry_ = registry; }
    void set_event_bus(EventBus* bus) { event_bus_ = bus; }

    const Config& config() const { return config_; }

    // Resolves the name and parses the arguments. An external tool whose
    // server is not registered does not exist.
    Result<Tool, ToolParseError> parse(const ToolCall& call) const;

    // Never throws for caller-supplied input. UnimplementedToolError from an
    // unwired built-in propagates.
    ToolCallOutcome dispatch(const ToolCall& call, ToolState& state,
                             const std::string& session_id = "");

    ExecutionContext execution_context(ToolState* state) const;

private:
    const SystemProvider& provider_;
    const Platform& platform_;
    Config config_;
    McpRegistry* mcp_registry_ = nullptr;
    EventBus* event_bus_ = nullptr;

    ToolExecutionResult execute_mcp(const McpTool& tool) const;
    void publish_write_stats(const Tool& tool, const ToolState& state,
                             const std::string& session_id) const;
};

// Extract <tool_call>{"name":...,"arguments":...}</tool_call> blocks.
// Malformed blocks are skipped.
std::vector<ToolCall> parse_xml_tool_calls(const std::string& text);

// Try to repair malformed JSON: unbalanced braces, trailing commas.
std::string repair_json(const std::string& json_str);

// Text shown to the model for an outcome.
std::string format_tool_output(const ToolCallOutcome& outcome);

// <tool_result name="..." status="ok|error">...</tool_result>
std::string format_tool_results_xml(const ToolCallOutcome& outcome);

// Images are serialized as base64.
nlohmann::json outcome_to_json(const ToolCallOutcome& outcome);

} // namespace toolcore
