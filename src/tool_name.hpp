#pragma once
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace toolcore {

enum class BuiltInToolName { FsRead, FsWrite, ExecuteCmd, ImageRead, Ls };

// Every BuiltInToolName, in declaration order.
const std::vector<BuiltInToolName>& all_builtin_tool_names();

// Wire name, e.g. "fsWrite"
std::string to_string(BuiltInToolName name);

std::optional<BuiltInToolName> parse_builtin_tool_name(const std::string& name);

struct McpToolName {
    std::string server_name;
    std::string tool_name;

    bool operator==(const McpToolName& other) const {
        return server_name == other.server_name && tool_name == other.tool_name;
    }
};

// Reserved for sub-agents; never resolves to an executable tool.
struct AgentToolName {
    std::string agent_name;

    bool operator==(const AgentToolName& other) const { return agent_name == other.agent_name; }
};

// Unique address of a tool. Built-ins use their wire name, externally
// registered tools "@server/tool", agents "#agent".
class CanonicalToolName {
public:
    using Value = std::variant<BuiltInToolName, McpToolName, AgentToolName>;

    CanonicalToolName(BuiltInToolName name) : value_(name) {}
    CanonicalToolName(McpToolName name) : value_(std::move(name)) {}
    CanonicalToolName(AgentToolName name) : value_(std::move(name)) {}

    static std::optional<CanonicalToolName> parse(const std::string& name);

    const Value& value() const { return value_; }

    bool is_builtin() const { return std::holds_alternative<BuiltInToolName>(value_); }
    bool is_mcp() const { return std::holds_alternative<McpToolName>(value_); }
    bool is_agent() const { return std::holds_alternative<AgentToolName>(value_); }

    BuiltInToolName builtin() const { return std::get<BuiltInToolName>(value_); }
    const McpToolName& mcp() const { return std::get<McpToolName>(value_); }
    const AgentToolName& agent() const { return std::get<AgentToolName>(value_); }

    std::string to_string() const;

    bool operator==(const CanonicalToolName& other) const { return value_ == other.value_; }
    bool operator!=(const CanonicalToolName& other) const { return !(*this == other); }

private:
    Value value_;
};

} // namespace toolcore
