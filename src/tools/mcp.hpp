#pragma once
#include "../tool_result.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace toolcore {

// A call addressed to a tool provided by an external server.
struct McpTool {
    std::string server_name;
    std::string tool_name;
    std::optional<nlohmann::json> params; // always an object when present
};

// Connection to one external tool server. The transport lives behind this
// interface.
class McpClient {
public:
    virtual ~McpClient() = default;
    virtual std::string server_name() const = 0;
    virtual ToolExecutionResult call_tool(const std::string& tool_name,
                                          const nlohmann::json& params) = 0;
};

} // namespace toolcore
