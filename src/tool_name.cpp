#include "tool_name.hpp"

namespace toolcore {

const std::vector<BuiltInToolName>& all_builtin_tool_names() {
    static const std::vector<BuiltInToolName> names = {
        BuiltInToolName::FsRead,
        BuiltInToolName::FsWrite,
        BuiltInToolName::ExecuteCmd,
        BuiltInToolName::ImageRead,
        BuiltInToolName::Ls,
    };
    return names;
}

std::string to_string(BuiltInToolName name) {
    switch (name) {
        case BuiltInToolName::FsRead:     return "fsRead";
        case BuiltInToolName::FsWrite:    return "fsWrite";
        case BuiltInToolName::ExecuteCmd: return "executeCmd";
        case BuiltInToolName::ImageRead:  return "imageRead";
        case BuiltInToolName::Ls:         return "ls";
    }
    return "unknown";
}

std::optional<BuiltInToolName> parse_builtin_tool_name(const std::string& name) {
    for (auto candidate : all_builtin_tool_names()) {
        if (to_string(candidate) == name) return candidate;
    }
    return std::nullopt;
}

std::optional<CanonicalToolName> CanonicalToolName::parse(const std::string& name) {
    if (name.size() > 1 && name[0] == '@') {
        auto slash = name.find('/', 1);
        if (slash == std::string::npos || slash == 1 || slash + 1 >= name.size()) {
            return std::nullopt;
        }
        return CanonicalToolName(McpToolName{name.substr(1, slash - 1), name.substr(slash + 1)});
    }
    if (name.size() > 1 && name[0] == '#') {
        return CanonicalToolName(AgentToolName{name.substr(1)});
    }
    if (auto builtin = parse_builtin_tool_name(name)) {
        return CanonicalToolName(*builtin);
    }
    return std::nullopt;
}

std::string CanonicalToolName::to_string() const {
    if (is_builtin()) return toolcore::to_string(builtin());
    if (is_mcp()) return "@" + mcp().server_name + "/" + mcp().tool_name;
    return "#" + agent().agent_name;
}

} // namespace toolcore
