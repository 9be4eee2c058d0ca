#include "tool.hpp"
#include <iostream>

namespace toolcore {

// ── ToolParseError ───────────────────────────────────────────────

ToolParseError ToolParseError::name_does_not_exist(std::string name) {
    return ToolParseError{Kind::NameDoesNotExist, std::move(name)};
}

ToolParseError ToolParseError::schema_failure(std::string message) {
    return ToolParseError{Kind::SchemaFailure, std::move(message)};
}

ToolParseError ToolParseError::invalid_args(std::string message) {
    return ToolParseError{Kind::InvalidArgs, std::move(message)};
}

ToolParseError ToolParseError::other(std::string message) {
    return ToolParseError{Kind::Other, std::move(message)};
}

std::string ToolParseError::to_string() const {
    switch (kind) {
        case Kind::NameDoesNotExist:
            return "A tool with the name '" + message + "' does not exist";
        case Kind::SchemaFailure:
            return "The tool input does not match the tool schema: " + message;
        case Kind::InvalidArgs:
            return "The tool arguments failed validation: " + message;
        case Kind::Other:
            return "An unexpected error occurred parsing the tools: " + message;
    }
    return message;
}

// ── ToolState ────────────────────────────────────────────────────

const FileLineTracker* ToolState::find_tracker(const std::string& path) const {
    auto it = file_line_trackers.find(path);
    if (it == file_line_trackers.end()) return nullptr;
    return &it->second;
}

// ── BuiltInTool ──────────────────────────────────────────────────

namespace {

[[noreturn]] void throw_unimplemented(const BuiltInTool::Payload& payload) {
    if (std::holds_alternative<Grep>(payload)) throw UnimplementedToolError("grep");
    if (std::holds_alternative<Mkdir>(payload)) throw UnimplementedToolError("mkdir");
    if (std::holds_alternative<Introspect>(payload)) throw UnimplementedToolError("introspect");
    throw UnimplementedToolError("spawnSubagent");
}

ToolExecutionResult execute_fs_write(const FsWrite& write, const ExecutionContext& ctx) {
    if (!ctx.state) return write.execute(ctx.provider, ctx.platform, nullptr);

    auto resolved = write.canonical_path(ctx.provider);
    if (!resolved) return ToolExecutionError::custom(resolved.error());
    const std::string key = resolved.value().string();

    // Only a successful write updates the session's statistics.
    FileLineTracker tracker;
    if (const auto* existing = ctx.state->find_tracker(key)) tracker = *existing;
    auto result = write.execute(ctx.provider, ctx.platform, &tracker);
    if (result) ctx.state->file_line_trackers[key] = tracker;
    return result;
}

} // namespace

BuiltInTool BuiltInTool::from_parts(BuiltInToolName name, const nlohmann::json& args) {
    switch (name) {
        case BuiltInToolName::FsRead:     return BuiltInTool(FsRead::from_json(args));
        case BuiltInToolName::FsWrite:    return BuiltInTool(FsWrite::from_json(args));
        case BuiltInToolName::ExecuteCmd: return BuiltInTool(ExecuteCmd::from_json(args));
        case BuiltInToolName::ImageRead:  return BuiltInTool(ImageRead::from_json(args));
        case BuiltInToolName::Ls:         return BuiltInTool(Ls::from_json(args));
    }
    throw std::invalid_argument("unknown built-in tool");
}

BuiltInToolName BuiltInTool::tool_name() const {
    if (std::holds_alternative<FsRead>(payload_)) return BuiltInToolName::FsRead;
    if (std::holds_alternative<FsWrite>(payload_)) return BuiltInToolName::FsWrite;
    if (std::holds_alternative<Ls>(payload_)) return BuiltInToolName::Ls;
    if (std::holds_alternative<ImageRead>(payload_)) return BuiltInToolName::ImageRead;
    if (std::holds_alternative<ExecuteCmd>(payload_)) return BuiltInToolName::ExecuteCmd;
    throw_unimplemented(payload_);
}

std::optional<std::string> BuiltInTool::validate(const SystemProvider& provider,
                                                 const Platform& platform) const {
    if (auto* read = std::get_if<FsRead>(&payload_)) return read->validate(provider);
    if (auto* write = std::get_if<FsWrite>(&payload_)) return write->validate(provider);
    if (auto* ls = std::get_if<Ls>(&payload_)) return ls->validate(provider);
    if (auto* image = std::get_if<ImageRead>(&payload_)) return image->validate(provider, platform);
    if (auto* cmd = std::get_if<ExecuteCmd>(&payload_)) return cmd->validate();
    throw_unimplemented(payload_);
}

ToolExecutionResult BuiltInTool::execute(const ExecutionContext& ctx) const {
    if (auto* read = std::get_if<FsRead>(&payload_)) {
        return read->execute(ctx.provider, ctx.fs_read_max_bytes);
    }
    if (auto* write = std::get_if<FsWrite>(&payload_)) return execute_fs_write(*write, ctx);
    if (auto* ls = std::get_if<Ls>(&payload_)) return ls->execute(ctx.provider, ctx.platform);
    if (auto* image = std::get_if<ImageRead>(&payload_)) {
        return image->execute(ctx.provider, ctx.platform);
    }
    if (auto* cmd = std::get_if<ExecuteCmd>(&payload_)) {
        return cmd->execute(ctx.provider, ctx.platform, ctx.shell);
    }
    throw_unimplemented(payload_);
}

// ── Tool ─────────────────────────────────────────────────────────

Result<Tool, ToolParseError> Tool::parse(const CanonicalToolName& name, nlohmann::json args) {
    std::optional<std::string> purpose;
    if (args.is_object()) {
        auto it = args.find(kToolUsePurposeField);
        if (it != args.end()) {
            if (it->is_string()) purpose = it->get<std::string>();
            args.erase(it);
        }
    }

    if (name.is_builtin()) {
        try {
            return Tool{purpose, BuiltInTool::from_parts(name.builtin(), args)};
        } catch (const std::invalid_argument& e) {
            return ToolParseError::schema_failure(e.what());
        } catch (const nlohmann::json::exception& e) {
            return ToolParseError::schema_failure(e.what());
        }
    }

    if (name.is_mcp()) {
        if (!args.is_object()) {
            return ToolParseError::invalid_args("Arguments must be an object, instead found " +
                                                args.dump());
        }
        const auto& mcp = name.mcp();
        return Tool{purpose, McpTool{mcp.server_name, mcp.tool_name, std::move(args)}};
    }

    std::cerr << "[tool] Agent tools are not supported: " << name.to_string() << "\n";
    return ToolParseError::other("Unimplemented");
}

CanonicalToolName Tool::canonical_tool_name() const {
    if (is_builtin()) return builtin().canonical_tool_name();
    return McpToolName{mcp().server_name, mcp().tool_name};
}

// ── Catalog ──────────────────────────────────────────────────────

std::vector<CanonicalToolName> builtin_tool_names() {
    std::vector<CanonicalToolName> names;
    for (auto name : all_builtin_tool_names()) {
        names.emplace_back(name);
    }
    return names;
}

ToolSpec generate_tool_spec(BuiltInToolName name) {
    std::string description;
    const char* schema = nullptr;
    switch (name) {
        case BuiltInToolName::FsRead:
            description = FsRead::description();
            schema = FsRead::input_schema();
            break;
        case BuiltInToolName::FsWrite:
            description = FsWrite::description();
            schema = FsWrite::input_schema();
            break;
        case BuiltInToolName::ExecuteCmd:
            description = ExecuteCmd::description();
            schema = ExecuteCmd::input_schema();
            break;
        case BuiltInToolName::ImageRead:
            description = ImageRead::description();
            schema = ImageRead::input_schema();
            break;
        case BuiltInToolName::Ls:
            description = Ls::description();
            schema = Ls::input_schema();
            break;
    }
    return ToolSpec{to_string(name), description, nlohmann::json::parse(schema)};
}

std::vector<ToolSpec> builtin_tool_specs() {
    std::vector<ToolSpec> specs;
    for (auto name : all_builtin_tool_names()) {
        specs.push_back(generate_tool_spec(name));
    }
    return specs;
}

} // namespace toolcore
