#include "dispatcher.hpp"
#include "event.hpp"
#include "event_bus.hpp"
#include "mcp_registry.hpp"
#include "util.hpp"
#include <iostream>

namespace toolcore {

std::string to_string(ToolCallStatus status) {
    switch (status) {
        case ToolCallStatus::Success:          return "success";
        case ToolCallStatus::ParseFailed:      return "parse_failed";
        case ToolCallStatus::ValidationFailed: return "validation_failed";
        case ToolCallStatus::ExecutionFailed:  return "execution_failed";
    }
    return "unknown";
}

// ── Dispatcher ───────────────────────────────────────────────────

Dispatcher::Dispatcher(const SystemProvider& provider, const Platform& platform, Config config)
    : provider_(provider), platform_(platform), config_(std::move(config))
{}

ExecutionContext Dispatcher::execution_context(ToolState* state) const {
    ExecuteCmdOptions shell;
    shell.shell = config_.shell.path;
    shell.env = config_.shell.env;
    shell.max_output_bytes = static_cast<size_t>(config_.shell.max_output_bytes);
    return ExecutionContext{provider_, platform_, std::move(shell), config_.fs_read.max_bytes,
                            state};
}

Result<Tool, ToolParseError> Dispatcher::parse(const ToolCall& call) const {
    auto name = CanonicalToolName::parse(call.name);
    if (!name) return ToolParseError::name_does_not_exist(call.name);
    if (name->is_mcp() && (!mcp_registry_ || !mcp_registry_->has(name->mcp().server_name))) {
        return ToolParseError::name_does_not_exist(call.name);
    }
    return Tool::parse(*name, call.arguments);
}

ToolExecutionResult Dispatcher::execute_mcp(const McpTool& tool) const {
    auto client = mcp_registry_ ? mcp_registry_->find(tool.server_name) : nullptr;
    if (!client) {
        return ToolExecutionError::custom("MCP server '" + tool.server_name +
                                          "' is not registered");
    }
    try {
        return client->call_tool(tool.tool_name,
                                 tool.params.value_or(nlohmann::json::object()));
    } catch (const std::exception& e) {
        return ToolExecutionError::custom("MCP tool '" + tool.tool_name + "' on server '" +
                                          tool.server_name + "' failed: " + e.what());
    }
}

void Dispatcher::publish_write_stats(const Tool& tool, const ToolState& state,
                                     const std::string& session_id) const {
    if (!event_bus_ || !tool.is_builtin()) return;
    const auto* write = std::get_if<FsWrite>(&tool.builtin().payload());
    if (!write) return;
    auto path = write->canonical_path(provider_);
    if (!path) return;
    const auto* tracker = state.find_tracker(path.value().string());
    if (!tracker) return;

    FileWriteTrackedEvent ev;
    ev.session_id = session_id;
    ev.path = path.value().string();
    ev.lines_by_user = tracker->lines_by_user();
    ev.lines_by_agent = tracker->lines_by_agent();
    ev.lines_added = tracker->lines_added_by_agent;
    ev.lines_removed = tracker->lines_removed_by_agent;
    event_bus_->publish(ev);
}

ToolCallOutcome Dispatcher::dispatch(const ToolCall& call, ToolState& state,
                                     const std::string& session_id) {
    std::cerr << "[tool] " << call.name << '\n';

    {
        ToolCallRequestEvent ev;
        ev.session_id = session_id;
        ev.tool_call_id = call.id;
        ev.tool_name = call.name;
        publish_to(event_bus_, ev);
    }

    ToolCallOutcome outcome;
    outcome.tool_call_id = call.id;
    outcome.tool_name = call.name;

    auto finish = [&]() {
        ToolCallResultEvent ev;
        ev.session_id = session_id;
        ev.tool_call_id = call.id;
        ev.tool_name = call.name;
        ev.status = to_string(outcome.status);
        ev.success = outcome.success();
        publish_to(event_bus_, ev);
        return outcome;
    };

    auto parsed = parse(call);
    if (!parsed) {
        outcome.status = ToolCallStatus::ParseFailed;
        outcome.error = parsed.error().to_string();
        return finish();
    }
    const Tool& tool = parsed.value();
    outcome.tool_use_purpose = tool.tool_use_purpose;

    ToolExecutionResult result = ToolExecutionOutput();
    if (tool.is_builtin()) {
        const auto& builtin = tool.builtin();
        if (auto invalid = builtin.validate(provider_, platform_)) {
            outcome.status = ToolCallStatus::ValidationFailed;
            outcome.error = ToolParseError::invalid_args(*invalid).to_string();
            return finish();
        }
        result = builtin.execute(execution_context(&state));
    } else {
        result = execute_mcp(tool.mcp());
    }

    if (!result) {
        outcome.status = ToolCallStatus::ExecutionFailed;
        outcome.error = result.error().to_string();
        return finish();
    }

    outcome.output = std::move(result.value());
    publish_write_stats(tool, state, session_id);
    return finish();
}

// ── Tool call extraction ─────────────────────────────────────────

std::vector<ToolCall> parse_xml_tool_calls(const std::string& text) {
    std::vector<ToolCall> calls;
    const std::string open_tag = "<tool_call>";
    const std::string close_tag = "</tool_call>";

    size_t pos = 0;
    while (pos < text.size()) {
        size_t start = text.find(open_tag, pos);
        if (start == std::string::npos) break;

        size_t content_start = start + open_tag.size();
        size_t end = text.find(close_tag, content_start);
        if (end == std::string::npos) break;

        std::string content = trim(text.substr(content_start, end - content_start));
        pos = end + close_tag.size();

        nlohmann::json j = nlohmann::json::parse(repair_json(content), nullptr, false);
        if (j.is_discarded() || !j.is_object()) {
            std::cerr << "[dispatch] Skipping malformed tool call\n";
            continue;
        }
        if (!j.contains("name") || !j["name"].is_string()) continue;

        ToolCall call;
        call.id = j.contains("id") && j["id"].is_string() ? j["id"].get<std::string>()
                                                          : generate_id();
        call.name = j["name"].get<std::string>();
        if (j.contains("arguments")) {
            call.arguments = j["arguments"];
        }
        if (!call.name.empty()) {
            calls.push_back(std::move(call));
        }
    }

    return calls;
}

std::string repair_json(const std::string& json_str) {
    std::string s = json_str;

    // Balance braces outside string literals
    int brace_count = 0;
    int bracket_count = 0;
    bool in_string = false;
    for (size_t i = 0; i < s.size(); i++) {
        char c = s[i];
        if (in_string) {
            if (c == '\\') i++;
            else if (c == '"') in_string = false;
            continue;
        }
        if (c == '"') in_string = true;
        else if (c == '{') brace_count++;
        else if (c == '}') brace_count--;
        else if (c == '[') bracket_count++;
        else if (c == ']') bracket_count--;
    }

    while (bracket_count > 0) {
        s += ']';
        bracket_count--;
    }
    while (brace_count > 0) {
        s += '}';
        brace_count--;
    }

    // Drop commas directly followed (modulo whitespace) by } or ]
    std::string result;
    result.reserve(s.size());
    for (size_t i = 0; i < s.size(); i++) {
        if (s[i] == ',') {
            size_t j = i + 1;
            while (j < s.size() && (s[j] == ' ' || s[j] == '\t' || s[j] == '\n' || s[j] == '\r')) {
                j++;
            }
            if (j < s.size() && (s[j] == '}' || s[j] == ']')) {
                continue;
            }
        }
        result += s[i];
    }

    if (nlohmann::json::accept(result)) return result;
    return json_str;
}

// ── Result formatting ────────────────────────────────────────────

namespace {

std::string image_placeholder(const ImageBlock& image) {
    return "[image: " + to_string(image.format) + ", " + std::to_string(image.bytes.size()) +
           " bytes]";
}

} // namespace

std::string format_tool_output(const ToolCallOutcome& outcome) {
    if (!outcome.success()) return "Error: " + outcome.error;

    std::string text;
    for (const auto& item : outcome.output.items) {
        if (!text.empty()) text += "\n";
        switch (item.kind) {
            case ToolExecutionOutputItem::Kind::Text:
                text += item.text;
                break;
            case ToolExecutionOutputItem::Kind::Json:
                text += item.json.dump();
                break;
            case ToolExecutionOutputItem::Kind::Image:
                if (item.image) text += image_placeholder(*item.image);
                break;
        }
    }
    return text;
}

std::string format_tool_results_xml(const ToolCallOutcome& outcome) {
    std::string status = outcome.success() ? "ok" : "error";
    return "<tool_result name=\"" + outcome.tool_name + "\" status=\"" + status + "\">" +
           format_tool_output(outcome) + "</tool_result>";
}

nlohmann::json outcome_to_json(const ToolCallOutcome& outcome) {
    nlohmann::json j = {
        {"id", outcome.tool_call_id},
        {"name", outcome.tool_name},
        {"status", to_string(outcome.status)},
    };
    if (outcome.tool_use_purpose) j["purpose"] = *outcome.tool_use_purpose;
    if (!outcome.success()) {
        j["error"] = outcome.error;
        return j;
    }

    nlohmann::json items = nlohmann::json::array();
    for (const auto& item : outcome.output.items) {
        switch (item.kind) {
            case ToolExecutionOutputItem::Kind::Text:
                items.push_back({{"type", "text"}, {"text", item.text}});
                break;
            case ToolExecutionOutputItem::Kind::Json:
                items.push_back({{"type", "json"}, {"json", item.json}});
                break;
            case ToolExecutionOutputItem::Kind::Image:
                if (!item.image) break;
                items.push_back({
                    {"type", "image"},
                    {"format", to_string(item.image->format)},
                    {"data", base64_encode(item.image->bytes.data(), item.image->bytes.size())},
                });
                break;
        }
    }
    j["output"] = std::move(items);
    return j;
}

} // namespace toolcore
