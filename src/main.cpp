#include "config.hpp"
#include "dispatcher.hpp"
#include "event.hpp"
#include "event_bus.hpp"
#include "mcp_registry.hpp"
#include "platform.hpp"
#include "session.hpp"
#include "system_provider.hpp"
#include "tool.hpp"
#include "util.hpp"
#include <cstring>
#include <iostream>
#include <string>

static void print_usage() {
    std::cout << "Usage: toolcore [options]\n"
              << "\n"
              << "Options:\n"
              << "  -t, --tool NAME      Run a single tool call and exit\n"
              << "  -a, --args JSON      Arguments for --tool (default: {})\n"
              << "  -l, --list           Print the built-in tool specs as JSON\n"
              << "  --json               Print results as JSON instead of text\n"
              << "  --config PATH        Load config from PATH instead of ~/.toolcore/config.json\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Without --tool, tool calls are read from stdin, one per line, either as\n"
              << "{\"name\": ..., \"arguments\": {...}} or as <tool_call>...</tool_call> blocks.\n"
              << "\n"
              << "Interactive commands:\n"
              << "  /tools               List built-in tool names\n"
              << "  /stats               Show per-file write statistics\n"
              << "  /help                Show available commands\n"
              << "  /quit, /exit         Exit\n"
              << "\n"
              << "Environment variables:\n"
              << "  TOOLCORE_CHAT_SHELL  Shell used by executeCmd\n";
}

static void print_outcome(const toolcore::ToolCallOutcome& outcome, bool as_json, bool as_xml) {
    if (as_json) {
        std::cout << toolcore::outcome_to_json(outcome).dump() << '\n';
    } else if (as_xml) {
        std::cout << toolcore::format_tool_results_xml(outcome) << '\n';
    } else {
        std::cout << toolcore::format_tool_output(outcome) << '\n';
    }
}

// A line is either one JSON tool call or text holding <tool_call> blocks.
static std::vector<toolcore::ToolCall> calls_from_line(const std::string& line, bool& as_xml) {
    if (line.find("<tool_call>") != std::string::npos) {
        as_xml = true;
        return toolcore::parse_xml_tool_calls(line);
    }
    as_xml = false;
    auto j = nlohmann::json::parse(toolcore::repair_json(line), nullptr, false);
    if (j.is_discarded() || !j.is_object() || !j.contains("name") || !j["name"].is_string()) {
        std::cerr << "[cli] Expected {\"name\": ..., \"arguments\": ...}: " << line << "\n";
        return {};
    }
    toolcore::ToolCall call;
    call.id = j.contains("id") && j["id"].is_string() ? j["id"].get<std::string>()
                                                      : toolcore::generate_id();
    call.name = j["name"].get<std::string>();
    if (j.contains("arguments")) call.arguments = j["arguments"];
    return {call};
}

int main(int argc, char* argv[]) try {
    std::string tool_name;
    std::string args_json = "{}";
    std::string config_path;
    bool list = false;
    bool as_json = false;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if ((std::strcmp(argv[i], "-t") == 0 || std::strcmp(argv[i], "--tool") == 0) && i + 1 < argc) {
            tool_name = argv[++i];
        } else if ((std::strcmp(argv[i], "-a") == 0 || std::strcmp(argv[i], "--args") == 0) && i + 1 < argc) {
            args_json = argv[++i];
        } else if (std::strcmp(argv[i], "-l") == 0 || std::strcmp(argv[i], "--list") == 0) {
            list = true;
        } else if (std::strcmp(argv[i], "--json") == 0) {
            as_json = true;
        } else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    if (list) {
        nlohmann::json specs = nlohmann::json::array();
        for (const auto& spec : toolcore::builtin_tool_specs()) {
            specs.push_back({
                {"name", spec.name},
                {"description", spec.description},
                {"input_schema", spec.input_schema},
            });
        }
        std::cout << specs.dump(2) << '\n';
        return 0;
    }

    auto config = config_path.empty() ? toolcore::Config::load()
                                      : toolcore::Config::load_from(config_path);

    toolcore::RealSystemProvider provider;
    toolcore::EventBus bus;
    toolcore::McpRegistry mcp_registry;
    toolcore::SessionManager sessions(config.session.max_idle_seconds);
    sessions.set_event_bus(&bus);

    toolcore::Dispatcher dispatcher(provider, toolcore::default_platform(), config);
    dispatcher.set_event_bus(&bus);
    dispatcher.set_mcp_registry(&mcp_registry);

    toolcore::subscribe<toolcore::FileWriteTrackedEvent>(bus,
        [](const toolcore::FileWriteTrackedEvent& ev) {
            std::cerr << "[stats] " << ev.path << ": +" << ev.lines_added << " -"
                      << ev.lines_removed << " (user " << ev.lines_by_user << ")\n";
        });

    const std::string session_id = "cli";
    auto session = sessions.get_session(session_id);

    // Single call mode
    if (!tool_name.empty()) {
        auto args = nlohmann::json::parse(args_json, nullptr, false);
        if (args.is_discarded()) {
            std::cerr << "Error: --args is not valid JSON\n";
            return 1;
        }
        toolcore::ToolCall call{toolcore::generate_id(), tool_name, args};
        auto outcome = dispatcher.dispatch(call, session->state, session_id);
        print_outcome(outcome, as_json, false);
        return outcome.success() ? 0 : 2;
    }

    std::string line;
    while (std::getline(std::cin, line)) {
        line = toolcore::trim(line);
        if (line.empty()) continue;

        if (line[0] == '/') {
            if (line == "/quit" || line == "/exit") {
                break;
            } else if (line == "/tools") {
                for (const auto& name : toolcore::builtin_tool_names()) {
                    std::cout << name.to_string() << "\n";
                }
            } else if (line == "/stats") {
                for (const auto& [path, tracker] : session->state.file_line_trackers) {
                    std::cout << path << ": agent " << tracker.lines_by_agent() << ", user "
                              << tracker.lines_by_user() << ", lines "
                              << tracker.after_fswrite_lines << "\n";
                }
            } else if (line == "/help") {
                print_usage();
            } else {
                std::cout << "Unknown command: " << line << "\n";
            }
            continue;
        }

        bool as_xml = false;
        for (const auto& call : calls_from_line(line, as_xml)) {
            auto outcome = dispatcher.dispatch(call, session->state, session_id);
            print_outcome(outcome, as_json, as_xml);
        }
    }

    return 0;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
