#pragma once
#include <optional>
#include <string>

// Built-in payloads that are declared but not wired into dispatch. Asking a
// BuiltInTool holding one of these for its name, validation or execution
// throws UnimplementedToolError.

namespace toolcore {

struct Grep {
    std::string pattern;
    std::optional<std::string> path;
};

struct Mkdir {
    std::string path;
};

struct Introspect {};

struct SpawnSubagent {};

} // namespace toolcore
