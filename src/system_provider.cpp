#include "system_provider.hpp"
#include <cctype>
#include <cstdlib>
#include <system_error>

namespace toolcore {

std::optional<std::string> RealSystemProvider::env_var(const std::string& name) const {
    if (const char* v = std::getenv(name.c_str())) return std::string(v);
    return std::nullopt;
}

std::optional<std::string> RealSystemProvider::home_dir() const {
    return env_var("HOME");
}

std::string RealSystemProvider::current_dir() const {
    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);
    if (ec) return "/";
    return cwd.string();
}

static bool is_var_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

Result<std::filesystem::path, std::string> canonicalize_path(const std::string& path,
                                                             const SystemProvider& provider) {
    std::string expanded;
    expanded.reserve(path.size());

    size_t i = 0;
    if (!path.empty() && path[0] == '~' && (path.size() == 1 || path[1] == '/')) {
        auto home = provider.home_dir();
        if (!home) {
            return std::string("Unable to expand '~': home directory not found");
        }
        expanded = *home;
        i = 1;
    }

    while (i < path.size()) {
        if (path[i] != '$' || i + 1 >= path.size()) {
            expanded += path[i++];
            continue;
        }

        std::string name;
        size_t next = i + 1;
        if (path[next] == '{') {
            size_t close = path.find('}', next + 1);
            if (close == std::string::npos) {
                expanded += path[i++];
                continue;
            }
            name = path.substr(next + 1, close - next - 1);
            next = close + 1;
        } else {
            while (next < path.size() && is_var_char(path[next])) {
                name += path[next++];
            }
        }

        if (name.empty()) {
            expanded += path[i++];
            continue;
        }

        auto value = provider.env_var(name);
        if (!value) {
            return "Failed to expand path '" + path + "': environment variable '" + name +
                   "' not found";
        }
        expanded += *value;
        i = next;
    }

    std::filesystem::path result(expanded);
    if (result.is_relative()) {
        result = std::filesystem::path(provider.current_dir()) / result;
    }
    result = result.lexically_normal();

    // "/a/b/" and "/a/b/." normalize with a trailing separator; drop it.
    std::string s = result.string();
    while (s.size() > 1 && s.back() == '/') s.pop_back();
    return std::filesystem::path(s);
}

} // namespace toolcore
