#pragma once
#include "tools/mcp.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace toolcore {

// Registered external tool servers, keyed by server name.
// All methods are thread-safe.
class McpRegistry {
public:
    // Replaces any client already registered under the same name.
    void register_client(std::shared_ptr<McpClient> client);
    bool unregister_client(const std::string& server_name);

    // nullptr when no client is registered under `server_name`.
    std::shared_ptr<McpClient> find(const std::string& server_name) const;

    // Throws std::invalid_argument for an unknown server.
    std::shared_ptr<McpClient> get(const std::string& server_name) const;

    bool has(const std::string& server_name) const;
    std::vector<std::string> server_names() const;
    size_t size() const;

    void clear();

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<McpClient>> clients_;
};

} // namespace toolcore
