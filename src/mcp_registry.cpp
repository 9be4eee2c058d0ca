#include "mcp_registry.hpp"
#include <algorithm>
#include <stdexcept>

namespace toolcore {

void McpRegistry::register_client(std::shared_ptr<McpClient> client) {
    if (!client) {
        throw std::invalid_argument("Cannot register a null MCP client");
    }
    std::string name = client->server_name();
    std::lock_guard<std::mutex> lock(mutex_);
    clients_[name] = std::move(client);
}

bool McpRegistry::unregister_client(const std::string& server_name) {
    std::lock_guard<std::mutex> lock(mutex_);
    return clients_.erase(server_name) > 0;
}

std::shared_ptr<McpClient> McpRegistry::find(const std::string& server_name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = clients_.find(server_name);
    if (it == clients_.end()) return nullptr;
    return it->second;
}

std::shared_ptr<McpClient> McpRegistry::get(const std::string& server_name) const {
    auto client = find(server_name);
    if (!client) {
        throw std::invalid_argument("Unknown MCP server: " + server_name);
    }
    return client;
}

bool McpRegistry::has(const std::string& server_name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return clients_.count(server_name) > 0;
}

std::vector<std::string> McpRegistry::server_names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(clients_.size());
    for (const auto& [name, _] : clients_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

size_t McpRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return clients_.size();
}

void McpRegistry::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    clients_.clear();
}

} // namespace toolcore
