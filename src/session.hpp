#pragma once
#include "tool.hpp"
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace toolcore {

class EventBus; // forward declaration

struct ToolSession {
    std::string id;
    ToolState state;
    uint64_t last_active = 0;
};

// Owns the per-session tool state. Sessions are shared so a caller keeps
// its session alive while a tool runs even if it is evicted meanwhile.
class SessionManager {
public:
    explicit SessionManager(uint64_t max_idle_seconds = 3600)
        : max_idle_seconds_(max_idle_seconds) {}

    // Get or create a session, marking it active.
    std::shared_ptr<ToolSession> get_session(const std::string& session_id);

    bool has_session(const std::string& session_id) const;

    void remove_session(const std::string& session_id);

    // Evict sessions idle for longer than the configured limit. `now` is in
    // epoch seconds. Returns the number evicted.
    size_t evict_idle(uint64_t now);
    size_t evict_idle();

    // Sorted session IDs
    std::vector<std::string> list_sessions() const;

    // Optional event bus for SessionCreated / SessionEvicted
    void set_event_bus(EventBus* bus) { event_bus_ = bus; }

private:
    uint64_t max_idle_seconds_;
    std::unordered_map<std::string, std::shared_ptr<ToolSession>> sessions_;
    mutable std::mutex mutex_;
    EventBus* event_bus_ = nullptr;
};

} // namespace toolcore
