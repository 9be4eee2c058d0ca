#include "session.hpp"
#include "event.hpp"
#include "event_bus.hpp"
#include "util.hpp"
#include <algorithm>

namespace toolcore {

std::shared_ptr<ToolSession> SessionManager::get_session(const std::string& session_id) {
    std::shared_ptr<ToolSession> session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(session_id);
        if (it != sessions_.end()) {
            it->second->last_active = epoch_seconds();
            return it->second;
        }
        session = std::make_shared<ToolSession>();
        session->id = session_id;
        session->last_active = epoch_seconds();
        sessions_.emplace(session_id, session);
    }

    if (event_bus_) {
        SessionCreatedEvent ev;
        ev.session_id = session_id;
        event_bus_->publish(ev);
    }
    return session;
}

bool SessionManager::has_session(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.count(session_id) > 0;
}

void SessionManager::remove_session(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    sessions_.erase(session_id);
}

size_t SessionManager::evict_idle(uint64_t now) {
    std::vector<std::shared_ptr<ToolSession>> evicted;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = sessions_.begin(); it != sessions_.end(); ) {
            uint64_t last = it->second->last_active;
            if (now > last && (now - last) > max_idle_seconds_) {
                evicted.push_back(it->second);
                it = sessions_.erase(it);
            } else {
                ++it;
            }
        }
    }

    if (event_bus_) {
        for (const auto& session : evicted) {
            SessionEvictedEvent ev;
            ev.session_id = session->id;
            ev.tracked_files = session->state.file_line_trackers.size();
            event_bus_->publish(ev);
        }
    }
    return evicted.size();
}

size_t SessionManager::evict_idle() {
    return evict_idle(epoch_seconds());
}

std::vector<std::string> SessionManager::list_sessions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(sessions_.size());
    for (const auto& [id, _] : sessions_) {
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

} // namespace toolcore
