#pragma once
#include "event.hpp"
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace toolcore {

using EventHandler = std::function<void(const Event&)>;

// Synchronous publish/subscribe keyed by event tag.
class EventBus {
public:
    uint64_t subscribe(const std::string& tag, EventHandler handler);

    // True if the subscription existed.
    bool unsubscribe(uint64_t id);

    // Calls the tag's handlers in registration order without holding the
    // lock, so handlers may subscribe or publish. Returns how many ran.
    size_t publish(const Event& event);

    void clear();

    size_t subscriber_count(const std::string& tag) const;

private:
    struct Subscription {
        uint64_t id;
        EventHandler handler;
    };

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::vector<Subscription>> handlers_;
    uint64_t next_id_ = 1;
};

// Subscribe with the concrete event type.
template<typename E>
uint64_t subscribe(EventBus& bus, std::function<void(const E&)> handler) {
    return bus.subscribe(E::TAG, [h = std::move(handler)](const Event& e) {
        h(static_cast<const E&>(e));
    });
}

// Publish to an optional bus.
inline void publish_to(EventBus* bus, const Event& event) {
    if (bus) bus->publish(event);
}

} // namespace toolcore
