#include <catch2/catch.hpp>
#include "event_bus.hpp"

using namespace toolcore;

// ── Basic publish / subscribe ───────────────────────────────────

TEST_CASE("EventBus: subscribe and publish", "[event_bus]") {
    EventBus bus;
    int count = 0;

    bus.subscribe(ToolCallRequestEvent::TAG, [&](const Event&) {
        count++;
    });

    ToolCallRequestEvent ev;
    ev.session_id = "s1";
    REQUIRE(bus.publish(ev) == 1);
    REQUIRE(count == 1);
}

TEST_CASE("EventBus: multiple subscribers called in order", "[event_bus]") {
    EventBus bus;
    std::vector<int> order;

    bus.subscribe(ToolCallResultEvent::TAG, [&](const Event&) {
        order.push_back(1);
    });
    bus.subscribe(ToolCallResultEvent::TAG, [&](const Event&) {
        order.push_back(2);
    });

    ToolCallResultEvent ev;
    bus.publish(ev);

    REQUIRE(order.size() == 2);
    REQUIRE(order[0] == 1);
    REQUIRE(order[1] == 2);
}

TEST_CASE("EventBus: publish with no subscribers is a no-op", "[event_bus]") {
    EventBus bus;
    SessionCreatedEvent ev;
    REQUIRE(bus.publish(ev) == 0);
}

TEST_CASE("EventBus: different tags are independent", "[event_bus]") {
    EventBus bus;
    int request_count = 0;
    int result_count = 0;

    bus.subscribe(ToolCallRequestEvent::TAG, [&](const Event&) {
        request_count++;
    });
    bus.subscribe(ToolCallResultEvent::TAG, [&](const Event&) {
        result_count++;
    });

    ToolCallRequestEvent ev1;
    bus.publish(ev1);
    bus.publish(ev1);
    ToolCallResultEvent ev2;
    bus.publish(ev2);

    REQUIRE(request_count == 2);
    REQUIRE(result_count == 1);
}

// ── Unsubscribe ──────────────────────────────────────────────────

TEST_CASE("EventBus: unsubscribe stops delivery", "[event_bus]") {
    EventBus bus;
    int count = 0;
    auto id = bus.subscribe(SessionEvictedEvent::TAG, [&](const Event&) { count++; });
    REQUIRE(bus.subscriber_count(SessionEvictedEvent::TAG) == 1);

    REQUIRE(bus.unsubscribe(id));
    REQUIRE_FALSE(bus.unsubscribe(id));
    REQUIRE(bus.subscriber_count(SessionEvictedEvent::TAG) == 0);

    SessionEvictedEvent ev;
    bus.publish(ev);
    REQUIRE(count == 0);
}

TEST_CASE("EventBus: clear removes everything", "[event_bus]") {
    EventBus bus;
    bus.subscribe(ToolCallRequestEvent::TAG, [](const Event&) {});
    bus.subscribe(ToolCallResultEvent::TAG, [](const Event&) {});
    bus.clear();
    REQUIRE(bus.subscriber_count(ToolCallRequestEvent::TAG) == 0);
    REQUIRE(bus.subscriber_count(ToolCallResultEvent::TAG) == 0);
}

// ── Typed helpers ────────────────────────────────────────────────

TEST_CASE("EventBus: typed subscribe receives the concrete event", "[event_bus]") {
    EventBus bus;
    std::string seen_path;
    size_t seen_added = 0;

    subscribe<FileWriteTrackedEvent>(bus, [&](const FileWriteTrackedEvent& ev) {
        seen_path = ev.path;
        seen_added = ev.lines_added;
    });

    FileWriteTrackedEvent ev;
    ev.path = "/tmp/a.txt";
    ev.lines_added = 7;
    bus.publish(ev);

    REQUIRE(seen_path == "/tmp/a.txt");
    REQUIRE(seen_added == 7);
}

TEST_CASE("EventBus: publish_to tolerates a missing bus", "[event_bus]") {
    SessionCreatedEvent ev;
    publish_to(nullptr, ev);

    EventBus bus;
    int count = 0;
    bus.subscribe(SessionCreatedEvent::TAG, [&](const Event&) { count++; });
    publish_to(&bus, ev);
    REQUIRE(count == 1);
}

TEST_CASE("EventBus: handler may subscribe during publish", "[event_bus]") {
    EventBus bus;
    int late = 0;
    bus.subscribe(ToolCallRequestEvent::TAG, [&](const Event&) {
        bus.subscribe(ToolCallResultEvent::TAG, [&](const Event&) { late++; });
    });

    ToolCallRequestEvent request;
    bus.publish(request);
    ToolCallResultEvent result;
    bus.publish(result);
    REQUIRE(late == 1);
}
