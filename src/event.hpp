#pragma once
#include <cstdint>
#include <string>

namespace toolcore {

// Tag-based event dispatch without RTTI. Events are stack-allocated structs
// and never deleted through a base pointer.

struct Event {
    const char* type_tag;
};

// ── Event tags ──────────────────────────────────────────────────

namespace event_tags {
    constexpr const char* ToolCallRequest  = "ToolCallRequest";
    constexpr const char* ToolCallResult   = "ToolCallResult";
    constexpr const char* FileWriteTracked = "FileWriteTracked";
    constexpr const char* SessionCreated   = "SessionCreated";
    constexpr const char* SessionEvicted   = "SessionEvicted";
} // namespace event_tags

// ── Event structs ───────────────────────────────────────────────

// Published once a call's name resolved, before parsing its arguments.
struct ToolCallRequestEvent : Event {
    static constexpr const char* TAG = event_tags::ToolCallRequest;
    std::string session_id;
    std::string tool_call_id;
    std::string tool_name;

    ToolCallRequestEvent() { type_tag = TAG; }
};

struct ToolCallResultEvent : Event {
    static constexpr const char* TAG = event_tags::ToolCallResult;
    std::string session_id;
    std::string tool_call_id;
    std::string tool_name;
    std::string status; // ToolCallStatus as text
    bool success = false;

    ToolCallResultEvent() { type_tag = TAG; }
};

// Line statistics after a successful fsWrite.
struct FileWriteTrackedEvent : Event {
    static constexpr const char* TAG = event_tags::FileWriteTracked;
    std::string session_id;
    std::string path;
    int64_t lines_by_user = 0;
    int64_t lines_by_agent = 0;
    size_t lines_added = 0;
    size_t lines_removed = 0;

    FileWriteTrackedEvent() { type_tag = TAG; }
};

struct SessionCreatedEvent : Event {
    static constexpr const char* TAG = event_tags::SessionCreated;
    std::string session_id;

    SessionCreatedEvent() { type_tag = TAG; }
};

struct SessionEvictedEvent : Event {
    static constexpr const char* TAG = event_tags::SessionEvicted;
    std::string session_id;
    size_t tracked_files = 0;

    SessionEvictedEvent() { type_tag = TAG; }
};

} // namespace toolcore
