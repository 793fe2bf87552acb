#pragma once
#include "errors.hpp"
#include "provider.hpp"
#include <string>
#include <cstdint>

namespace tooledchat {

// Tag-based event dispatch without RTTI or dynamic_cast.
// Events are stack-allocated structs; never deleted through base pointer.

struct Event {
    const char* type_tag;
};

// ── Event tags ──────────────────────────────────────────────────

namespace event_tags {
    constexpr const char* TurnStarted     = "TurnStarted";
    constexpr const char* ModelRequest    = "ModelRequest";
    constexpr const char* ModelResponse   = "ModelResponse";
    constexpr const char* ToolCallRequest = "ToolCallRequest";
    constexpr const char* ToolCallResult  = "ToolCallResult";
    constexpr const char* TurnCompleted   = "TurnCompleted";
    constexpr const char* SessionCreated  = "SessionCreated";
    constexpr const char* SessionEvicted  = "SessionEvicted";
} // namespace event_tags

// ── Event structs ───────────────────────────────────────────────

struct TurnStartedEvent : Event {
    static constexpr const char* TAG = event_tags::TurnStarted;
    std::string session_id;
    std::string user_text;
    size_t tool_count = 0;

    TurnStartedEvent() { type_tag = TAG; }
};

struct ModelRequestEvent : Event {
    static constexpr const char* TAG = event_tags::ModelRequest;
    std::string session_id;
    std::string model;
    size_t message_count = 0;
    uint32_t iteration = 0;

    ModelRequestEvent() { type_tag = TAG; }
};

struct ModelResponseEvent : Event {
    static constexpr const char* TAG = event_tags::ModelResponse;
    std::string session_id;
    std::string model;
    bool has_directive = false;
    TokenUsage usage;
    uint64_t latency_ms = 0;

    ModelResponseEvent() { type_tag = TAG; }
};

struct ToolCallRequestEvent : Event {
    static constexpr const char* TAG = event_tags::ToolCallRequest;
    std::string session_id;
    std::string tool_name;
    std::string raw_parameters;

    ToolCallRequestEvent() { type_tag = TAG; }
};

struct ToolCallResultEvent : Event {
    static constexpr const char* TAG = event_tags::ToolCallResult;
    std::string session_id;
    std::string tool_name;
    bool success = false;
    ErrorKind error_kind = ErrorKind::Unknown; // meaningful only when !success
    uint64_t duration_ms = 0;

    ToolCallResultEvent() { type_tag = TAG; }
};

struct TurnCompletedEvent : Event {
    static constexpr const char* TAG = event_tags::TurnCompleted;
    std::string session_id;
    bool success = false;
    ErrorKind error_kind = ErrorKind::Unknown; // meaningful only when !success
    uint32_t tool_calls = 0;
    uint64_t duration_ms = 0;

    TurnCompletedEvent() { type_tag = TAG; }
};

struct SessionCreatedEvent : Event {
    static constexpr const char* TAG = event_tags::SessionCreated;
    std::string session_id;

    SessionCreatedEvent() { type_tag = TAG; }
};

struct SessionEvictedEvent : Event {
    static constexpr const char* TAG = event_tags::SessionEvicted;
    std::string session_id;

    SessionEvictedEvent() { type_tag = TAG; }
};

} // namespace tooledchat
