#pragma once
#include "errors.hpp"
#include <string>
#include <cstdint>

namespace toolgate {

// Tag-based event dispatch, no RTTI, no dynamic_cast.
// Events are stack-allocated structs; never deleted through base pointer.

struct Event {
    const char* type_tag;
};

// ── Event tags ──────────────────────────────────────────────────

namespace event_tags {
    constexpr const char* ConversationUpdated = "ConversationUpdated";
    constexpr const char* TextDelta           = "TextDelta";
    constexpr const char* ApprovalRequired    = "ApprovalRequired";
    constexpr const char* ToolExecuted        = "ToolExecuted";
    constexpr const char* TurnClosed          = "TurnClosed";
    constexpr const char* TransportError      = "TransportError";
    constexpr const char* Latency             = "Latency";
    constexpr const char* Resend              = "Resend";
} // namespace event_tags

// ── Event structs ───────────────────────────────────────────────

struct ConversationUpdatedEvent : Event {
    static constexpr const char* TAG = event_tags::ConversationUpdated;
    std::string conversation_id;
    uint64_t revision = 0;
    size_t message_count = 0;

    ConversationUpdatedEvent() { type_tag = TAG; }
};

struct TextDeltaEvent : Event {
    static constexpr const char* TAG = event_tags::TextDelta;
    std::string message_id;
    std::string delta;

    TextDeltaEvent() { type_tag = TAG; }
};

struct ApprovalRequiredEvent : Event {
    static constexpr const char* TAG = event_tags::ApprovalRequired;
    std::string tool_call_id;
    std::string approval_id;
    std::string tool_name;
    std::string input_json;

    ApprovalRequiredEvent() { type_tag = TAG; }
};

struct ToolExecutedEvent : Event {
    static constexpr const char* TAG = event_tags::ToolExecuted;
    std::string tool_call_id;
    std::string tool_name;
    bool success = false;
    std::string output;

    ToolExecutedEvent() { type_tag = TAG; }
};

struct TurnClosedEvent : Event {
    static constexpr const char* TAG = event_tags::TurnClosed;
    uint64_t sequence_id = 0;
    bool failed = false;

    TurnClosedEvent() { type_tag = TAG; }
};

struct TransportErrorEvent : Event {
    static constexpr const char* TAG = event_tags::TransportError;
    StreamError error;

    TransportErrorEvent() { type_tag = TAG; }
};

struct LatencyEvent : Event {
    static constexpr const char* TAG = event_tags::Latency;
    int64_t rtt_ms = 0;

    LatencyEvent() { type_tag = TAG; }
};

struct ResendEvent : Event {
    static constexpr const char* TAG = event_tags::Resend;
    std::string message_id;
    size_t message_count = 0;

    ResendEvent() { type_tag = TAG; }
};

} // namespace toolgate
