#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace toolgate {

enum class EventKind {
    Start,
    StartStep,
    TextStart,
    TextDelta,
    TextEnd,
    ToolInputStart,
    ToolInputDelta,
    ToolInputAvailable,
    ToolApprovalRequest,
    ToolOutputAvailable,
    ToolOutputError,
    ToolOutputDenied,
    FinishStep,
    Finish,
    Error,
    Pong,
    Passthrough,
    Done
};

// Maps a frame "type" string to its kind; anything unrecognized is Passthrough.
EventKind event_kind_from_type(const std::string& type);

constexpr const char* kDoneSentinel = "[DONE]";

// One decoded inbound frame. Never persisted.
struct ProtocolEvent {
    EventKind kind = EventKind::Passthrough;
    std::string type;        // raw "type" value, "[DONE]" for the sentinel
    nlohmann::json payload;  // full decoded object, null for the sentinel

    bool is_turn_finished() const {
        return kind == EventKind::FinishStep || kind == EventKind::Finish;
    }

    // String field from the payload, or empty.
    std::string field(const char* key) const {
        if (payload.is_object() && payload.contains(key) && payload[key].is_string())
            return payload[key].get<std::string>();
        return {};
    }

    std::string tool_call_id() const { return field("toolCallId"); }
    std::string approval_id() const { return field("approvalId"); }
    std::string delta() const { return field("delta"); }

    static ProtocolEvent done() {
        ProtocolEvent ev;
        ev.kind = EventKind::Done;
        ev.type = kDoneSentinel;
        return ev;
    }
};

} // namespace toolgate
