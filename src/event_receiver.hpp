#pragma once
#include "protocol_event.hpp"
#include <functional>
#include <vector>
#include <cstddef>

namespace toolgate {

struct ReceiverState {
    bool approval_pending = false;
    bool turn_closed = false;
};

struct ReceiverCallbacks {
    // Fired once per tool-approval-request event.
    std::function<void(const ProtocolEvent&)> on_approval_requested;
    // Fired once per approval cycle when the backend closes the turn.
    std::function<void()> on_approval_stream_closed;
};

// Observes decoded events, tracks approval/turn state and forwards every
// event unchanged. Content is never filtered.
class EventReceiver {
public:
    EventReceiver() = default;
    explicit EventReceiver(ReceiverCallbacks callbacks);

    void set_callbacks(ReceiverCallbacks callbacks);

    // Update state for one event and return it for forwarding.
    const ProtocolEvent& observe(const ProtocolEvent& event);

    std::vector<ProtocolEvent> receive(std::vector<ProtocolEvent> events);

    const ReceiverState& state() const { return state_; }
    size_t duplicate_sentinels() const { return duplicate_sentinels_; }

    // Clears all state; called when a new turn begins.
    void reset();

private:
    void close_turn();

    ReceiverCallbacks callbacks_;
    ReceiverState state_;
    bool done_received_ = false;
    bool close_signaled_ = false;
    size_t duplicate_sentinels_ = 0;
};

} // namespace toolgate
