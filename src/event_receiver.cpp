#include "event_receiver.hpp"
#include <iostream>

namespace toolgate {

EventReceiver::EventReceiver(ReceiverCallbacks callbacks)
    : callbacks_(std::move(callbacks)) {}

void EventReceiver::set_callbacks(ReceiverCallbacks callbacks) {
    callbacks_ = std::move(callbacks);
}

const ProtocolEvent& EventReceiver::observe(const ProtocolEvent& event) {
    switch (event.kind) {
        case EventKind::ToolApprovalRequest:
            state_.approval_pending = true;
            close_signaled_ = false;
            if (callbacks_.on_approval_requested) callbacks_.on_approval_requested(event);
            break;

        case EventKind::FinishStep:
        case EventKind::Finish:
            close_turn();
            break;

        case EventKind::Done:
            if (done_received_) {
                ++duplicate_sentinels_;
                std::cerr << "[receiver] Protocol violation: duplicate [DONE] in one turn, ignoring\n";
                break;
            }
            done_received_ = true;
            close_turn();
            break;

        default:
            break;
    }
    return event;
}

std::vector<ProtocolEvent> EventReceiver::receive(std::vector<ProtocolEvent> events) {
    for (const auto& ev : events) observe(ev);
    return events;
}

void EventReceiver::close_turn() {
    state_.turn_closed = true;
    if (state_.approval_pending && !close_signaled_) {
        close_signaled_ = true;
        if (callbacks_.on_approval_stream_closed) callbacks_.on_approval_stream_closed();
    }
}

void EventReceiver::reset() {
    state_ = ReceiverState{};
    done_received_ = false;
    close_signaled_ = false;
    duplicate_sentinels_ = 0;
}

} // namespace toolgate
