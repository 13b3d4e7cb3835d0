#include "stream_relay.hpp"
#include "event.hpp"

namespace toolgate {

StreamRelay::StreamRelay(std::ostream& out, EventBus& bus)
    : out_(out), bus_(bus)
{}

void StreamRelay::end_line() {
    if (mid_line_) {
        out_ << "\n";
        mid_line_ = false;
    }
}

void StreamRelay::subscribe_events() {
    subscriptions_.clear();
    subscriptions_.push_back(subscribe_scoped<TextDeltaEvent>(bus_,
        [this](const TextDeltaEvent& ev) {
            if (ev.message_id != streaming_message_) {
                end_line();
                streaming_message_ = ev.message_id;
            }
            out_ << ev.delta << std::flush;
            mid_line_ = true;
        }));

    subscriptions_.push_back(subscribe_scoped<ApprovalRequiredEvent>(bus_,
        [this](const ApprovalRequiredEvent& ev) {
            end_line();
            out_ << "[approval] " << ev.tool_name << " " << ev.input_json
                 << " (call " << ev.tool_call_id << ")\n"
                 << "  /approve " << ev.tool_call_id << " or /deny "
                 << ev.tool_call_id << "\n";
        }));

    subscriptions_.push_back(subscribe_scoped<ToolExecutedEvent>(bus_,
        [this](const ToolExecutedEvent& ev) {
            end_line();
            out_ << "[tool] " << ev.tool_name << (ev.success ? " -> " : " failed: ")
                 << ev.output << "\n";
        }));

    subscriptions_.push_back(subscribe_scoped<TurnClosedEvent>(bus_,
        [this](const TurnClosedEvent&) {
            end_line();
            streaming_message_.clear();
        }));

    subscriptions_.push_back(subscribe_scoped<TransportErrorEvent>(bus_,
        [this](const TransportErrorEvent& ev) {
            end_line();
            out_ << "[error] " << error_type_to_string(ev.error.type) << ": "
                 << ev.error.message;
            if (ev.error.retryable()) out_ << " (retryable)";
            out_ << "\n";
        }));

    subscriptions_.push_back(subscribe_scoped<ResendEvent>(bus_,
        [this](const ResendEvent& ev) {
            end_line();
            out_ << "[resend] continuing " << ev.message_id << "\n";
        }));

    subscriptions_.push_back(subscribe_scoped<LatencyEvent>(bus_,
        [this](const LatencyEvent& ev) {
            if (!show_latency_) return;
            end_line();
            out_ << "[latency] " << ev.rtt_ms << " ms\n";
        }));
}

} // namespace toolgate
