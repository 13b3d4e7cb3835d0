#pragma once
#include "event_bus.hpp"
#include <ostream>
#include <string>
#include <vector>

namespace toolgate {

// Renders bus events as terminal lines: streamed text inline, approvals,
// tool runs and transport errors on lines of their own.
class StreamRelay {
public:
    StreamRelay(std::ostream& out, EventBus& bus);

    // Subscriptions live as long as the relay; calling again replaces them.
    void subscribe_events();

    void set_show_latency(bool show) { show_latency_ = show; }

private:
    void end_line();

    std::ostream& out_;
    EventBus& bus_;
    std::vector<ScopedSubscription> subscriptions_;
    std::string streaming_message_;
    bool mid_line_ = false;
    bool show_latency_ = false;
};

} // namespace toolgate
