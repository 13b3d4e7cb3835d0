#include "channel.hpp"

namespace toolgate {

const char* ready_state_to_string(ReadyState state) {
    switch (state) {
        case ReadyState::Connecting: return "connecting";
        case ReadyState::Open: return "open";
        case ReadyState::Closing: return "closing";
        case ReadyState::Closed: return "closed";
    }
    return "closed";
}

} // namespace toolgate
