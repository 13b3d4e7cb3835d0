#include "inbound_sequence.hpp"

namespace toolgate {

bool InboundSequence::push(ProtocolEvent event) {
    if (finished()) return false;
    queue_.push_back(std::move(event));
    ++received_;
    return true;
}

std::optional<ProtocolEvent> InboundSequence::next() {
    if (queue_.empty()) return std::nullopt;
    ProtocolEvent ev = std::move(queue_.front());
    queue_.pop_front();
    return ev;
}

std::vector<ProtocolEvent> InboundSequence::drain() {
    std::vector<ProtocolEvent> out(std::make_move_iterator(queue_.begin()),
                                   std::make_move_iterator(queue_.end()));
    queue_.clear();
    return out;
}

void InboundSequence::close() {
    if (status_ == SequenceStatus::Open) status_ = SequenceStatus::Closed;
}

void InboundSequence::fail(StreamError error) {
    if (finished()) return;
    status_ = SequenceStatus::Failed;
    error_ = std::move(error);
}

} // namespace toolgate
