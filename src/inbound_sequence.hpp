#pragma once
#include "protocol_event.hpp"
#include "errors.hpp"
#include <deque>
#include <optional>
#include <vector>
#include <cstdint>

namespace toolgate {

enum class SequenceStatus { Open, Closed, Failed };

// Readable sequence of events for one turn. Events queued before close()
// or fail() remain readable; pushes after that are dropped.
class InboundSequence {
public:
    explicit InboundSequence(uint64_t id) : id_(id) {}

    uint64_t id() const { return id_; }

    bool push(ProtocolEvent event);
    std::optional<ProtocolEvent> next();
    std::vector<ProtocolEvent> drain();
    bool has_pending() const { return !queue_.empty(); }

    void close();
    void fail(StreamError error);

    SequenceStatus status() const { return status_; }
    bool finished() const { return status_ != SequenceStatus::Open; }
    const std::optional<StreamError>& error() const { return error_; }
    uint64_t received_count() const { return received_; }

private:
    uint64_t id_;
    std::deque<ProtocolEvent> queue_;
    SequenceStatus status_ = SequenceStatus::Open;
    std::optional<StreamError> error_;
    uint64_t received_ = 0;
};

} // namespace toolgate
