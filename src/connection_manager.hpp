#pragma once
#include "channel.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "event_receiver.hpp"
#include "event_sender.hpp"
#include "frame_codec.hpp"
#include "inbound_sequence.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <cstdint>

namespace toolgate {

using ChannelFactory = std::function<std::shared_ptr<DuplexChannel>()>;

// Millisecond clock; injectable so tests can drive timeouts.
using Clock = std::function<int64_t()>;

// Writes one outbound frame on an open channel; false if the write failed.
using FrameWriter = std::function<bool(DuplexChannel* channel)>;

struct ConnectionCallbacks {
    std::function<void(const StreamError&)> on_error;
    std::function<void(int64_t rtt_ms)> on_latency;
    std::function<void(const ProtocolEvent&)> on_approval_requested;
};

// Owns the duplex channel and the per-turn inbound sequence.
//
// A new sequence is opened for a turn when there is none yet, when the
// previous one is finished, or when the receiver saw the turn close.
// Otherwise the backend is still writing to the current sequence (it paused
// for an approval) and that sequence is reused.
class ConnectionManager {
public:
    ConnectionManager(BidiConfig config, ChannelFactory factory, Clock clock = {});
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    void set_callbacks(ConnectionCallbacks callbacks);

    // Create and connect the channel if there is no open one.
    bool ensure_open(std::string& error);

    // Select (or create) the sequence for this turn and send the request.
    std::shared_ptr<InboundSequence> begin_turn(const MessageRequest& request);

    // Send a frame the backend answers with a new turn of its own (a tool
    // result or a confirmation response). The sequence is selected exactly
    // as in begin_turn, so a reply to a closed turn gets a fresh one.
    // Returns null when the channel is not open or the write failed.
    std::shared_ptr<InboundSequence> send_followup(const FrameWriter& write);

    // One loop iteration: read, decode, dispatch, keepalive, timeout.
    // Returns false when no open channel remains.
    bool pump(int timeout_ms);

    // Fail the pending approval cycle if its deadline passed.
    bool check_timeout();

    void interrupt(const std::optional<std::string>& reason = std::nullopt);
    void close();

    std::shared_ptr<InboundSequence> current_sequence() const { return current_; }
    std::shared_ptr<DuplexChannel> channel() const { return channel_; }
    const EventReceiver& receiver() const { return receiver_; }
    const EventSender& sender() const { return sender_; }
    const FrameCodec& codec() const { return codec_; }

    bool timeout_armed() const { return deadline_.has_value(); }
    uint64_t sequences_opened() const { return next_sequence_id_ - 1; }

private:
    std::shared_ptr<InboundSequence> select_sequence();
    void on_message(const std::string& text);
    void dispatch(const ProtocolEvent& event);
    void arm_timeout();
    void disarm_timeout();
    void maybe_ping();
    void report(const StreamError& error);

    BidiConfig config_;
    ChannelFactory factory_;
    Clock clock_;
    ConnectionCallbacks callbacks_;

    std::shared_ptr<DuplexChannel> channel_;
    FrameCodec codec_;
    EventReceiver receiver_;
    EventSender sender_;

    std::shared_ptr<InboundSequence> current_;
    uint64_t next_sequence_id_ = 1;

    std::optional<int64_t> deadline_;
    int64_t last_ping_sent_ = 0;
    std::optional<int64_t> outstanding_ping_;
};

} // namespace toolgate
