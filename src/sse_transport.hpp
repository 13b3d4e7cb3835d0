#pragma once
#include "config.hpp"
#include "event_receiver.hpp"
#include "event_sender.hpp"
#include "frame_codec.hpp"
#include "http.hpp"
#include "inbound_sequence.hpp"
#include <functional>
#include <memory>

namespace toolgate {

class ChunkLogger;

// Called after each decoded chunk with the sequence being filled.
// Return false to abort the response stream.
using SequenceProgress = std::function<bool(InboundSequence& sequence)>;

// Unidirectional transport: every turn is an HTTP POST of the whole
// conversation answered by an event stream. Each call opens a new sequence.
class SseTransport {
public:
    SseTransport(SseConfig config, HttpClient& http, ChunkLogger* logger = nullptr);

    std::shared_ptr<InboundSequence> send(const MessageRequest& request,
                                          const SequenceProgress& on_progress = {});

    const EventReceiver& receiver() const { return receiver_; }
    const FrameCodec& codec() const { return codec_; }
    uint64_t sequences_opened() const { return next_sequence_id_ - 1; }

    static nlohmann::json build_body(const MessageRequest& request);

private:
    void dispatch(const ProtocolEvent& event, InboundSequence& sequence);

    SseConfig config_;
    HttpClient& http_;
    ChunkLogger* logger_;
    FrameCodec codec_;
    EventReceiver receiver_;
    uint64_t next_sequence_id_ = 1;
};

} // namespace toolgate
