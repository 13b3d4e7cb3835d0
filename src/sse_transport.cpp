#include "sse_transport.hpp"
#include "chunk_log.hpp"
#include <iostream>

namespace toolgate {

SseTransport::SseTransport(SseConfig config, HttpClient& http, ChunkLogger* logger)
    : config_(std::move(config)), http_(http), logger_(logger) {}

nlohmann::json SseTransport::build_body(const MessageRequest& request) {
    nlohmann::json body = {
        {"id", request.id},
        {"messages", messages_to_json(request.messages)},
        {"trigger", request.trigger}
    };
    if (request.message_id) body["messageId"] = *request.message_id;
    return body;
}

void SseTransport::dispatch(const ProtocolEvent& event, InboundSequence& sequence) {
    receiver_.observe(event);
    sequence.push(event);
    if (event.kind == EventKind::Done) sequence.close();
}

std::shared_ptr<InboundSequence> SseTransport::send(const MessageRequest& request,
                                                    const SequenceProgress& on_progress) {
    auto sequence = std::make_shared<InboundSequence>(next_sequence_id_++);
    codec_.reset();
    receiver_.reset();

    std::string body = build_body(request).dump();
    if (logger_) logger_->log("out", body);

    std::vector<Header> headers = {
        {"Content-Type", "application/json"},
        {"Accept", "text/event-stream"}
    };
    for (const auto& h : config_.headers) headers.push_back(h);

    bool keep_going = true;
    auto response = http_.post_stream(
        config_.url, body, headers,
        [&](const char* data, size_t len) {
            std::string chunk(data, len);
            if (logger_) logger_->log("in", chunk);
            for (const auto& ev : codec_.decode(chunk)) dispatch(ev, *sequence);
            if (on_progress && !on_progress(*sequence)) keep_going = false;
            return keep_going;
        },
        static_cast<long>(config_.timeout_seconds));

    for (const auto& ev : codec_.flush()) dispatch(ev, *sequence);

    if (response.status_code == 0) {
        sequence->fail(StreamError{ErrorType::Network, "request to " + config_.url + " failed"});
    } else if (response.status_code >= 400) {
        std::string msg = "HTTP " + std::to_string(response.status_code);
        if (!response.body.empty()) msg += ": " + response.body.substr(0, 200);
        sequence->fail(StreamError::from_message(msg));
    } else {
        if (!receiver_.state().turn_closed && keep_going)
            std::cerr << "[sse] Stream ended without a finish event\n";
        sequence->close();
    }
    if (sequence->error())
        std::cerr << "[sse] " << sequence->error()->message << "\n";
    if (on_progress) on_progress(*sequence);
    return sequence;
}

} // namespace toolgate
