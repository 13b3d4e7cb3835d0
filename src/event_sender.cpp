#include "event_sender.hpp"
#include "util.hpp"
#include <iostream>

namespace toolgate {

static nlohmann::json envelope(const char* type, int64_t timestamp) {
    return {{"type", type}, {"version", kProtocolVersion}, {"timestamp", timestamp}};
}

nlohmann::json EventSender::build_message(const MessageRequest& request, int64_t timestamp) {
    auto j = envelope("message", timestamp);
    j["id"] = request.id;
    j["messages"] = messages_to_json(request.messages);
    j["trigger"] = request.trigger;
    if (request.message_id) j["messageId"] = *request.message_id;
    return j;
}

nlohmann::json EventSender::build_tool_result(const std::string& tool_call_id,
                                              const nlohmann::json& result,
                                              int64_t timestamp) {
    auto j = envelope("tool_result", timestamp);
    j["toolCallId"] = tool_call_id;
    j["result"] = result;
    return j;
}

nlohmann::json EventSender::build_function_response(const std::string& tool_call_id,
                                                    const std::string& tool_name,
                                                    const nlohmann::json& response,
                                                    int64_t timestamp) {
    auto j = envelope("message", timestamp);
    nlohmann::json part = {
        {"type", "tool-result"},
        {"toolCallId", tool_call_id},
        {"toolName", tool_name},
        {"result", response}
    };
    j["messages"] = nlohmann::json::array({
        {{"id", "fr-" + std::to_string(timestamp)},
         {"role", "user"},
         {"content", nlohmann::json::array({part})}}
    });
    j["trigger"] = "submit-message";
    return j;
}

nlohmann::json EventSender::build_audio_control(const std::string& action, int64_t timestamp) {
    auto j = envelope("audio_control", timestamp);
    j["action"] = action;
    return j;
}

nlohmann::json EventSender::build_audio_chunk(const AudioChunk& chunk, int64_t timestamp) {
    auto j = envelope("audio_chunk", timestamp);
    j["chunk"] = base64_encode(chunk.pcm);
    j["sampleRate"] = chunk.sample_rate;
    j["channels"] = chunk.channels;
    j["bitDepth"] = chunk.bit_depth;
    return j;
}

nlohmann::json EventSender::build_interrupt(const std::optional<std::string>& reason,
                                            int64_t timestamp) {
    auto j = envelope("interrupt", timestamp);
    if (reason) j["reason"] = *reason;
    return j;
}

nlohmann::json EventSender::build_ping(int64_t timestamp) {
    return envelope("ping", timestamp);
}

// ── Senders ─────────────────────────────────────────────────────

bool EventSender::write(DuplexChannel* channel, const nlohmann::json& frame) const {
    if (!channel || channel->ready_state() != ReadyState::Open) {
        std::cerr << "[sender] Channel not open, dropping " << frame.value("type", "?")
                  << " event\n";
        return false;
    }
    return channel->send_text(frame.dump());
}

bool EventSender::send_messages(DuplexChannel* channel, const MessageRequest& request) const {
    return write(channel, build_message(request, epoch_millis()));
}

bool EventSender::send_tool_result(DuplexChannel* channel, const std::string& tool_call_id,
                                   const nlohmann::json& result) const {
    return write(channel, build_tool_result(tool_call_id, result, epoch_millis()));
}

bool EventSender::send_function_response(DuplexChannel* channel,
                                         const std::string& tool_call_id,
                                         const std::string& tool_name,
                                         const nlohmann::json& response) const {
    return write(channel, build_function_response(tool_call_id, tool_name, response,
                                                  epoch_millis()));
}

bool EventSender::start_audio(DuplexChannel* channel) const {
    return write(channel, build_audio_control("start", epoch_millis()));
}

bool EventSender::stop_audio(DuplexChannel* channel) const {
    return write(channel, build_audio_control("stop", epoch_millis()));
}

bool EventSender::send_audio_chunk(DuplexChannel* channel, const AudioChunk& chunk) const {
    return write(channel, build_audio_chunk(chunk, epoch_millis()));
}

bool EventSender::interrupt(DuplexChannel* channel,
                            const std::optional<std::string>& reason) const {
    return write(channel, build_interrupt(reason, epoch_millis()));
}

bool EventSender::ping(DuplexChannel* channel, int64_t timestamp) const {
    return write(channel, build_ping(timestamp));
}

} // namespace toolgate
