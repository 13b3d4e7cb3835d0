#pragma once
#include "channel.hpp"
#include "message.hpp"
#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace toolgate {

constexpr const char* kProtocolVersion = "1.0";

struct MessageRequest {
    std::string id;                          // conversation id
    std::vector<Message> messages;
    std::string trigger = "submit-message";  // or "regenerate-message"
    std::optional<std::string> message_id;
};

struct AudioChunk {
    std::string pcm;        // raw little-endian samples, base64-encoded on the wire
    int sample_rate = 16000;
    int channels = 1;
    int bit_depth = 16;
};

// Builds outbound frames and writes them to the channel it is handed.
// Holds no channel of its own; a send to a missing or non-open channel
// is logged and dropped. No retry, no buffering.
class EventSender {
public:
    bool send_messages(DuplexChannel* channel, const MessageRequest& request) const;
    bool send_tool_result(DuplexChannel* channel, const std::string& tool_call_id,
                          const nlohmann::json& result) const;
    // Function response for a call the backend paused on (confirmation flow).
    bool send_function_response(DuplexChannel* channel, const std::string& tool_call_id,
                                const std::string& tool_name,
                                const nlohmann::json& response) const;
    bool start_audio(DuplexChannel* channel) const;
    bool stop_audio(DuplexChannel* channel) const;
    bool send_audio_chunk(DuplexChannel* channel, const AudioChunk& chunk) const;
    bool interrupt(DuplexChannel* channel,
                   const std::optional<std::string>& reason = std::nullopt) const;
    bool ping(DuplexChannel* channel, int64_t timestamp) const;

    // Frame builders, exposed for tests and the SSE request body.
    static nlohmann::json build_message(const MessageRequest& request, int64_t timestamp);
    static nlohmann::json build_tool_result(const std::string& tool_call_id,
                                            const nlohmann::json& result, int64_t timestamp);
    static nlohmann::json build_function_response(const std::string& tool_call_id,
                                                  const std::string& tool_name,
                                                  const nlohmann::json& response,
                                                  int64_t timestamp);
    static nlohmann::json build_audio_control(const std::string& action, int64_t timestamp);
    static nlohmann::json build_audio_chunk(const AudioChunk& chunk, int64_t timestamp);
    static nlohmann::json build_interrupt(const std::optional<std::string>& reason,
                                          int64_t timestamp);
    static nlohmann::json build_ping(int64_t timestamp);

private:
    bool write(DuplexChannel* channel, const nlohmann::json& frame) const;
};

} // namespace toolgate
