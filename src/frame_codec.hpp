#pragma once
#include "protocol_event.hpp"
#include <string>
#include <vector>
#include <cstddef>

namespace toolgate {

// Decodes newline-delimited frames into protocol events.
//
// Accepted lines:
//   data: {json}      data frame (space after the colon is optional)
//   data: [DONE]      terminal sentinel (a bare [DONE] line is accepted too)
//   {json}            bare control frame, e.g. {"type":"pong","timestamp":...}
// Blank lines, SSE comments (":...") and other SSE fields (event:, id:,
// retry:) are ignored. Partial lines are buffered until the next decode().
class FrameCodec {
public:
    std::vector<ProtocolEvent> decode(const std::string& chunk);

    // Decode whatever remains in the buffer as a final line (end of stream).
    std::vector<ProtocolEvent> flush();

    void reset();

    size_t malformed_count() const { return malformed_count_; }
    size_t buffered_size() const { return buffer_.size(); }

    static std::string encode_frame(const nlohmann::json& payload);
    static std::string encode_done();

private:
    void decode_line(std::string line, std::vector<ProtocolEvent>& out);
    bool decode_json(const std::string& text, std::vector<ProtocolEvent>& out);

    std::string buffer_;
    size_t malformed_count_ = 0;
};

} // namespace toolgate
