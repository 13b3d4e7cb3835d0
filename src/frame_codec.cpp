#include "frame_codec.hpp"
#include <iostream>

namespace toolgate {

EventKind event_kind_from_type(const std::string& type) {
    if (type == "start") return EventKind::Start;
    if (type == "start-step") return EventKind::StartStep;
    if (type == "text-start") return EventKind::TextStart;
    if (type == "text-delta") return EventKind::TextDelta;
    if (type == "text-end") return EventKind::TextEnd;
    if (type == "tool-input-start") return EventKind::ToolInputStart;
    if (type == "tool-input-delta") return EventKind::ToolInputDelta;
    if (type == "tool-input-available") return EventKind::ToolInputAvailable;
    if (type == "tool-approval-request") return EventKind::ToolApprovalRequest;
    if (type == "tool-output-available") return EventKind::ToolOutputAvailable;
    if (type == "tool-output-error") return EventKind::ToolOutputError;
    if (type == "tool-output-denied") return EventKind::ToolOutputDenied;
    if (type == "finish-step") return EventKind::FinishStep;
    if (type == "finish") return EventKind::Finish;
    if (type == "error") return EventKind::Error;
    if (type == "pong") return EventKind::Pong;
    return EventKind::Passthrough;
}

std::vector<ProtocolEvent> FrameCodec::decode(const std::string& chunk) {
    std::vector<ProtocolEvent> events;
    buffer_ += chunk;

    size_t pos = 0;
    while (pos < buffer_.size()) {
        size_t newline = buffer_.find('\n', pos);
        if (newline == std::string::npos) break;
        decode_line(buffer_.substr(pos, newline - pos), events);
        pos = newline + 1;
    }
    // Keep the incomplete remainder for the next chunk
    buffer_.erase(0, pos);
    return events;
}

std::vector<ProtocolEvent> FrameCodec::flush() {
    std::vector<ProtocolEvent> events;
    if (!buffer_.empty()) {
        std::string line;
        line.swap(buffer_);
        decode_line(std::move(line), events);
    }
    return events;
}

void FrameCodec::reset() {
    buffer_.clear();
}

void FrameCodec::decode_line(std::string line, std::vector<ProtocolEvent>& out) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line.empty() || line[0] == ':') return;

    if (line.rfind("data:", 0) == 0) {
        std::string data = line.substr(line.size() > 5 && line[5] == ' ' ? 6 : 5);
        if (data == kDoneSentinel) {
            out.push_back(ProtocolEvent::done());
            return;
        }
        decode_json(data, out);
        return;
    }

    if (line == kDoneSentinel) {
        out.push_back(ProtocolEvent::done());
        return;
    }
    if (line.rfind("event:", 0) == 0 || line.rfind("id:", 0) == 0 ||
        line.rfind("retry:", 0) == 0) {
        return;
    }
    if (line[0] == '{') {
        decode_json(line, out);
        return;
    }

    ++malformed_count_;
    std::cerr << "[codec] Skipping unrecognized frame: " << line.substr(0, 80) << "\n";
}

bool FrameCodec::decode_json(const std::string& text, std::vector<ProtocolEvent>& out) {
    auto j = nlohmann::json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object() || !j.contains("type") || !j["type"].is_string()) {
        ++malformed_count_;
        std::cerr << "[codec] Skipping malformed frame: " << text.substr(0, 80) << "\n";
        return false;
    }
    ProtocolEvent ev;
    ev.type = j["type"].get<std::string>();
    ev.kind = event_kind_from_type(ev.type);
    ev.payload = std::move(j);
    out.push_back(std::move(ev));
    return true;
}

std::string FrameCodec::encode_frame(const nlohmann::json& payload) {
    return "data: " + payload.dump() + "\n\n";
}

std::string FrameCodec::encode_done() {
    return std::string("data: ") + kDoneSentinel + "\n\n";
}

} // namespace toolgate
