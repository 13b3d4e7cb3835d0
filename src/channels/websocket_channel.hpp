#pragma once
#include "../channel.hpp"
#include <memory>
#include <string>
#include <cstdint>

namespace toolgate {

class SocketConnection;

namespace ws {

constexpr uint8_t kContinuation = 0x0;
constexpr uint8_t kText         = 0x1;
constexpr uint8_t kBinary       = 0x2;
constexpr uint8_t kClose        = 0x8;
constexpr uint8_t kPing         = 0x9;
constexpr uint8_t kPong         = 0xA;

constexpr uint64_t kDefaultMaxMessageBytes = 16 * 1024 * 1024;

// decode_frame result for a frame whose declared length exceeds the cap.
constexpr long kFrameTooLarge = -2;

struct Frame {
    bool fin = true;
    uint8_t opcode = kText;
    std::string payload;
};

// Client frames are masked; pass nullptr to produce an unmasked (server) frame.
std::string encode_frame(uint8_t opcode, const std::string& payload,
                         const uint8_t* mask_key);

// Decode one frame from the front of buf. Returns bytes consumed,
// 0 if more data is needed, -1 on a protocol error, or kFrameTooLarge
// as soon as the header declares more than max_payload bytes.
long decode_frame(const std::string& buf, Frame& out,
                  uint64_t max_payload = kDefaultMaxMessageBytes);

// Joins fragmented data frames into messages of at most max_bytes.
class MessageAssembler {
public:
    enum class Status { Pending, Complete, TooLarge };

    explicit MessageAssembler(uint64_t max_bytes) : max_bytes_(max_bytes) {}

    // Takes a text, binary or continuation frame. On Complete, message holds
    // the joined payload. A stray continuation is dropped as Pending.
    Status add(Frame& frame, std::string& message);
    void reset();

private:
    uint64_t max_bytes_;
    std::string fragments_;
    bool in_fragment_ = false;
};

// Sec-WebSocket-Accept value for a client key (RFC 6455 §4.2.2).
std::string accept_key(const std::string& client_key);

} // namespace ws

// RFC 6455 client over POSIX sockets, TLS for wss:// via OpenSSL.
class WebSocketChannel : public DuplexChannel {
public:
    WebSocketChannel(std::string url, uint32_t connect_timeout_ms,
                     uint64_t max_message_bytes = ws::kDefaultMaxMessageBytes);
    ~WebSocketChannel() override;

    std::string channel_name() const override { return "websocket"; }
    ReadyState ready_state() const override { return state_; }
    bool connect(std::string& error) override;
    bool send_text(const std::string& text) override;
    bool poll(int timeout_ms, const TextMessageCallback& on_message) override;
    void close(uint16_t code = 1000, const std::string& reason = "") override;

private:
    bool handshake(const std::string& host_header, const std::string& path,
                   std::string& error);
    bool send_frame(uint8_t opcode, const std::string& payload);
    void process_frames(const TextMessageCallback& on_message);

    std::string url_;
    uint32_t connect_timeout_ms_;
    std::unique_ptr<SocketConnection> conn_;
    ReadyState state_ = ReadyState::Closed;

    uint64_t max_message_bytes_;

    std::string rx_;
    ws::MessageAssembler assembler_;
};

} // namespace toolgate
