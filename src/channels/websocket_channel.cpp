#include "websocket_channel.hpp"
#include "../socket_connection.hpp"
#include "../util.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <algorithm>
#include <cctype>
#include <iostream>
#include <stdexcept>

namespace toolgate {

namespace ws {

std::string encode_frame(uint8_t opcode, const std::string& payload,
                         const uint8_t* mask_key) {
    std::string out;
    out.reserve(payload.size() + 14);
    out += static_cast<char>(0x80 | (opcode & 0x0F));

    uint8_t mask_bit = mask_key ? 0x80 : 0x00;
    uint64_t len = payload.size();
    if (len < 126) {
        out += static_cast<char>(mask_bit | static_cast<uint8_t>(len));
    } else if (len <= 0xFFFF) {
        out += static_cast<char>(mask_bit | 126);
        out += static_cast<char>((len >> 8) & 0xFF);
        out += static_cast<char>(len & 0xFF);
    } else {
        out += static_cast<char>(mask_bit | 127);
        for (int shift = 56; shift >= 0; shift -= 8)
            out += static_cast<char>((len >> shift) & 0xFF);
    }

    if (!mask_key) {
        out += payload;
        return out;
    }
    out.append(reinterpret_cast<const char*>(mask_key), 4);
    for (size_t i = 0; i < payload.size(); ++i)
        out += static_cast<char>(payload[i] ^ mask_key[i % 4]);
    return out;
}

long decode_frame(const std::string& buf, Frame& out, uint64_t max_payload) {
    if (buf.size() < 2) return 0;
    auto byte = [&buf](size_t i) { return static_cast<uint8_t>(buf[i]); };

    uint8_t b0 = byte(0);
    uint8_t b1 = byte(1);
    if (b0 & 0x70) return -1; // no extensions negotiated

    size_t pos = 2;
    uint64_t len = b1 & 0x7F;
    if (len == 126) {
        if (buf.size() < pos + 2) return 0;
        len = (static_cast<uint64_t>(byte(2)) << 8) | byte(3);
        pos += 2;
    } else if (len == 127) {
        if (buf.size() < pos + 8) return 0;
        len = 0;
        for (size_t i = 0; i < 8; ++i) len = (len << 8) | byte(2 + i);
        pos += 8;
        if (len > (static_cast<uint64_t>(1) << 40)) return -1;
    }
    if (len > max_payload) return kFrameTooLarge;

    bool masked = (b1 & 0x80) != 0;
    uint8_t mask[4] = {0, 0, 0, 0};
    if (masked) {
        if (buf.size() < pos + 4) return 0;
        for (size_t i = 0; i < 4; ++i) mask[i] = byte(pos + i);
        pos += 4;
    }
    if (buf.size() < pos + len) return 0;

    out.fin = (b0 & 0x80) != 0;
    out.opcode = b0 & 0x0F;
    out.payload = buf.substr(pos, static_cast<size_t>(len));
    if (masked) {
        for (size_t i = 0; i < out.payload.size(); ++i)
            out.payload[i] = static_cast<char>(out.payload[i] ^ mask[i % 4]);
    }
    return static_cast<long>(pos + len);
}

MessageAssembler::Status MessageAssembler::add(Frame& frame, std::string& message) {
    if (frame.opcode == kContinuation) {
        if (!in_fragment_) return Status::Pending;
        if (fragments_.size() + frame.payload.size() > max_bytes_) {
            reset();
            return Status::TooLarge;
        }
        fragments_ += frame.payload;
        if (!frame.fin) return Status::Pending;
        in_fragment_ = false;
        message.clear();
        message.swap(fragments_);
        return Status::Complete;
    }
    if (frame.payload.size() > max_bytes_) {
        reset();
        return Status::TooLarge;
    }
    if (frame.fin) {
        // A complete data frame inside a fragmented message is a protocol
        // violation on the peer's side; drop the partial message.
        reset();
        message = std::move(frame.payload);
        return Status::Complete;
    }
    fragments_ = std::move(frame.payload);
    in_fragment_ = true;
    return Status::Pending;
}

void MessageAssembler::reset() {
    fragments_.clear();
    in_fragment_ = false;
}

std::string accept_key(const std::string& client_key) {
    static const char* kGuid = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";
    std::string input = client_key + kGuid;
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_Digest(input.data(), input.size(), digest, &digest_len, EVP_sha1(), nullptr) != 1)
        throw std::runtime_error("SHA-1 digest failed");
    return base64_encode(std::string(reinterpret_cast<char*>(digest), digest_len));
}

} // namespace ws

WebSocketChannel::WebSocketChannel(std::string url, uint32_t connect_timeout_ms,
                                   uint64_t max_message_bytes)
    : url_(std::move(url)), connect_timeout_ms_(connect_timeout_ms),
      max_message_bytes_(max_message_bytes), assembler_(max_message_bytes) {}

WebSocketChannel::~WebSocketChannel() {
    close();
}

bool WebSocketChannel::connect(std::string& error) {
    ParsedUrl url;
    try {
        url = parse_url(url_);
    } catch (const std::invalid_argument& e) {
        error = e.what();
        return false;
    }
    if (url.scheme != "ws" && url.scheme != "wss") {
        error = "not a WebSocket URL: " + url_;
        return false;
    }

    state_ = ReadyState::Connecting;
    rx_.clear();
    assembler_.reset();

    conn_ = std::make_unique<SocketConnection>();
    conn_->set_abortable(false);
    long timeout_secs = std::max<long>(1, (connect_timeout_ms_ + 999) / 1000);
    if (!conn_->connect(url, timeout_secs)) {
        error = "connection to " + url.host + ":" + url.port + " failed";
        conn_.reset();
        state_ = ReadyState::Closed;
        return false;
    }

    bool default_port = (url.tls && url.port == "443") || (!url.tls && url.port == "80");
    std::string host_header = default_port ? url.host : url.host + ":" + url.port;
    if (!handshake(host_header, url.path, error)) {
        conn_.reset();
        state_ = ReadyState::Closed;
        return false;
    }

    state_ = ReadyState::Open;
    return true;
}

bool WebSocketChannel::handshake(const std::string& host_header, const std::string& path,
                                 std::string& error) {
    unsigned char nonce[16];
    if (RAND_bytes(nonce, sizeof(nonce)) != 1) {
        error = "failed to generate WebSocket key";
        return false;
    }
    std::string key = base64_encode(std::string(reinterpret_cast<char*>(nonce), sizeof(nonce)));

    std::string req;
    req += "GET " + path + " HTTP/1.1\r\n";
    req += "Host: " + host_header + "\r\n";
    req += "Upgrade: websocket\r\n";
    req += "Connection: Upgrade\r\n";
    req += "Sec-WebSocket-Key: " + key + "\r\n";
    req += "Sec-WebSocket-Version: 13\r\n\r\n";
    if (!conn_->write_all(req.data(), req.size())) {
        error = "failed to send WebSocket handshake";
        return false;
    }

    size_t header_end;
    while ((header_end = rx_.find("\r\n\r\n")) == std::string::npos) {
        if (rx_.size() > 16384) {
            error = "WebSocket handshake response too large";
            return false;
        }
        char buf[4096];
        ssize_t n = conn_->read_some(buf, sizeof(buf));
        if (n <= 0) {
            error = "connection closed during WebSocket handshake";
            return false;
        }
        rx_.append(buf, static_cast<size_t>(n));
    }

    std::string head = rx_.substr(0, header_end);
    rx_.erase(0, header_end + 4); // frames may follow the handshake

    auto lines = split(head, '\n');
    if (lines.empty() || lines[0].find(" 101") == std::string::npos) {
        error = "WebSocket upgrade rejected: " + (lines.empty() ? "" : trim(lines[0]));
        return false;
    }

    std::string expected = ws::accept_key(key);
    for (size_t i = 1; i < lines.size(); ++i) {
        size_t colon = lines[i].find(':');
        if (colon == std::string::npos) continue;
        std::string name = lines[i].substr(0, colon);
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (name == "sec-websocket-accept") {
            if (trim(lines[i].substr(colon + 1)) == expected) return true;
            error = "Sec-WebSocket-Accept mismatch";
            return false;
        }
    }
    error = "missing Sec-WebSocket-Accept header";
    return false;
}

bool WebSocketChannel::send_frame(uint8_t opcode, const std::string& payload) {
    if (!conn_) return false;
    uint8_t mask[4];
    if (RAND_bytes(mask, sizeof(mask)) != 1) return false;
    std::string frame = ws::encode_frame(opcode, payload, mask);
    if (!conn_->write_all(frame.data(), frame.size())) {
        std::cerr << "[ws] Write failed, closing\n";
        state_ = ReadyState::Closed;
        return false;
    }
    return true;
}

bool WebSocketChannel::send_text(const std::string& text) {
    if (state_ != ReadyState::Open) return false;
    return send_frame(ws::kText, text);
}

bool WebSocketChannel::poll(int timeout_ms, const TextMessageCallback& on_message) {
    if (!conn_ || (state_ != ReadyState::Open && state_ != ReadyState::Closing))
        return false;

    process_frames(on_message);
    if (state_ == ReadyState::Closed) return false;

    if (conn_->wait_readable(timeout_ms)) {
        char buf[8192];
        ssize_t n = conn_->read_some(buf, sizeof(buf));
        if (n <= 0) {
            state_ = ReadyState::Closed;
            return false;
        }
        rx_.append(buf, static_cast<size_t>(n));
        process_frames(on_message);
    }
    return state_ == ReadyState::Open;
}

void WebSocketChannel::process_frames(const TextMessageCallback& on_message) {
    while (state_ != ReadyState::Closed) {
        ws::Frame frame;
        long used = ws::decode_frame(rx_, frame, max_message_bytes_);
        if (used == 0) return;
        if (used == ws::kFrameTooLarge) {
            std::cerr << "[ws] Inbound frame exceeds " << max_message_bytes_
                      << " bytes, closing\n";
            close(1009, "message too big");
            return;
        }
        if (used < 0) {
            std::cerr << "[ws] Protocol error in inbound frame, closing\n";
            close(1002, "protocol error");
            return;
        }
        rx_.erase(0, static_cast<size_t>(used));

        switch (frame.opcode) {
            case ws::kText:
            case ws::kBinary:
            case ws::kContinuation: {
                std::string message;
                auto status = assembler_.add(frame, message);
                if (status == ws::MessageAssembler::Status::TooLarge) {
                    std::cerr << "[ws] Inbound message exceeds " << max_message_bytes_
                              << " bytes, closing\n";
                    close(1009, "message too big");
                    return;
                }
                if (status == ws::MessageAssembler::Status::Complete)
                    on_message(message);
                break;
            }
            case ws::kPing:
                send_frame(ws::kPong, frame.payload);
                break;
            case ws::kPong:
                break;
            case ws::kClose:
                if (state_ == ReadyState::Open) send_frame(ws::kClose, frame.payload.substr(0, 2));
                state_ = ReadyState::Closed;
                conn_.reset();
                return;
            default:
                std::cerr << "[ws] Ignoring frame with opcode " << int(frame.opcode) << "\n";
                break;
        }
    }
}

void WebSocketChannel::close(uint16_t code, const std::string& reason) {
    if (!conn_) {
        state_ = ReadyState::Closed;
        return;
    }
    if (state_ == ReadyState::Open) {
        state_ = ReadyState::Closing;
        std::string payload;
        payload += static_cast<char>((code >> 8) & 0xFF);
        payload += static_cast<char>(code & 0xFF);
        payload += reason.substr(0, 123);
        send_frame(ws::kClose, payload);
    }
    state_ = ReadyState::Closed;
    conn_.reset();
}

} // namespace toolgate
