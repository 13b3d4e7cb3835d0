#include <catch2/catch.hpp>
#include "channels/websocket_channel.hpp"
#include "socket_connection.hpp"
#include <cstdint>
#include <stdexcept>

using namespace toolgate;

TEST_CASE("ws::accept_key: RFC 6455 sample", "[websocket]") {
    REQUIRE(ws::accept_key("dGhlIHNhbXBsZSBub25jZQ==") == "s3pPLMBiTxaQ9kYGJRzPxK0mc4s=");
}

TEST_CASE("ws::encode_frame: unmasked short text", "[websocket]") {
    std::string frame = ws::encode_frame(ws::kText, "Hello", nullptr);
    REQUIRE(frame.size() == 7);
    REQUIRE(static_cast<uint8_t>(frame[0]) == 0x81);
    REQUIRE(static_cast<uint8_t>(frame[1]) == 0x05);
    REQUIRE(frame.substr(2) == "Hello");
}

TEST_CASE("ws::encode_frame: client frames are masked", "[websocket]") {
    const uint8_t mask[4] = {0x37, 0xfa, 0x21, 0x3d};
    std::string frame = ws::encode_frame(ws::kText, "Hello", mask);

    // RFC 6455 §5.7 masked "Hello"
    const uint8_t expected[] = {0x81, 0x85, 0x37, 0xfa, 0x21, 0x3d,
                                0x7f, 0x9f, 0x4d, 0x51, 0x58};
    REQUIRE(frame == std::string(reinterpret_cast<const char*>(expected), sizeof(expected)));

    ws::Frame out;
    REQUIRE(ws::decode_frame(frame, out) == static_cast<long>(frame.size()));
    REQUIRE(out.payload == "Hello");
    REQUIRE(out.fin);
    REQUIRE(out.opcode == ws::kText);
}

TEST_CASE("ws::encode_frame: extended payload lengths", "[websocket]") {
    std::string medium(300, 'a');
    std::string frame = ws::encode_frame(ws::kBinary, medium, nullptr);
    REQUIRE(static_cast<uint8_t>(frame[1]) == 126);
    REQUIRE(frame.size() == 4 + medium.size());

    std::string large(70000, 'b');
    frame = ws::encode_frame(ws::kText, large, nullptr);
    REQUIRE(static_cast<uint8_t>(frame[1]) == 127);
    REQUIRE(frame.size() == 10 + large.size());

    ws::Frame out;
    REQUIRE(ws::decode_frame(frame, out) == static_cast<long>(frame.size()));
    REQUIRE(out.payload.size() == large.size());
}

TEST_CASE("ws::decode_frame: incomplete input needs more data", "[websocket]") {
    std::string frame = ws::encode_frame(ws::kText, "partial payload", nullptr);
    ws::Frame out;
    REQUIRE(ws::decode_frame("", out) == 0);
    REQUIRE(ws::decode_frame(frame.substr(0, 1), out) == 0);
    REQUIRE(ws::decode_frame(frame.substr(0, frame.size() - 1), out) == 0);
}

TEST_CASE("ws::decode_frame: two frames back to back", "[websocket]") {
    std::string buf = ws::encode_frame(ws::kText, "one", nullptr) +
                      ws::encode_frame(ws::kPing, "", nullptr);
    ws::Frame out;
    long used = ws::decode_frame(buf, out);
    REQUIRE(out.payload == "one");
    buf.erase(0, static_cast<size_t>(used));
    REQUIRE(ws::decode_frame(buf, out) == 2);
    REQUIRE(out.opcode == ws::kPing);
    REQUIRE(out.payload.empty());
}

TEST_CASE("ws::decode_frame: reserved bits are a protocol error", "[websocket]") {
    std::string frame = ws::encode_frame(ws::kText, "x", nullptr);
    frame[0] = static_cast<char>(static_cast<uint8_t>(frame[0]) | 0x40);
    ws::Frame out;
    REQUIRE(ws::decode_frame(frame, out) == -1);
}

TEST_CASE("ws::decode_frame: continuation keeps fin flag", "[websocket]") {
    std::string frame = ws::encode_frame(ws::kText, "abc", nullptr);
    frame[0] = static_cast<char>(ws::kText); // fin cleared
    ws::Frame out;
    REQUIRE(ws::decode_frame(frame, out) > 0);
    REQUIRE_FALSE(out.fin);
}

// ── Size limits ─────────────────────────────────────────────────

TEST_CASE("ws::decode_frame: oversized length is rejected from the header alone", "[websocket]") {
    // 64-bit length of 32 MiB, no payload bytes yet
    std::string header;
    header += static_cast<char>(0x81);
    header += static_cast<char>(127);
    uint64_t len = 32ull * 1024 * 1024;
    for (int shift = 56; shift >= 0; shift -= 8)
        header += static_cast<char>((len >> shift) & 0xFF);

    ws::Frame out;
    REQUIRE(ws::decode_frame(header, out) == ws::kFrameTooLarge);
    REQUIRE(ws::decode_frame(header, out, len) == 0);
}

TEST_CASE("ws::decode_frame: lengths past 2^40 stay a protocol error", "[websocket]") {
    std::string header;
    header += static_cast<char>(0x81);
    header += static_cast<char>(127);
    uint64_t len = (static_cast<uint64_t>(1) << 40) + 1;
    for (int shift = 56; shift >= 0; shift -= 8)
        header += static_cast<char>((len >> shift) & 0xFF);

    ws::Frame out;
    REQUIRE(ws::decode_frame(header, out, UINT64_MAX) == -1);
}

TEST_CASE("ws::decode_frame: custom cap applies to short frames", "[websocket]") {
    std::string frame = ws::encode_frame(ws::kText, "0123456789", nullptr);
    ws::Frame out;
    REQUIRE(ws::decode_frame(frame, out, 9) == ws::kFrameTooLarge);
    REQUIRE(ws::decode_frame(frame, out, 10) == static_cast<long>(frame.size()));
}

TEST_CASE("ws::MessageAssembler: joins fragments within the cap", "[websocket]") {
    ws::MessageAssembler assembler(8);
    std::string message;

    ws::Frame first{false, ws::kText, "abcd"};
    REQUIRE(assembler.add(first, message) == ws::MessageAssembler::Status::Pending);
    ws::Frame last{true, ws::kContinuation, "efgh"};
    REQUIRE(assembler.add(last, message) == ws::MessageAssembler::Status::Complete);
    REQUIRE(message == "abcdefgh");
}

TEST_CASE("ws::MessageAssembler: fragments past the cap are refused", "[websocket]") {
    ws::MessageAssembler assembler(8);
    std::string message;

    ws::Frame first{false, ws::kText, "abcdef"};
    REQUIRE(assembler.add(first, message) == ws::MessageAssembler::Status::Pending);
    ws::Frame more{false, ws::kContinuation, "ghi"};
    REQUIRE(assembler.add(more, message) == ws::MessageAssembler::Status::TooLarge);

    // The partial message is gone; a stray continuation no longer joins it
    ws::Frame tail{true, ws::kContinuation, "j"};
    REQUIRE(assembler.add(tail, message) == ws::MessageAssembler::Status::Pending);
    ws::Frame whole{true, ws::kText, "ok"};
    REQUIRE(assembler.add(whole, message) == ws::MessageAssembler::Status::Complete);
    REQUIRE(message == "ok");
}

// ── URLs ────────────────────────────────────────────────────────

TEST_CASE("parse_url: WebSocket schemes", "[websocket][url]") {
    auto plain = parse_url("ws://localhost:8000/live?session=1");
    REQUIRE(plain.scheme == "ws");
    REQUIRE_FALSE(plain.tls);
    REQUIRE(plain.host == "localhost");
    REQUIRE(plain.port == "8000");
    REQUIRE(plain.path == "/live?session=1");

    auto secure = parse_url("wss://agent.example.com");
    REQUIRE(secure.tls);
    REQUIRE(secure.port == "443");
    REQUIRE(secure.path == "/");
}

TEST_CASE("parse_url: rejects unsupported input", "[websocket][url]") {
    REQUIRE_THROWS_AS(parse_url("localhost:8000"), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_url("ftp://host/"), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_url("ws:///path"), std::invalid_argument);
}

TEST_CASE("WebSocketChannel: refuses non-WebSocket URLs", "[websocket]") {
    WebSocketChannel channel("http://localhost:8000/live", 1000);
    std::string error;
    REQUIRE_FALSE(channel.connect(error));
    REQUIRE(error.find("not a WebSocket URL") != std::string::npos);
    REQUIRE(channel.ready_state() == ReadyState::Closed);
    REQUIRE_FALSE(channel.send_text("x"));
}
