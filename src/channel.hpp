#pragma once
#include <string>
#include <functional>
#include <cstdint>

namespace toolgate {

enum class ReadyState { Connecting, Open, Closing, Closed };

const char* ready_state_to_string(ReadyState state);

// Receives each complete inbound text message.
using TextMessageCallback = std::function<void(const std::string& text)>;

// Abstract duplex text channel (WebSocket in production, mocks in tests).
class DuplexChannel {
public:
    virtual ~DuplexChannel() = default;

    virtual std::string channel_name() const = 0;
    virtual ReadyState ready_state() const = 0;

    // Blocks until the channel is open or failed. On failure, fills error.
    virtual bool connect(std::string& error) = 0;

    virtual bool send_text(const std::string& text) = 0;

    // Wait up to timeout_ms for inbound data, delivering every complete
    // message. Returns false once the channel is closed or failed.
    virtual bool poll(int timeout_ms, const TextMessageCallback& on_message) = 0;

    virtual void close(uint16_t code = 1000, const std::string& reason = "") = 0;
};

} // namespace toolgate
