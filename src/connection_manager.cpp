#include "connection_manager.hpp"
#include "util.hpp"
#include <iostream>

namespace toolgate {

ConnectionManager::ConnectionManager(BidiConfig config, ChannelFactory factory, Clock clock)
    : config_(std::move(config)), factory_(std::move(factory)), clock_(std::move(clock))
{
    if (!clock_) clock_ = epoch_millis;

    ReceiverCallbacks rc;
    rc.on_approval_requested = [this](const ProtocolEvent& ev) {
        arm_timeout();
        if (callbacks_.on_approval_requested) callbacks_.on_approval_requested(ev);
    };
    rc.on_approval_stream_closed = [this]() { disarm_timeout(); };
    receiver_.set_callbacks(std::move(rc));
}

ConnectionManager::~ConnectionManager() {
    close();
}

void ConnectionManager::set_callbacks(ConnectionCallbacks callbacks) {
    callbacks_ = std::move(callbacks);
}

bool ConnectionManager::ensure_open(std::string& error) {
    if (channel_ && channel_->ready_state() == ReadyState::Open) return true;

    channel_ = factory_ ? factory_() : nullptr;
    if (!channel_) {
        error = "no channel available";
        return false;
    }
    if (!channel_->connect(error)) {
        channel_.reset();
        if (error.empty()) error = "connection failed";
        return false;
    }
    codec_.reset();
    outstanding_ping_.reset();
    last_ping_sent_ = clock_();
    std::cerr << "[connection] Connected via " << channel_->channel_name() << "\n";
    return true;
}

std::shared_ptr<InboundSequence> ConnectionManager::select_sequence() {
    bool need_new = !current_ || current_->finished() || receiver_.state().turn_closed;
    if (need_new) {
        if (current_) current_->close();
        current_ = std::make_shared<InboundSequence>(next_sequence_id_++);
        receiver_.reset();
        disarm_timeout();
    }
    return current_;
}

std::shared_ptr<InboundSequence> ConnectionManager::begin_turn(const MessageRequest& request) {
    select_sequence();

    std::string error;
    if (!ensure_open(error)) {
        StreamError err{ErrorType::Network, "connection failed: " + error};
        current_->fail(err);
        report(err);
        return current_;
    }

    if (!sender_.send_messages(channel_.get(), request)) {
        StreamError err{ErrorType::Network, "connection lost while sending turn"};
        current_->fail(err);
        report(err);
    }
    return current_;
}

std::shared_ptr<InboundSequence> ConnectionManager::send_followup(const FrameWriter& write) {
    if (!channel_ || channel_->ready_state() != ReadyState::Open) {
        std::cerr << "[connection] No open channel for follow-up frame\n";
        return nullptr;
    }
    auto sequence = select_sequence();
    if (!write(channel_.get())) {
        StreamError err{ErrorType::Network, "connection lost while sending follow-up"};
        sequence->fail(err);
        report(err);
        return nullptr;
    }
    return sequence;
}

bool ConnectionManager::pump(int timeout_ms) {
    if (!channel_ || channel_->ready_state() != ReadyState::Open) {
        check_timeout();
        return false;
    }

    bool alive = channel_->poll(timeout_ms, [this](const std::string& text) {
        on_message(text);
    });

    if (!alive) {
        std::cerr << "[connection] Channel closed\n";
        disarm_timeout();
        if (current_ && !current_->finished()) {
            if (receiver_.state().turn_closed) {
                current_->close();
            } else {
                StreamError err{ErrorType::Network, "connection closed before turn finished"};
                current_->fail(err);
                report(err);
            }
        }
        return false;
    }

    maybe_ping();
    check_timeout();
    return true;
}

void ConnectionManager::on_message(const std::string& text) {
    for (const auto& ev : codec_.decode(text)) dispatch(ev);
    // A WebSocket message is always complete; decode any unterminated tail
    for (const auto& ev : codec_.flush()) dispatch(ev);
}

void ConnectionManager::dispatch(const ProtocolEvent& event) {
    receiver_.observe(event);

    if (event.kind == EventKind::Pong) {
        if (outstanding_ping_ && event.payload.contains("timestamp") &&
            event.payload["timestamp"].is_number_integer() &&
            event.payload["timestamp"].get<int64_t>() == *outstanding_ping_) {
            int64_t rtt = clock_() - *outstanding_ping_;
            outstanding_ping_.reset();
            if (callbacks_.on_latency) callbacks_.on_latency(rtt);
        }
        return;
    }

    if (!current_ || current_->finished()) {
        std::cerr << "[connection] No open sequence, dropping " << event.type << "\n";
        return;
    }
    current_->push(event);
    if (event.kind == EventKind::Done) current_->close();
}

bool ConnectionManager::check_timeout() {
    if (!deadline_ || clock_() < *deadline_) return false;

    deadline_.reset();
    StreamError err{ErrorType::Timeout,
                    "approval response timed out after " +
                    std::to_string(config_.approval_timeout_ms) + " ms"};
    std::cerr << "[connection] " << err.message << "\n";
    if (current_) current_->fail(err);
    receiver_.reset();
    report(err);
    return true;
}

void ConnectionManager::interrupt(const std::optional<std::string>& reason) {
    if (!sender_.interrupt(channel_.get(), reason))
        std::cerr << "[connection] Interrupt not delivered, closing turn locally\n";
    disarm_timeout();
    if (current_) current_->close();
    receiver_.reset();
}

void ConnectionManager::close() {
    disarm_timeout();
    if (current_) current_->close();
    if (channel_) {
        channel_->close();
        channel_.reset();
    }
}

void ConnectionManager::arm_timeout() {
    if (config_.approval_timeout_ms == 0) return;
    deadline_ = clock_() + static_cast<int64_t>(config_.approval_timeout_ms);
}

void ConnectionManager::disarm_timeout() {
    deadline_.reset();
}

void ConnectionManager::maybe_ping() {
    if (config_.ping_interval_ms == 0 || !channel_) return;
    int64_t now = clock_();
    if (now - last_ping_sent_ < static_cast<int64_t>(config_.ping_interval_ms)) return;
    last_ping_sent_ = now;
    if (sender_.ping(channel_.get(), now)) outstanding_ping_ = now;
}

void ConnectionManager::report(const StreamError& error) {
    if (callbacks_.on_error) callbacks_.on_error(error);
}

} // namespace toolgate
