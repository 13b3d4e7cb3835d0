#include "chat_client.hpp"
#include "chunk_log.hpp"
#include "event.hpp"
#include "event_bus.hpp"
#include "plugin.hpp"
#include "util.hpp"
#include <fstream>
#include <iostream>
#include <iterator>
#include <utility>

namespace toolgate {

// 100 ms of 16 kHz mono 16-bit audio
static constexpr size_t kAudioChunkBytes = 3200;

ChatClient::ChatClient(Config config, EventBus& bus, ChannelFactory channel_factory,
                       HttpClient& http, Clock clock)
    : config_(std::move(config)), bus_(bus), conversation_(generate_id())
{
    bool bidi = config_.is_bidi();
    if (config_.chunk_log.enabled) {
        chunk_logger_ = std::make_shared<ChunkLogger>(config_.chunk_log.path, conversation_.id(),
                                                      bidi ? kChunkModeBidi : kChunkModeSse);
    }

    if (bidi) {
        ChannelFactory factory = std::move(channel_factory);
        if (chunk_logger_) {
            factory = [inner = std::move(factory), logger = chunk_logger_]()
                    -> std::shared_ptr<DuplexChannel> {
                auto channel = inner ? inner() : nullptr;
                if (!channel) return nullptr;
                return std::make_shared<LoggingChannel>(std::move(channel), logger);
            };
        }
        connection_ = std::make_unique<ConnectionManager>(config_.bidi, std::move(factory),
                                                          std::move(clock));
        ConnectionCallbacks callbacks;
        callbacks.on_error = [this](const StreamError& error) {
            TransportErrorEvent ev;
            ev.error = error;
            bus_.publish(ev);
        };
        callbacks.on_latency = [this](int64_t rtt_ms) {
            LatencyEvent ev;
            ev.rtt_ms = rtt_ms;
            bus_.publish(ev);
        };
        connection_->set_callbacks(std::move(callbacks));
    } else {
        sse_ = std::make_unique<SseTransport>(config_.sse, http, chunk_logger_.get());
    }

    set_tools(PluginRegistry::instance().create_all_tools(config_));
}

ChatClient::~ChatClient() = default;

void ChatClient::set_tools(std::vector<std::unique_ptr<Tool>> tools) {
    tools_.clear();
    for (auto& tool : tools) {
        std::string name = tool->tool_name();
        tools_[name] = std::move(tool);
    }
}

std::vector<std::string> ChatClient::tool_names() const {
    std::vector<std::string> names;
    for (const auto& [name, _] : tools_) names.push_back(name);
    return names;
}

// ── Turns ───────────────────────────────────────────────────────

bool ChatClient::submit(const std::string& text) {
    if (sending_) {
        std::cerr << "[client] A turn is already being sent\n";
        return false;
    }
    conversation_.add_user_text(text);
    publish_update();
    send_turn();
    bool ok = active_ && active_->status() != SequenceStatus::Failed;
    run_pending();
    return ok;
}

void ChatClient::send_turn() {
    MessageRequest request;
    request.id = conversation_.id();
    request.messages = conversation_.messages();
    const auto& messages = conversation_.messages();
    if (!messages.empty() && messages.back().role() == Role::Assistant)
        request.message_id = messages.back().id();

    sending_ = true;
    std::shared_ptr<InboundSequence> sequence;
    if (connection_) {
        sequence = connection_->begin_turn(request);
        adopt(sequence);
    } else {
        sequence = sse_->send(request, [this](InboundSequence& s) {
            consume(s);
            return true;
        });
        active_ = sequence;
    }
    if (sequence) consume(*sequence);
    sending_ = false;
}

void ChatClient::adopt(std::shared_ptr<InboundSequence> sequence) {
    auto previous = std::exchange(active_, std::move(sequence));
    // The replaced sequence was closed by the connection; let it finish here
    if (previous && previous != active_ && previous->id() > finalized_sequence_)
        consume(*previous);
}

void ChatClient::run_pending() {
    if (sending_) return;
    while (resend_pending_) {
        resend_pending_ = false;
        ResendEvent ev;
        const auto& messages = conversation_.messages();
        if (!messages.empty()) ev.message_id = messages.back().id();
        ev.message_count = messages.size();
        bus_.publish(ev);
        send_turn();
    }
}

bool ChatClient::pump(int timeout_ms) {
    if (!connection_) return true;
    bool alive = connection_->pump(timeout_ms);
    if (auto current = connection_->current_sequence()) {
        adopt(current);
        consume(*current);
    }
    run_pending();
    return alive;
}

bool ChatClient::interrupt(const std::optional<std::string>& reason) {
    if (!connection_) {
        std::cerr << "[client] Interrupt needs the duplex transport\n";
        return false;
    }
    connection_->interrupt(reason);
    if (auto sequence = active_) consume(*sequence);
    return true;
}

bool ChatClient::busy() const {
    return sending_ || (active_ && !active_->finished());
}

// ── Inbound ─────────────────────────────────────────────────────

void ChatClient::consume(InboundSequence& sequence) {
    while (auto event = sequence.next()) handle_event(*event);
    run_frontend_tools();

    if (sequence.finished() && sequence.id() > finalized_sequence_) {
        finalized_sequence_ = sequence.id();
        finish_sequence(sequence);
    }
}

void ChatClient::handle_event(const ProtocolEvent& event) {
    if (config_.debug) std::cerr << "[client] <- " << event.type << "\n";
    bool changed = conversation_.apply(event);

    switch (event.kind) {
        case EventKind::TextDelta: {
            TextDeltaEvent ev;
            ev.message_id = conversation_.messages().back().id();
            ev.delta = event.delta();
            bus_.publish(ev);
            break;
        }
        case EventKind::ToolApprovalRequest:
        case EventKind::ToolInputAvailable: {
            const auto* part = conversation_.find_tool(event.tool_call_id());
            if (!part) break;
            bool needs_user = part->state == ToolState::ApprovalRequested ||
                              (part->tool_name == kConfirmationToolName &&
                               part->state == ToolState::InputAvailable);
            if (needs_user && announced_approvals_.insert(part->tool_call_id).second) {
                ApprovalRequiredEvent ev;
                ev.tool_call_id = part->tool_call_id;
                ev.approval_id = part->approval ? part->approval->id : "";
                ev.tool_name = part->tool_name;
                ev.input_json = part->input.dump();
                bus_.publish(ev);
            }
            break;
        }
        case EventKind::Error: {
            TransportErrorEvent ev;
            ev.error = StreamError::from_message(conversation_.last_error().value_or(""));
            bus_.publish(ev);
            break;
        }
        default:
            break;
    }

    if (changed) publish_update();
}

void ChatClient::finish_sequence(const InboundSequence& sequence) {
    bool failed = sequence.status() == SequenceStatus::Failed;

    // Duplex failures already reached the bus through on_error
    if (failed && !connection_ && sequence.error()) {
        TransportErrorEvent ev;
        ev.error = *sequence.error();
        bus_.publish(ev);
    }

    TurnClosedEvent closed;
    closed.sequence_id = sequence.id();
    closed.failed = failed;
    bus_.publish(closed);

    if (failed) {
        publish_update();
        return;
    }
    after_mutation();
}

// ── Approvals and tools ─────────────────────────────────────────

std::vector<const ToolInvocationPart*> ChatClient::pending_approvals() const {
    std::vector<const ToolInvocationPart*> pending;
    for (const auto& msg : conversation_.messages()) {
        for (const auto* part : msg.tool_parts()) {
            if (part->state == ToolState::ApprovalRequested ||
                (part->tool_name == kConfirmationToolName &&
                 part->state == ToolState::InputAvailable)) {
                pending.push_back(part);
            }
        }
    }
    return pending;
}

ConfirmationTransport ChatClient::confirmation_transport(const ApprovalDecision& decision) {
    ConfirmationTransport transport;
    if (connection_) {
        // Never connected or already closed: leave the duplex path unset
        auto channel = connection_->channel();
        if (!channel) return transport;
        auto sink = make_duplex_confirmation_sink(channel, connection_->sender());
        transport.duplex = [this, sink](const std::string& tool_call_id,
                                        const std::string& tool_name,
                                        const nlohmann::json& response) {
            auto sequence = connection_->send_followup([&](DuplexChannel*) {
                return sink(tool_call_id, tool_name, response);
            });
            if (!sequence) return false;
            followup_ = std::move(sequence);
            return true;
        };
    } else {
        transport.stream = [this, decision](const std::string&, const std::string& tool_call_id,
                                            const nlohmann::json& output) {
            record_decision(tool_call_id, decision);
            return conversation_.add_tool_output(tool_call_id, output);
        };
    }
    return transport;
}

void ChatClient::record_decision(const std::string& tool_call_id,
                                 const ApprovalDecision& decision) {
    const auto* part = conversation_.find_tool(tool_call_id);
    if (part && part->state == ToolState::ApprovalRequested)
        conversation_.respond_to_approval(tool_call_id, decision);
}

ConfirmationResult ChatClient::respond_to_approval(const std::string& id,
                                                   const ApprovalDecision& decision) {
    ConfirmationResult result;

    const ToolInvocationPart* target = nullptr;
    for (const auto* part : pending_approvals()) {
        if (part->tool_call_id == id || (part->approval && part->approval->id == id)) {
            target = part;
        }
    }
    if (!target) {
        result.error = "no pending approval for " + id;
        return result;
    }

    std::string call_id = target->tool_call_id;

    if (target->tool_name == kConfirmationToolName) {
        result = route_confirmation(ConfirmationInvocation::from_part(*target), decision,
                                    confirmation_transport(decision));
        if (!result.success) {
            std::cerr << "[client] Confirmation for " << call_id << " failed: "
                      << result.error << "\n";
            return result;
        }
        if (result.channel_used == TransportKind::Duplex) {
            record_decision(call_id, decision);
            conversation_.add_tool_output(call_id, {{"confirmed", decision.approved}});
            if (const auto* msg = conversation_.find_message_with_tool(call_id))
                policy_.mark_sent(*msg);
            if (auto sequence = std::move(followup_)) adopt(sequence);
        }
    } else {
        if (!conversation_.respond_to_approval(call_id, decision)) {
            result.error = "no pending approval for " + id;
            return result;
        }
        result.success = true;
        result.channel_used = connection_ ? TransportKind::Duplex : TransportKind::Stream;
        run_frontend_tools();
    }

    after_mutation();
    run_pending();
    return result;
}

void ChatClient::run_frontend_tools() {
    if (tools_.empty() || conversation_.messages().empty()) return;
    const Message& last = conversation_.messages().back();
    if (last.role() != Role::Assistant) return;

    struct Call { std::string id, name, args; };
    std::vector<Call> ready;
    for (const auto* part : last.tool_parts()) {
        auto it = tools_.find(part->tool_name);
        if (it == tools_.end() || executed_calls_.count(part->tool_call_id)) continue;

        bool approved = part->state == ToolState::ApprovalResponded && part->approval &&
                        part->approval->decision && part->approval->decision->approved;
        bool runnable = part->state == ToolState::InputAvailable &&
                        !it->second->requires_approval();
        if (approved || runnable)
            ready.push_back({part->tool_call_id, part->tool_name, part->input.dump()});
    }

    for (const auto& call : ready) {
        if (!executed_calls_.insert(call.id).second) continue;
        ToolResult r = tools_[call.name]->execute(call.args);

        nlohmann::json result;
        if (r.success) {
            auto parsed = nlohmann::json::parse(r.output, nullptr, false);
            result = parsed.is_discarded() ? nlohmann::json(r.output) : parsed;
            conversation_.add_tool_output(call.id, result);
        } else {
            result = {{"error", r.output}};
            conversation_.add_tool_error(call.id, r.output);
        }

        if (connection_) {
            // The backend answers the result with a turn of its own
            auto sequence = connection_->send_followup([&](DuplexChannel* channel) {
                return connection_->sender().send_tool_result(channel, call.id, result);
            });
            if (sequence) {
                if (const auto* msg = conversation_.find_message_with_tool(call.id))
                    policy_.mark_sent(*msg);
                followup_ = std::move(sequence);
            }
        }

        ToolExecutedEvent ev;
        ev.tool_call_id = call.id;
        ev.tool_name = call.name;
        ev.success = r.success;
        ev.output = r.output;
        bus_.publish(ev);
    }
    if (!ready.empty()) publish_update();
    if (auto sequence = std::move(followup_)) adopt(sequence);
}

void ChatClient::after_mutation() {
    publish_update();
    prune_tracking();
    if (policy_.should_resend(conversation_.messages())) resend_pending_ = true;
}

// Once the backend answers a message with text, its settled tool calls can
// no longer run or ask again.
void ChatClient::prune_tracking() {
    const auto& messages = conversation_.messages();
    if (messages.empty() || messages.back().role() != Role::Assistant ||
        !messages.back().has_text())
        return;
    for (const auto* part : messages.back().tool_parts()) {
        if (part->state != ToolState::OutputAvailable &&
            part->state != ToolState::OutputError &&
            part->state != ToolState::OutputDenied)
            continue;
        executed_calls_.erase(part->tool_call_id);
        announced_approvals_.erase(part->tool_call_id);
    }
}

void ChatClient::publish_update() {
    if (conversation_.revision() == published_revision_) return;
    published_revision_ = conversation_.revision();
    ConversationUpdatedEvent ev;
    ev.conversation_id = conversation_.id();
    ev.revision = published_revision_;
    ev.message_count = conversation_.messages().size();
    bus_.publish(ev);
}

// ── Misc ────────────────────────────────────────────────────────

bool ChatClient::send_audio_file(const std::string& path, std::string& error) {
    if (!connection_) {
        error = "audio needs the duplex transport";
        return false;
    }
    std::ifstream in(expand_home(path), std::ios::binary);
    if (!in.is_open()) {
        error = "cannot open " + path;
        return false;
    }
    std::string pcm((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (pcm.empty()) {
        error = "empty audio file: " + path;
        return false;
    }
    if (!connection_->ensure_open(error)) return false;

    const auto& sender = connection_->sender();
    auto channel = connection_->channel();
    if (!sender.start_audio(channel.get())) {
        error = "channel closed";
        return false;
    }
    for (size_t off = 0; off < pcm.size(); off += kAudioChunkBytes) {
        AudioChunk chunk;
        chunk.pcm = pcm.substr(off, kAudioChunkBytes);
        if (!sender.send_audio_chunk(channel.get(), chunk)) {
            error = "channel closed while streaming audio";
            return false;
        }
    }
    if (!sender.stop_audio(channel.get())) {
        error = "channel closed before audio stop";
        return false;
    }
    return true;
}

void ChatClient::clear_history() {
    conversation_.clear();
    policy_.reset();
    executed_calls_.clear();
    announced_approvals_.clear();
    resend_pending_ = false;
    publish_update();
}

} // namespace toolgate
