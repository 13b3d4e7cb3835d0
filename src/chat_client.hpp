#pragma once
#include "config.hpp"
#include "confirmation_router.hpp"
#include "connection_manager.hpp"
#include "conversation.hpp"
#include "http.hpp"
#include "resend_policy.hpp"
#include "sse_transport.hpp"
#include "tool.hpp"
#include <memory>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace toolgate {

class ChunkLogger;
class EventBus;

// One chat session: conversation history, the resend policy, frontend tools
// and whichever transport the config selects. Single-threaded; call pump()
// from the owning loop.
class ChatClient {
public:
    ChatClient(Config config, EventBus& bus, ChannelFactory channel_factory,
               HttpClient& http, Clock clock = {});
    ~ChatClient();

    ChatClient(const ChatClient&) = delete;
    ChatClient& operator=(const ChatClient&) = delete;

    // Replace the frontend tools (defaults to every registered tool).
    void set_tools(std::vector<std::unique_ptr<Tool>> tools);
    std::vector<std::string> tool_names() const;

    // Append a user message and start a turn. In stream mode this blocks
    // until the response (and any automatic follow-up) has been read.
    bool submit(const std::string& text);

    // Approve or deny a pending approval, identified by tool call id or
    // approval id.
    ConfirmationResult respond_to_approval(const std::string& id,
                                           const ApprovalDecision& decision);

    // Duplex mode: read and process inbound frames for up to timeout_ms.
    // Returns false when the channel is gone.
    bool pump(int timeout_ms);

    bool interrupt(const std::optional<std::string>& reason = std::nullopt);

    // Stream raw 16-bit mono PCM from a file as audio chunks (duplex only).
    bool send_audio_file(const std::string& path, std::string& error);

    void clear_history();

    // Parts waiting for a user decision: approval requests and
    // confirmation wrappers that have not been answered.
    std::vector<const ToolInvocationPart*> pending_approvals() const;

    bool busy() const;

    // Tool calls still remembered as executed or announced.
    size_t tracked_call_count() const {
        return executed_calls_.size() + announced_approvals_.size();
    }
    bool is_bidi() const { return connection_ != nullptr; }

    const Conversation& conversation() const { return conversation_; }
    const ResendPolicy& policy() const { return policy_; }
    ConnectionManager* connection() { return connection_.get(); }
    SseTransport* sse() { return sse_.get(); }

private:
    void send_turn();
    void run_pending();
    void consume(InboundSequence& sequence);
    void handle_event(const ProtocolEvent& event);
    void finish_sequence(const InboundSequence& sequence);
    void run_frontend_tools();
    void adopt(std::shared_ptr<InboundSequence> sequence);
    void after_mutation();
    void prune_tracking();
    void publish_update();
    ConfirmationTransport confirmation_transport(const ApprovalDecision& decision);
    void record_decision(const std::string& tool_call_id, const ApprovalDecision& decision);

    Config config_;
    EventBus& bus_;
    Conversation conversation_;
    ResendPolicy policy_;

    std::shared_ptr<ChunkLogger> chunk_logger_;
    std::unique_ptr<ConnectionManager> connection_;
    std::unique_ptr<SseTransport> sse_;

    std::unordered_map<std::string, std::unique_ptr<Tool>> tools_;
    std::unordered_set<std::string> executed_calls_;
    std::unordered_set<std::string> announced_approvals_;

    std::shared_ptr<InboundSequence> active_;
    std::shared_ptr<InboundSequence> followup_;
    uint64_t finalized_sequence_ = 0;
    uint64_t published_revision_ = 0;
    bool resend_pending_ = false;
    bool sending_ = false;
};

} // namespace toolgate
