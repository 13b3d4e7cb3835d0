#pragma once
#include "message.hpp"
#include "protocol_event.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace toolgate {

// Conversation history for one session, built up from the user's input and
// the backend's protocol events. Every mutation bumps revision().
class Conversation {
public:
    explicit Conversation(std::string id);

    const std::string& id() const { return id_; }
    const std::vector<Message>& messages() const { return messages_; }
    uint64_t revision() const { return revision_; }

    const Message& add_user_text(const std::string& text);

    // Apply one inbound event. Returns true when the history changed.
    bool apply(const ProtocolEvent& event);

    // Record the user's decision on a part in approval-requested state.
    // `id` may be the approval id or the tool call id. Returns the updated
    // part, or nullptr when nothing is awaiting that decision.
    const ToolInvocationPart* respond_to_approval(const std::string& id,
                                                  const ApprovalDecision& decision);

    // Results of frontend-executed tools. Return false for unknown calls and
    // for calls that already reached a terminal state.
    bool add_tool_output(const std::string& tool_call_id, const nlohmann::json& output);
    bool add_tool_error(const std::string& tool_call_id, const std::string& error);

    std::vector<const ToolInvocationPart*> pending_approvals() const;

    // Latest invocation with this id, searching newest messages first.
    const ToolInvocationPart* find_tool(const std::string& tool_call_id) const;
    const Message* find_message_with_tool(const std::string& tool_call_id) const;

    // errorText of the most recent "error" event, if any.
    const std::optional<std::string>& last_error() const { return last_error_; }

    void clear();

private:
    Message& assistant_message(const std::string& message_id = "");
    ToolInvocationPart* tool_for_update(const std::string& tool_call_id, const char* event_type);
    bool apply_tool_event(const ProtocolEvent& event);
    void touch() { ++revision_; }

    std::string id_;
    std::vector<Message> messages_;
    uint64_t revision_ = 0;
    std::optional<std::string> last_error_;

    // text block id -> part index within the last (assistant) message
    std::unordered_map<std::string, size_t> text_blocks_;
    std::unordered_map<std::string, std::string> partial_inputs_;
};

} // namespace toolgate
