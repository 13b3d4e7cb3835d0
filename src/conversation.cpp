#include "conversation.hpp"
#include "util.hpp"
#include <iostream>

namespace toolgate {

static bool is_terminal(ToolState state) {
    return state == ToolState::OutputAvailable || state == ToolState::OutputError ||
           state == ToolState::OutputDenied;
}

static ToolInvocationPart* find_in(std::vector<Message>& messages, const std::string& id) {
    for (auto it = messages.rbegin(); it != messages.rend(); ++it) {
        if (auto* tool = it->find_tool(id)) return tool;
    }
    return nullptr;
}

Conversation::Conversation(std::string id) : id_(std::move(id)) {}

const Message& Conversation::add_user_text(const std::string& text) {
    messages_.emplace_back(generate_id(), Role::User, std::vector<Part>{TextPart{text}});
    text_blocks_.clear();
    partial_inputs_.clear();
    touch();
    return messages_.back();
}

Message& Conversation::assistant_message(const std::string& message_id) {
    // A response to a resubmitted history continues the last assistant message
    if (!messages_.empty() && messages_.back().role() == Role::Assistant)
        return messages_.back();
    messages_.emplace_back(message_id.empty() ? generate_id() : message_id, Role::Assistant);
    text_blocks_.clear();
    touch();
    return messages_.back();
}

bool Conversation::apply(const ProtocolEvent& event) {
    uint64_t before = revision_;

    switch (event.kind) {
        case EventKind::Start:
            assistant_message(event.field("messageId"));
            break;

        case EventKind::StartStep: {
            Message& msg = assistant_message();
            msg.parts.push_back(OtherPart{"step-start", nlohmann::json::object()});
            touch();
            break;
        }

        case EventKind::TextStart: {
            Message& msg = assistant_message();
            msg.parts.push_back(TextPart{});
            text_blocks_[event.field("id")] = msg.parts.size() - 1;
            touch();
            break;
        }

        case EventKind::TextDelta: {
            Message& msg = assistant_message();
            std::string block = event.field("id");
            auto it = text_blocks_.find(block);
            if (it == text_blocks_.end() || it->second >= msg.parts.size() ||
                !std::holds_alternative<TextPart>(msg.parts[it->second])) {
                // Delta without text-start: open the block implicitly
                msg.parts.push_back(TextPart{});
                it = text_blocks_.insert_or_assign(block, msg.parts.size() - 1).first;
            }
            std::get<TextPart>(msg.parts[it->second]).text += event.delta();
            touch();
            break;
        }

        case EventKind::TextEnd:
            text_blocks_.erase(event.field("id"));
            break;

        case EventKind::ToolInputStart:
        case EventKind::ToolInputDelta:
        case EventKind::ToolInputAvailable:
        case EventKind::ToolApprovalRequest:
        case EventKind::ToolOutputAvailable:
        case EventKind::ToolOutputError:
        case EventKind::ToolOutputDenied:
            apply_tool_event(event);
            break;

        case EventKind::Error:
            last_error_ = event.field("errorText");
            if (last_error_->empty()) last_error_ = "unknown backend error";
            break;

        case EventKind::FinishStep:
        case EventKind::Finish:
        case EventKind::Pong:
        case EventKind::Passthrough:
        case EventKind::Done:
            break;
    }
    return revision_ != before;
}

ToolInvocationPart* Conversation::tool_for_update(const std::string& tool_call_id,
                                                  const char* event_type) {
    auto* tool = find_in(messages_, tool_call_id);
    if (!tool) {
        std::cerr << "[conversation] " << event_type << " for unknown tool call "
                  << tool_call_id << "\n";
        return nullptr;
    }
    if (is_terminal(tool->state)) {
        std::cerr << "[conversation] " << event_type << " ignored, tool call "
                  << tool_call_id << " already " << tool_state_to_string(tool->state) << "\n";
        return nullptr;
    }
    return tool;
}

bool Conversation::apply_tool_event(const ProtocolEvent& event) {
    std::string call_id = event.tool_call_id();
    if (call_id.empty()) {
        std::cerr << "[conversation] " << event.type << " without toolCallId\n";
        return false;
    }

    switch (event.kind) {
        case EventKind::ToolInputStart:
        case EventKind::ToolInputAvailable: {
            Message& msg = assistant_message();
            ToolInvocationPart* tool = msg.find_tool(call_id);
            if (!tool) {
                ToolInvocationPart part;
                part.tool_call_id = call_id;
                part.tool_name = event.field("toolName");
                msg.parts.push_back(std::move(part));
                tool = &std::get<ToolInvocationPart>(msg.parts.back());
            } else if (tool->state != ToolState::InputStreaming) {
                std::cerr << "[conversation] Duplicate tool call id " << call_id << "\n";
                return false;
            }
            if (event.kind == EventKind::ToolInputAvailable) {
                if (event.payload.contains("input")) tool->input = event.payload["input"];
                if (tool->tool_name.empty()) tool->tool_name = event.field("toolName");
                tool->state = ToolState::InputAvailable;
                partial_inputs_.erase(call_id);
            }
            touch();
            return true;
        }

        case EventKind::ToolInputDelta: {
            auto* tool = tool_for_update(call_id, "tool-input-delta");
            if (!tool || tool->state != ToolState::InputStreaming) return false;
            std::string& buffer = partial_inputs_[call_id];
            buffer += event.field("inputTextDelta");
            auto parsed = nlohmann::json::parse(buffer, nullptr, false);
            if (!parsed.is_discarded()) tool->input = std::move(parsed);
            touch();
            return true;
        }

        case EventKind::ToolApprovalRequest: {
            auto* tool = tool_for_update(call_id, "tool-approval-request");
            if (!tool) return false;
            tool->approval = Approval{event.approval_id(), std::nullopt};
            tool->state = ToolState::ApprovalRequested;
            touch();
            return true;
        }

        case EventKind::ToolOutputAvailable: {
            auto* tool = tool_for_update(call_id, "tool-output-available");
            if (!tool) return false;
            tool->output = event.payload.contains("output") ? event.payload["output"]
                                                            : nlohmann::json();
            tool->state = ToolState::OutputAvailable;
            touch();
            return true;
        }

        case EventKind::ToolOutputError: {
            auto* tool = tool_for_update(call_id, "tool-output-error");
            if (!tool) return false;
            tool->error = event.field("errorText");
            tool->state = ToolState::OutputError;
            touch();
            return true;
        }

        case EventKind::ToolOutputDenied: {
            auto* tool = tool_for_update(call_id, "tool-output-denied");
            if (!tool) return false;
            tool->state = ToolState::OutputDenied;
            touch();
            return true;
        }

        default:
            return false;
    }
}

const ToolInvocationPart* Conversation::respond_to_approval(const std::string& id,
                                                            const ApprovalDecision& decision) {
    for (auto it = messages_.rbegin(); it != messages_.rend(); ++it) {
        for (auto& p : it->parts) {
            auto* tool = std::get_if<ToolInvocationPart>(&p);
            if (!tool || tool->state != ToolState::ApprovalRequested) continue;
            if (tool->tool_call_id != id && (!tool->approval || tool->approval->id != id))
                continue;
            if (!tool->approval) tool->approval = Approval{};
            tool->approval->decision = decision;
            tool->state = ToolState::ApprovalResponded;
            touch();
            return tool;
        }
    }
    return nullptr;
}

bool Conversation::add_tool_output(const std::string& tool_call_id,
                                   const nlohmann::json& output) {
    auto* tool = tool_for_update(tool_call_id, "tool output");
    if (!tool) return false;
    tool->output = output;
    tool->error.reset();
    tool->state = ToolState::OutputAvailable;
    touch();
    return true;
}

bool Conversation::add_tool_error(const std::string& tool_call_id, const std::string& error) {
    auto* tool = tool_for_update(tool_call_id, "tool error");
    if (!tool) return false;
    tool->error = error;
    tool->state = ToolState::OutputError;
    touch();
    return true;
}

std::vector<const ToolInvocationPart*> Conversation::pending_approvals() const {
    std::vector<const ToolInvocationPart*> pending;
    for (const auto& msg : messages_) {
        for (const auto* tool : msg.tool_parts()) {
            if (tool->state == ToolState::ApprovalRequested) pending.push_back(tool);
        }
    }
    return pending;
}

const ToolInvocationPart* Conversation::find_tool(const std::string& tool_call_id) const {
    for (auto it = messages_.rbegin(); it != messages_.rend(); ++it) {
        if (const auto* tool = it->find_tool(tool_call_id)) return tool;
    }
    return nullptr;
}

const Message* Conversation::find_message_with_tool(const std::string& tool_call_id) const {
    for (auto it = messages_.rbegin(); it != messages_.rend(); ++it) {
        if (it->find_tool(tool_call_id)) return &*it;
    }
    return nullptr;
}

void Conversation::clear() {
    messages_.clear();
    text_blocks_.clear();
    partial_inputs_.clear();
    last_error_.reset();
    touch();
}

} // namespace toolgate
