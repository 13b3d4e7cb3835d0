#include "message.hpp"
#include <stdexcept>

namespace toolgate {

Role parse_role(const std::string& s) {
    if (s == "system") return Role::System;
    if (s == "user") return Role::User;
    if (s == "assistant") return Role::Assistant;
    throw std::invalid_argument("unknown message role: " + s);
}

const char* tool_state_to_string(ToolState state) {
    switch (state) {
        case ToolState::InputStreaming: return "input-streaming";
        case ToolState::InputAvailable: return "input-available";
        case ToolState::ApprovalRequested: return "approval-requested";
        case ToolState::ApprovalResponded: return "approval-responded";
        case ToolState::OutputAvailable: return "output-available";
        case ToolState::OutputError: return "output-error";
        case ToolState::OutputDenied: return "output-denied";
    }
    return "input-streaming";
}

ToolState parse_tool_state(const std::string& s) {
    if (s == "input-streaming") return ToolState::InputStreaming;
    if (s == "input-available") return ToolState::InputAvailable;
    if (s == "approval-requested") return ToolState::ApprovalRequested;
    if (s == "approval-responded") return ToolState::ApprovalResponded;
    if (s == "output-available") return ToolState::OutputAvailable;
    if (s == "output-error") return ToolState::OutputError;
    if (s == "output-denied") return ToolState::OutputDenied;
    throw std::invalid_argument("unknown tool state: " + s);
}

bool ToolInvocationPart::has_output() const {
    if (!output || output->is_null()) return false;
    if (output->is_string()) return !output->get_ref<const std::string&>().empty();
    if (output->is_object() || output->is_array()) return !output->empty();
    return true;
}

Message::Message(std::string id, Role role, std::vector<Part> parts_in)
    : parts(std::move(parts_in)), id_(std::move(id)), role_(role) {}

bool Message::has_text() const {
    for (const auto& p : parts) {
        if (std::holds_alternative<TextPart>(p)) return true;
    }
    return false;
}

std::string Message::text() const {
    std::string out;
    for (const auto& p : parts) {
        if (auto* t = std::get_if<TextPart>(&p)) out += t->text;
    }
    return out;
}

ToolInvocationPart* Message::find_tool(const std::string& tool_call_id) {
    for (auto& p : parts) {
        auto* tool = std::get_if<ToolInvocationPart>(&p);
        if (tool && tool->tool_call_id == tool_call_id) return tool;
    }
    return nullptr;
}

const ToolInvocationPart* Message::find_tool(const std::string& tool_call_id) const {
    for (const auto& p : parts) {
        auto* tool = std::get_if<ToolInvocationPart>(&p);
        if (tool && tool->tool_call_id == tool_call_id) return tool;
    }
    return nullptr;
}

std::vector<const ToolInvocationPart*> Message::tool_parts() const {
    std::vector<const ToolInvocationPart*> result;
    for (const auto& p : parts) {
        if (auto* tool = std::get_if<ToolInvocationPart>(&p)) result.push_back(tool);
    }
    return result;
}

// ── JSON ────────────────────────────────────────────────────────

nlohmann::json part_to_json(const Part& part) {
    if (auto* t = std::get_if<TextPart>(&part)) {
        return {{"type", "text"}, {"text", t->text}};
    }
    if (auto* tool = std::get_if<ToolInvocationPart>(&part)) {
        nlohmann::json j = {
            {"type", "tool-" + tool->tool_name},
            {"toolCallId", tool->tool_call_id},
            {"state", tool_state_to_string(tool->state)},
            {"input", tool->input}
        };
        if (tool->approval) {
            nlohmann::json a = {{"id", tool->approval->id}};
            if (tool->approval->decision) {
                a["approved"] = tool->approval->decision->approved;
                if (tool->approval->decision->reason)
                    a["reason"] = *tool->approval->decision->reason;
            }
            j["approval"] = std::move(a);
        }
        if (tool->output) j["output"] = *tool->output;
        if (tool->error) j["errorText"] = *tool->error;
        return j;
    }
    const auto& other = std::get<OtherPart>(part);
    nlohmann::json j = other.data.is_object() ? other.data : nlohmann::json::object();
    j["type"] = other.type;
    return j;
}

static ToolInvocationPart tool_part_from_json(const nlohmann::json& j,
                                              const std::string& type) {
    ToolInvocationPart tool;
    if (type == "dynamic-tool" || type == "tool-invocation") {
        tool.tool_name = j.value("toolName", "");
    } else {
        tool.tool_name = type.substr(5);
    }
    if (!j.contains("toolCallId") || !j["toolCallId"].is_string())
        throw std::invalid_argument("tool part without toolCallId");
    tool.tool_call_id = j["toolCallId"].get<std::string>();
    if (!j.contains("state") || !j["state"].is_string())
        throw std::invalid_argument("tool part without state");
    tool.state = parse_tool_state(j["state"].get<std::string>());
    if (j.contains("input")) tool.input = j["input"];

    if (j.contains("approval") && j["approval"].is_object()) {
        const auto& a = j["approval"];
        Approval approval;
        approval.id = a.value("id", "");
        if (a.contains("approved") && a["approved"].is_boolean()) {
            ApprovalDecision d;
            d.approved = a["approved"].get<bool>();
            if (a.contains("reason") && a["reason"].is_string())
                d.reason = a["reason"].get<std::string>();
            approval.decision = d;
        }
        tool.approval = std::move(approval);
    }
    if (j.contains("output")) tool.output = j["output"];
    if (j.contains("errorText") && j["errorText"].is_string())
        tool.error = j["errorText"].get<std::string>();
    else if (j.contains("error") && j["error"].is_string())
        tool.error = j["error"].get<std::string>();
    return tool;
}

Part part_from_json(const nlohmann::json& j) {
    if (!j.is_object() || !j.contains("type") || !j["type"].is_string())
        throw std::invalid_argument("part without type");
    std::string type = j["type"].get<std::string>();
    if (type == "text") {
        return TextPart{j.value("text", "")};
    }
    if (type.rfind("tool-", 0) == 0 || type == "dynamic-tool") {
        return tool_part_from_json(j, type);
    }
    OtherPart other;
    other.type = type;
    other.data = j;
    other.data.erase("type");
    return other;
}

nlohmann::json message_to_json(const Message& msg) {
    nlohmann::json parts = nlohmann::json::array();
    for (const auto& p : msg.parts) parts.push_back(part_to_json(p));
    return {{"id", msg.id()}, {"role", role_to_string(msg.role())}, {"parts", parts}};
}

Message message_from_json(const nlohmann::json& j) {
    if (!j.is_object()) throw std::invalid_argument("message is not an object");
    Role role = parse_role(j.value("role", ""));
    Message msg(j.value("id", ""), role);
    if (j.contains("parts") && j["parts"].is_array()) {
        for (const auto& p : j["parts"]) msg.parts.push_back(part_from_json(p));
    }
    return msg;
}

nlohmann::json messages_to_json(const std::vector<Message>& messages) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& m : messages) arr.push_back(message_to_json(m));
    return arr;
}

} // namespace toolgate
