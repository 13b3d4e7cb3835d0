#pragma once
#include <string>
#include <vector>
#include <optional>
#include <variant>
#include <nlohmann/json.hpp>

namespace toolgate {

enum class Role { System, User, Assistant };

inline const char* role_to_string(Role role) {
    switch (role) {
        case Role::System: return "system";
        case Role::User: return "user";
        case Role::Assistant: return "assistant";
    }
    return "user";
}

// Throws std::invalid_argument for anything outside the three roles.
Role parse_role(const std::string& s);

// Lifecycle of one tool invocation, in order of progression.
enum class ToolState {
    InputStreaming,
    InputAvailable,
    ApprovalRequested,
    ApprovalResponded,
    OutputAvailable,
    OutputError,
    OutputDenied
};

const char* tool_state_to_string(ToolState state);

// Throws std::invalid_argument on unknown state strings.
ToolState parse_tool_state(const std::string& s);

struct ApprovalDecision {
    bool approved = false;
    std::optional<std::string> reason;
};

// Approval bookkeeping attached once a part reaches approval-requested.
// `decision` is set exactly once, when the user responds.
struct Approval {
    std::string id;
    std::optional<ApprovalDecision> decision;
};

struct TextPart {
    std::string text;
};

struct ToolInvocationPart {
    std::string tool_call_id;
    std::string tool_name;
    nlohmann::json input = nlohmann::json::object();
    ToolState state = ToolState::InputStreaming;
    std::optional<Approval> approval;
    std::optional<nlohmann::json> output;
    std::optional<std::string> error;

    // True when output is present and not null/empty.
    bool has_output() const;
    bool has_error() const { return error && !error->empty(); }
};

// Any part type the engine does not interpret (files, reasoning, step markers).
struct OtherPart {
    std::string type;
    nlohmann::json data = nlohmann::json::object();
};

using Part = std::variant<TextPart, ToolInvocationPart, OtherPart>;

class Message {
public:
    Message(std::string id, Role role, std::vector<Part> parts = {});

    const std::string& id() const { return id_; }
    Role role() const { return role_; }

    std::vector<Part> parts;

    bool has_text() const;
    std::string text() const;

    ToolInvocationPart* find_tool(const std::string& tool_call_id);
    const ToolInvocationPart* find_tool(const std::string& tool_call_id) const;
    std::vector<const ToolInvocationPart*> tool_parts() const;

private:
    std::string id_;
    Role role_;
};

// ── JSON boundary ───────────────────────────────────────────────
// Tool parts serialize as {"type":"tool-<name>", "toolCallId", "state", ...}.
// Parsing accepts "tool-<name>", "dynamic-tool" and "tool-invocation".

nlohmann::json part_to_json(const Part& part);
Part part_from_json(const nlohmann::json& j);

nlohmann::json message_to_json(const Message& msg);
Message message_from_json(const nlohmann::json& j);

nlohmann::json messages_to_json(const std::vector<Message>& messages);

} // namespace toolgate
