#include "confirmation_router.hpp"
#include <iostream>

namespace toolgate {

const char* transport_kind_to_string(TransportKind kind) {
    switch (kind) {
        case TransportKind::None: return "none";
        case TransportKind::Duplex: return "duplex";
        case TransportKind::Stream: return "stream";
    }
    return "none";
}

static ConfirmationResult failure(TransportKind kind, std::string error) {
    std::cerr << "[router] " << error << "\n";
    return ConfirmationResult{false, kind, std::move(error)};
}

static ConfirmationResult route_duplex(const ConfirmationInvocation& invocation,
                                       const ApprovalDecision& decision,
                                       const FunctionResponseSink& sink) {
    const auto& input = invocation.input;
    if (!input.is_object() || !input.contains("originalFunctionCall") ||
        !input["originalFunctionCall"].is_object()) {
        return failure(TransportKind::Duplex, "missing original function call");
    }
    const auto& original = input["originalFunctionCall"];
    if (!original.contains("id") || !original["id"].is_string() ||
        !original.contains("name") || !original["name"].is_string()) {
        return failure(TransportKind::Duplex, "missing original function call");
    }
    if (!sink) return failure(TransportKind::Duplex, "transport binding lost");

    std::string user_message = decision.reason.value_or(
        decision.approved ? "User approved the tool execution."
                          : "User denied the tool execution.");
    nlohmann::json payload = {
        {"approved", decision.approved},
        {"user_message", user_message}
    };

    if (!sink(original["id"].get<std::string>(), original["name"].get<std::string>(), payload))
        return failure(TransportKind::Duplex, "transport binding lost");
    return ConfirmationResult{true, TransportKind::Duplex, {}};
}

static ConfirmationResult route_stream(const ConfirmationInvocation& invocation,
                                       const ApprovalDecision& decision,
                                       const ToolOutputSink& sink) {
    if (!sink) return failure(TransportKind::Stream, "transport binding lost");
    nlohmann::json output = {{"confirmed", decision.approved}};
    if (!sink(kConfirmationToolName, invocation.tool_call_id, output))
        return failure(TransportKind::Stream, "transport binding lost");
    return ConfirmationResult{true, TransportKind::Stream, {}};
}

ConfirmationResult route_confirmation(const ConfirmationInvocation& invocation,
                                      const ApprovalDecision& decision,
                                      const ConfirmationTransport& transport) {
    if (invocation.tool_name != kConfirmationToolName)
        return failure(TransportKind::None, "invalid tool name");

    if (transport.duplex) return route_duplex(invocation, decision, *transport.duplex);
    if (transport.stream) return route_stream(invocation, decision, *transport.stream);
    return failure(TransportKind::None, "no transport");
}

FunctionResponseSink make_duplex_confirmation_sink(std::weak_ptr<DuplexChannel> channel,
                                                   EventSender sender) {
    return [channel = std::move(channel), sender](const std::string& tool_call_id,
                                                  const std::string& tool_name,
                                                  const nlohmann::json& response) {
        auto ch = channel.lock();
        if (!ch) return false;
        return sender.send_function_response(ch.get(), tool_call_id, tool_name, response);
    };
}

} // namespace toolgate
