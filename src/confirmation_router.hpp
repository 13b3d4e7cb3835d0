#pragma once
#include "channel.hpp"
#include "event_sender.hpp"
#include "message.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace toolgate {

constexpr const char* kConfirmationToolName = "adk_request_confirmation";

enum class TransportKind { None, Duplex, Stream };

const char* transport_kind_to_string(TransportKind kind);

// The pending confirmation wrapper. For duplex transports, `input` carries
// originalFunctionCall {id, name, args} naming the call the backend paused on.
struct ConfirmationInvocation {
    std::string tool_call_id;
    std::string tool_name;
    nlohmann::json input = nlohmann::json::object();

    static ConfirmationInvocation from_part(const ToolInvocationPart& part) {
        return ConfirmationInvocation{part.tool_call_id, part.tool_name, part.input};
    }
};

// Sinks return false when the object they are bound to no longer exists.
using FunctionResponseSink = std::function<bool(const std::string& tool_call_id,
                                                const std::string& tool_name,
                                                const nlohmann::json& response)>;
using ToolOutputSink = std::function<bool(const std::string& tool_name,
                                          const std::string& tool_call_id,
                                          const nlohmann::json& output)>;

// An engaged optional holding an empty function means the caller meant to
// offer that transport but lost its binding.
struct ConfirmationTransport {
    std::optional<FunctionResponseSink> duplex;
    std::optional<ToolOutputSink> stream;
};

struct ConfirmationResult {
    bool success = false;
    TransportKind channel_used = TransportKind::None;
    std::string error;
};

// Deliver a user's approve/deny decision for a confirmation wrapper.
// Never throws; all failures come back in the result.
ConfirmationResult route_confirmation(const ConfirmationInvocation& invocation,
                                      const ApprovalDecision& decision,
                                      const ConfirmationTransport& transport);

// Duplex sink bound to a channel through a weak reference.
FunctionResponseSink make_duplex_confirmation_sink(std::weak_ptr<DuplexChannel> channel,
                                                   EventSender sender = {});

} // namespace toolgate
