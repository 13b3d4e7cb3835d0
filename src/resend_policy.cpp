#include "resend_policy.hpp"
#include <algorithm>
#include <iostream>

namespace toolgate {

static std::string make_key(const std::string& message_id, const char* kind,
                            std::vector<std::string> ids) {
    std::sort(ids.begin(), ids.end());
    std::string key = message_id + ":" + kind + ":";
    for (size_t i = 0; i < ids.size(); ++i) {
        if (i > 0) key += ',';
        key += ids[i];
    }
    return key;
}

std::string ResendPolicy::approval_key(const Message& msg) {
    std::vector<std::string> ids;
    for (const auto* tool : msg.tool_parts()) {
        if (tool->state == ToolState::ApprovalResponded) ids.push_back(tool->tool_call_id);
    }
    return make_key(msg.id(), "approved", std::move(ids));
}

std::string ResendPolicy::output_key(const Message& msg) {
    std::vector<std::string> ids;
    for (const auto* tool : msg.tool_parts()) {
        if (tool->state == ToolState::OutputAvailable && tool->has_output())
            ids.push_back(tool->tool_call_id);
    }
    return make_key(msg.id(), "output", std::move(ids));
}

bool ResendPolicy::should_resend(const std::vector<Message>& history) {
    try {
        return evaluate(history);
    } catch (const std::exception& e) {
        std::cerr << "[resend] Evaluation failed, not resending: " << e.what() << "\n";
        return false;
    }
}

bool ResendPolicy::evaluate(const std::vector<Message>& history) {
    if (history.empty()) return false;
    const Message& last = history.back();
    if (last.role() != Role::Assistant) return false;

    // Backend already answered this turn
    if (last.has_text()) {
        prune(last.id());
        return false;
    }

    auto tools = last.tool_parts();

    // Wait until every approval in the message is answered
    for (const auto* t : tools) {
        if (t->state == ToolState::ApprovalRequested) return false;
    }

    bool has_output = std::any_of(tools.begin(), tools.end(), [](const ToolInvocationPart* t) {
        return t->state == ToolState::OutputAvailable && t->has_output();
    });
    if (has_output) {
        std::string key = output_key(last);
        if (ledger_.insert(key).second) {
            ledger_.insert(approval_key(last));
            return true;
        }
    }

    bool has_responded = std::any_of(tools.begin(), tools.end(), [](const ToolInvocationPart* t) {
        return t->state == ToolState::ApprovalResponded;
    });
    if (!has_responded) return false;

    std::string key = approval_key(last);
    if (ledger_.count(key)) return false;

    for (const auto* t : tools) {
        if (t->state == ToolState::OutputError || t->has_error()) return false;
    }

    ledger_.insert(key);
    return true;
}

void ResendPolicy::mark_sent(const Message& msg) {
    ledger_.insert(approval_key(msg));
    ledger_.insert(output_key(msg));
}

void ResendPolicy::reset() {
    ledger_.clear();
}

void ResendPolicy::prune(const std::string& message_id) {
    std::string prefix = message_id + ":";
    for (auto it = ledger_.begin(); it != ledger_.end();) {
        if (it->compare(0, prefix.size(), prefix) == 0)
            it = ledger_.erase(it);
        else
            ++it;
    }
}

} // namespace toolgate
