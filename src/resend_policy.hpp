#pragma once
#include "message.hpp"
#include <string>
#include <unordered_set>
#include <vector>

namespace toolgate {

// Decides after every history mutation whether the conversation must be
// resent to the backend. One instance per conversation session; the ledger
// remembers which approval/output sets were already shipped so the same
// history never triggers two sends.
class ResendPolicy {
public:
    bool should_resend(const std::vector<Message>& history);

    // Record the current approval/output sets of a message as already
    // delivered by some other path (duplex function response, tool result).
    void mark_sent(const Message& msg);

    // Forget everything (history cleared).
    void reset();

    // Drop ledger entries recorded for one message.
    void prune(const std::string& message_id);

    size_t ledger_size() const { return ledger_.size(); }

    static std::string approval_key(const Message& msg);
    static std::string output_key(const Message& msg);

private:
    bool evaluate(const std::vector<Message>& history);

    std::unordered_set<std::string> ledger_;
};

} // namespace toolgate
