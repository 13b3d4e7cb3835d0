#pragma once
#include <string>

namespace toolgate {

// output is JSON text on success and a human-readable reason on failure.
struct ToolResult {
    bool success;
    std::string output;
};

// A tool the backend asks the frontend to run (location, clipboard, ...).
// Executed locally once its call is available and, where required, approved.
class Tool {
public:
    virtual ~Tool() = default;

    // input_json is the call's input object serialized as JSON.
    virtual ToolResult execute(const std::string& input_json) = 0;

    virtual std::string tool_name() const = 0;
    virtual std::string description() const = 0;
    // JSON schema of the expected input.
    virtual std::string parameters_json() const = 0;

    // Tools that touch user data wait for an approved approval request
    // instead of running as soon as their input is available.
    virtual bool requires_approval() const { return false; }
};

} // namespace toolgate
