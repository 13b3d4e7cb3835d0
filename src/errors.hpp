#pragma once
#include <string>
#include <optional>

namespace toolgate {

enum class ErrorType { RateLimit, Network, Validation, Authentication, Timeout, Unknown };

const char* error_type_to_string(ErrorType type);

// Classify an error message by well-known markers (case-insensitive).
ErrorType classify_error(const std::string& message);

// Rate limits, network failures and timeouts are worth retrying.
bool is_retryable(ErrorType type);

// Extracts "retry ... N second|minute|hour" from a message, in seconds.
std::optional<long> retry_after_seconds(const std::string& message);

// Failure delivered to the application for a stream or approval cycle.
struct StreamError {
    ErrorType type = ErrorType::Unknown;
    std::string message;

    bool retryable() const { return is_retryable(type); }

    static StreamError from_message(const std::string& msg) {
        return StreamError{classify_error(msg), msg};
    }
};

} // namespace toolgate
