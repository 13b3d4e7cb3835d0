#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <initializer_list>

namespace toolgate {

const char* error_type_to_string(ErrorType type) {
    switch (type) {
        case ErrorType::RateLimit: return "RATE_LIMIT";
        case ErrorType::Network: return "NETWORK";
        case ErrorType::Validation: return "VALIDATION";
        case ErrorType::Authentication: return "AUTHENTICATION";
        case ErrorType::Timeout: return "TIMEOUT";
        case ErrorType::Unknown: return "UNKNOWN";
    }
    return "UNKNOWN";
}

static std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

static bool contains_any(const std::string& haystack,
                         std::initializer_list<const char*> needles) {
    for (const char* n : needles) {
        if (haystack.find(n) != std::string::npos) return true;
    }
    return false;
}

ErrorType classify_error(const std::string& message) {
    if (message.empty()) return ErrorType::Unknown;
    std::string m = to_lower(message);

    if (contains_any(m, {"resource_exhausted", "resource exhausted", "quota exceeded",
                         "rate limit", "429", "too many requests"}))
        return ErrorType::RateLimit;
    if (contains_any(m, {"timed out", "timeout"}))
        return ErrorType::Timeout;
    if (contains_any(m, {"network", "fetch", "connection"}))
        return ErrorType::Network;
    if (contains_any(m, {"validation", "invalid", "422"}))
        return ErrorType::Validation;
    if (contains_any(m, {"unauthorized", "401", "403"}))
        return ErrorType::Authentication;
    return ErrorType::Unknown;
}

bool is_retryable(ErrorType type) {
    return type == ErrorType::RateLimit || type == ErrorType::Network ||
           type == ErrorType::Timeout;
}

std::optional<long> retry_after_seconds(const std::string& message) {
    std::string m = to_lower(message);
    size_t pos = m.find("retry");
    if (pos == std::string::npos) return std::nullopt;

    // First run of digits after "retry", followed by a time unit
    while (pos < m.size()) {
        pos = m.find_first_of("0123456789", pos);
        if (pos == std::string::npos) return std::nullopt;
        size_t end = m.find_first_not_of("0123456789", pos);
        if (end == std::string::npos) return std::nullopt;
        if (end - pos > 9) {
            pos = end;
            continue;
        }
        long value = std::stol(m.substr(pos, end - pos));
        size_t unit = m.find_first_not_of(' ', end);
        if (unit != std::string::npos) {
            if (m.compare(unit, 6, "second") == 0) return value;
            if (m.compare(unit, 6, "minute") == 0) return value * 60;
            if (m.compare(unit, 4, "hour") == 0) return value * 3600;
        }
        pos = end;
    }
    return std::nullopt;
}

} // namespace toolgate
