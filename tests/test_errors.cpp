#include <catch2/catch.hpp>
#include "errors.hpp"
#include "inbound_sequence.hpp"

using namespace toolgate;

TEST_CASE("classify_error: rate limits", "[errors]") {
    REQUIRE(classify_error("RESOURCE_EXHAUSTED: slow down") == ErrorType::RateLimit);
    REQUIRE(classify_error("Quota exceeded for model") == ErrorType::RateLimit);
    REQUIRE(classify_error("HTTP 429: Too Many Requests") == ErrorType::RateLimit);
}

TEST_CASE("classify_error: other categories", "[errors]") {
    REQUIRE(classify_error("Request timed out") == ErrorType::Timeout);
    REQUIRE(classify_error("Failed to fetch") == ErrorType::Network);
    REQUIRE(classify_error("connection refused") == ErrorType::Network);
    REQUIRE(classify_error("HTTP 422: invalid payload") == ErrorType::Validation);
    REQUIRE(classify_error("HTTP 401: Unauthorized") == ErrorType::Authentication);
    REQUIRE(classify_error("something odd") == ErrorType::Unknown);
    REQUIRE(classify_error("") == ErrorType::Unknown);
}

TEST_CASE("is_retryable: transient categories only", "[errors]") {
    REQUIRE(is_retryable(ErrorType::RateLimit));
    REQUIRE(is_retryable(ErrorType::Network));
    REQUIRE(is_retryable(ErrorType::Timeout));
    REQUIRE_FALSE(is_retryable(ErrorType::Validation));
    REQUIRE_FALSE(is_retryable(ErrorType::Authentication));
    REQUIRE_FALSE(is_retryable(ErrorType::Unknown));
}

TEST_CASE("retry_after_seconds: units", "[errors]") {
    REQUIRE(retry_after_seconds("Please retry in 30 seconds") == std::optional<long>(30));
    REQUIRE(retry_after_seconds("Retry after 2 minutes") == std::optional<long>(120));
    REQUIRE(retry_after_seconds("retry in 1 hour") == std::optional<long>(3600));
    REQUIRE_FALSE(retry_after_seconds("quota exceeded"));
    REQUIRE_FALSE(retry_after_seconds("retry later"));
    REQUIRE_FALSE(retry_after_seconds("retry code 7"));
}

TEST_CASE("StreamError: from_message classifies", "[errors]") {
    auto err = StreamError::from_message("HTTP 503: connection reset");
    REQUIRE(err.type == ErrorType::Network);
    REQUIRE(err.retryable());
    REQUIRE(err.message == "HTTP 503: connection reset");
    REQUIRE(std::string(error_type_to_string(err.type)) == "NETWORK");
}

// ── InboundSequence ─────────────────────────────────────────────

TEST_CASE("InboundSequence: events stay readable after close", "[sequence]") {
    InboundSequence seq(7);
    ProtocolEvent a;
    a.type = "text-delta";
    REQUIRE(seq.push(a));
    REQUIRE(seq.push(ProtocolEvent::done()));
    seq.close();

    REQUIRE(seq.status() == SequenceStatus::Closed);
    REQUIRE_FALSE(seq.push(a));
    REQUIRE(seq.received_count() == 2);

    auto first = seq.next();
    REQUIRE(first);
    REQUIRE(first->type == "text-delta");
    auto rest = seq.drain();
    REQUIRE(rest.size() == 1);
    REQUIRE(rest[0].kind == EventKind::Done);
    REQUIRE_FALSE(seq.next());
}

TEST_CASE("InboundSequence: first terminal status wins", "[sequence]") {
    InboundSequence seq(1);
    seq.fail(StreamError{ErrorType::Timeout, "approval timed out"});
    seq.close();
    seq.fail(StreamError{ErrorType::Network, "later"});

    REQUIRE(seq.status() == SequenceStatus::Failed);
    REQUIRE(seq.error()->type == ErrorType::Timeout);

    InboundSequence closed(2);
    closed.close();
    closed.fail(StreamError{ErrorType::Network, "x"});
    REQUIRE(closed.status() == SequenceStatus::Closed);
    REQUIRE_FALSE(closed.error());
}
