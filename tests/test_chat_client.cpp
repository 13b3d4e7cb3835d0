#include <catch2/catch.hpp>
#include "chat_client.hpp"
#include "event_bus.hpp"
#include "mock_channel.hpp"
#include "mock_http_client.hpp"
#include "tools/get_location.hpp"
#include "util.hpp"
#include <filesystem>
#include <fstream>

using namespace toolgate;

// Frontend tool that runs without approval and echoes its input
class EchoTool : public Tool {
public:
    bool fail = false;
    int calls = 0;

    ToolResult execute(const std::string& args_json) override {
        calls++;
        if (fail) return ToolResult{false, "echo failed"};
        auto args = nlohmann::json::parse(args_json);
        return ToolResult{true, nlohmann::json{{"echo", args.value("text", "")}}.dump()};
    }
    std::string tool_name() const override { return "echo"; }
    std::string description() const override { return "Echo"; }
    std::string parameters_json() const override { return R"({"type":"object"})"; }
};

// Collects everything published on the bus
struct Recorder {
    std::vector<std::string> deltas;
    std::vector<ApprovalRequiredEvent> approvals;
    std::vector<ToolExecutedEvent> executed;
    std::vector<TurnClosedEvent> closed;
    std::vector<StreamError> errors;
    std::vector<ResendEvent> resends;
    int updates = 0;

    explicit Recorder(EventBus& bus) {
        subscribe<TextDeltaEvent>(bus, [this](const TextDeltaEvent& e) { deltas.push_back(e.delta); });
        subscribe<ApprovalRequiredEvent>(bus, [this](const ApprovalRequiredEvent& e) {
            approvals.push_back(e);
        });
        subscribe<ToolExecutedEvent>(bus, [this](const ToolExecutedEvent& e) {
            executed.push_back(e);
        });
        subscribe<TurnClosedEvent>(bus, [this](const TurnClosedEvent& e) { closed.push_back(e); });
        subscribe<TransportErrorEvent>(bus, [this](const TransportErrorEvent& e) {
            errors.push_back(e.error);
        });
        subscribe<ResendEvent>(bus, [this](const ResendEvent& e) { resends.push_back(e); });
        subscribe<ConversationUpdatedEvent>(bus, [this](const ConversationUpdatedEvent&) {
            updates++;
        });
    }
};

static std::string frame(const nlohmann::json& j) { return "data: " + j.dump() + "\n\n"; }

static MockHttpClient::StreamResponse sse(std::initializer_list<nlohmann::json> frames) {
    MockHttpClient::StreamResponse resp;
    for (const auto& f : frames) resp.chunks.push_back(frame(f));
    resp.chunks.push_back("data: [DONE]\n\n");
    return resp;
}

static nlohmann::json text_delta(const std::string& text) {
    return {{"type", "text-delta"}, {"id", "t"}, {"delta", text}};
}

static nlohmann::json tool_input(const std::string& id, const std::string& name,
                                 const nlohmann::json& input = nlohmann::json::object()) {
    return {{"type", "tool-input-available"}, {"toolCallId", id}, {"toolName", name},
            {"input", input}};
}

static nlohmann::json approval_request(const std::string& id) {
    return {{"type", "tool-approval-request"}, {"toolCallId", id}, {"approvalId", "ap-" + id}};
}

static nlohmann::json confirmation_input(const std::string& id) {
    return tool_input(id, "adk_request_confirmation",
                      {{"originalFunctionCall", {{"id", "orig-1"}, {"name", "pay"},
                                                 {"args", {{"amount", 5}}}}},
                       {"toolConfirmation", {{"hint", "Pay 5?"}}}});
}

// Stream-mode client with a scripted HTTP backend
struct SseFixture {
    EventBus bus;
    Recorder rec{bus};
    MockHttpClient http;
    std::unique_ptr<ChatClient> client;

    SseFixture() {
        Config cfg;
        cfg.mode = "sse";
        client = std::make_unique<ChatClient>(cfg, bus, ChannelFactory{}, http);
        client->set_tools({});
    }

    nlohmann::json body(size_t i) const { return nlohmann::json::parse(http.bodies.at(i)); }
};

// Duplex-mode client over a MockChannel with a hand-driven clock
struct BidiFixture {
    EventBus bus;
    Recorder rec{bus};
    MockHttpClient http;
    std::shared_ptr<MockChannel> channel = std::make_shared<MockChannel>();
    int64_t now = 5000000;
    std::unique_ptr<ChatClient> client;

    BidiFixture() {
        Config cfg;
        cfg.mode = "bidi";
        cfg.bidi.ping_interval_ms = 0;
        client = std::make_unique<ChatClient>(
            cfg, bus, [this]() -> std::shared_ptr<DuplexChannel> { return channel; }, http,
            [this]() { return now; });
        client->set_tools({});
    }

    void push_sse(const nlohmann::json& j) { channel->push(j); }
};

// ── Stream mode ─────────────────────────────────────────────────

TEST_CASE("ChatClient: stream turn renders text", "[client][sse]") {
    SseFixture f;
    f.http.stream_queue.push_back(sse({{{"type", "start"}, {"messageId", "a1"}},
                                       text_delta("Sun"), text_delta("ny"),
                                       {{"type", "finish"}}}));

    REQUIRE(f.client->submit("weather?"));

    REQUIRE(f.rec.deltas == std::vector<std::string>{"Sun", "ny"});
    REQUIRE(f.rec.closed.size() == 1);
    REQUIRE_FALSE(f.rec.closed[0].failed);
    REQUIRE(f.rec.resends.empty());
    REQUIRE(f.rec.updates > 0);
    REQUIRE_FALSE(f.client->busy());
    REQUIRE_FALSE(f.client->is_bidi());

    const auto& messages = f.client->conversation().messages();
    REQUIRE(messages.size() == 2);
    REQUIRE(messages[1].text() == "Sunny");
    REQUIRE_FALSE(f.body(0).contains("messageId"));
}

TEST_CASE("ChatClient: stream HTTP failure", "[client][sse]") {
    SseFixture f;
    MockHttpClient::StreamResponse resp;
    resp.status_code = 500;
    resp.error_body = "internal";
    f.http.stream_queue.push_back(resp);

    REQUIRE_FALSE(f.client->submit("hi"));
    REQUIRE(f.rec.errors.size() == 1);
    REQUIRE(f.rec.errors[0].message == "HTTP 500: internal");
    REQUIRE(f.rec.closed.size() == 1);
    REQUIRE(f.rec.closed[0].failed);
    REQUIRE(f.rec.resends.empty());
}

TEST_CASE("ChatClient: backend error event reaches the bus", "[client][sse]") {
    SseFixture f;
    f.http.stream_queue.push_back(sse({{{"type", "error"}, {"errorText", "Quota exceeded"}}}));

    f.client->submit("hi");

    REQUIRE(f.rec.errors.size() == 1);
    REQUIRE(f.rec.errors[0].type == ErrorType::RateLimit);
    REQUIRE(*f.client->conversation().last_error() == "Quota exceeded");
}

TEST_CASE("ChatClient: stream approval resends history once", "[client][sse]") {
    SseFixture f;
    f.http.stream_queue.push_back(sse({{{"type", "start"}, {"messageId", "a1"}},
                                       tool_input("c1", "pay", {{"amount", 5}}),
                                       approval_request("c1"), {{"type", "finish"}}}));
    f.http.stream_queue.push_back(sse({{{"type", "start"}, {"messageId", "a2"}},
                                       {{"type", "tool-output-available"}, {"toolCallId", "c1"},
                                        {"output", {{"paid", true}}}},
                                       text_delta("Paid."), {{"type", "finish"}}}));

    f.client->submit("pay 5");

    REQUIRE(f.rec.approvals.size() == 1);
    REQUIRE(f.rec.approvals[0].approval_id == "ap-c1");
    REQUIRE(f.client->pending_approvals().size() == 1);
    REQUIRE(f.http.stream_call_count == 1);

    auto result = f.client->respond_to_approval("ap-c1", ApprovalDecision{true, {}});
    REQUIRE(result.success);
    REQUIRE(result.channel_used == TransportKind::Stream);

    REQUIRE(f.http.stream_call_count == 2);
    REQUIRE(f.rec.resends.size() == 1);
    REQUIRE(f.rec.resends[0].message_id == "a1");

    auto body = f.body(1);
    REQUIRE(body["messageId"] == "a1");
    auto& part = body["messages"][1]["parts"][0];
    REQUIRE(part["state"] == "approval-responded");
    REQUIRE(part["approval"]["approved"] == true);

    const auto& messages = f.client->conversation().messages();
    REQUIRE(messages.size() == 2);
    REQUIRE(messages[1].find_tool("c1")->state == ToolState::OutputAvailable);
    REQUIRE(messages[1].text() == "Paid.");
    REQUIRE(f.client->pending_approvals().empty());
}

TEST_CASE("ChatClient: unknown approval id", "[client][sse]") {
    SseFixture f;
    auto result = f.client->respond_to_approval("nope", ApprovalDecision{true, {}});
    REQUIRE_FALSE(result.success);
    REQUIRE(result.error == "no pending approval for nope");
    REQUIRE(f.http.stream_call_count == 0);
}

TEST_CASE("ChatClient: stream confirmation answers the wrapper", "[client][sse]") {
    SseFixture f;
    f.http.stream_queue.push_back(sse({{{"type", "start"}, {"messageId", "a1"}},
                                       confirmation_input("confirmation-1"),
                                       {{"type", "finish"}}}));
    f.http.stream_queue.push_back(sse({text_delta("Cancelled."), {{"type", "finish"}}}));

    f.client->submit("pay 5");
    REQUIRE(f.rec.approvals.size() == 1);
    REQUIRE(f.rec.approvals[0].tool_name == "adk_request_confirmation");
    REQUIRE(f.client->pending_approvals().size() == 1);
    REQUIRE(f.http.stream_call_count == 1);

    auto result = f.client->respond_to_approval("confirmation-1", ApprovalDecision{false, {}});
    REQUIRE(result.success);
    REQUIRE(result.channel_used == TransportKind::Stream);
    REQUIRE(f.http.stream_call_count == 2);

    auto part = f.body(1)["messages"][1]["parts"][0];
    REQUIRE(part["toolCallId"] == "confirmation-1");
    REQUIRE(part["state"] == "output-available");
    REQUIRE(part["output"] == nlohmann::json{{"confirmed", false}});
    REQUIRE(f.client->pending_approvals().empty());
}

TEST_CASE("ChatClient: approved frontend tool runs and result is resent", "[client][sse]") {
    SseFixture f;
    std::vector<std::unique_ptr<Tool>> tools;
    tools.push_back(std::make_unique<GetLocationTool>("52.52,13.40,25"));
    f.client->set_tools(std::move(tools));

    f.http.stream_queue.push_back(sse({{{"type", "start"}, {"messageId", "a1"}},
                                       tool_input("c1", "get_location"),
                                       approval_request("c1"), {{"type", "finish"}}}));
    f.http.stream_queue.push_back(sse({text_delta("You are in Berlin."), {{"type", "finish"}}}));

    f.client->submit("where am I?");
    REQUIRE(f.rec.executed.empty());

    f.client->respond_to_approval("c1", ApprovalDecision{true, {}});

    REQUIRE(f.rec.executed.size() == 1);
    REQUIRE(f.rec.executed[0].success);
    REQUIRE(f.http.stream_call_count == 2);
    auto part = f.body(1)["messages"][1]["parts"][0];
    REQUIRE(part["state"] == "output-available");
    REQUIRE(part["output"]["latitude"] == 52.52);
    REQUIRE(f.rec.resends.size() == 1);
}

TEST_CASE("ChatClient: denied frontend tool never runs", "[client][sse]") {
    SseFixture f;
    std::vector<std::unique_ptr<Tool>> tools;
    tools.push_back(std::make_unique<GetLocationTool>("52.52,13.40"));
    f.client->set_tools(std::move(tools));

    f.http.stream_queue.push_back(sse({tool_input("c1", "get_location"),
                                       approval_request("c1"), {{"type", "finish"}}}));
    f.http.stream_queue.push_back(sse({text_delta("Okay."), {{"type", "finish"}}}));

    f.client->submit("where am I?");
    f.client->respond_to_approval("c1", ApprovalDecision{false, std::string("private")});

    REQUIRE(f.rec.executed.empty());
    REQUIRE(f.http.stream_call_count == 2);
    auto part = f.body(1)["messages"][1]["parts"][0];
    REQUIRE(part["approval"]["approved"] == false);
    REQUIRE(part["approval"]["reason"] == "private");
}

TEST_CASE("ChatClient: failed frontend tool does not resend", "[client][sse]") {
    SseFixture f;
    auto echo = std::make_unique<EchoTool>();
    echo->fail = true;
    EchoTool* raw = echo.get();
    std::vector<std::unique_ptr<Tool>> tools;
    tools.push_back(std::move(echo));
    f.client->set_tools(std::move(tools));

    f.http.stream_queue.push_back(sse({tool_input("c1", "echo", {{"text", "x"}}),
                                       {{"type", "finish"}}}));

    f.client->submit("echo x");

    REQUIRE(raw->calls == 1);
    REQUIRE(f.rec.executed.size() == 1);
    REQUIRE_FALSE(f.rec.executed[0].success);
    REQUIRE(f.client->conversation().find_tool("c1")->state == ToolState::OutputError);
    REQUIRE(f.http.stream_call_count == 1);
}

TEST_CASE("ChatClient: duplex-only operations in stream mode", "[client][sse]") {
    SseFixture f;
    REQUIRE_FALSE(f.client->interrupt());
    std::string error;
    REQUIRE_FALSE(f.client->send_audio_file("/tmp/none.pcm", error));
    REQUIRE(error == "audio needs the duplex transport");
    REQUIRE(f.client->pump(0));
}

TEST_CASE("ChatClient: clear_history forgets the session", "[client][sse]") {
    SseFixture f;
    f.http.stream_queue.push_back(sse({text_delta("hi"), {{"type", "finish"}}}));
    f.client->submit("hello");
    REQUIRE_FALSE(f.client->conversation().messages().empty());

    f.client->clear_history();
    REQUIRE(f.client->conversation().messages().empty());
    REQUIRE(f.client->policy().ledger_size() == 0);
}

// ── Duplex mode ─────────────────────────────────────────────────

TEST_CASE("ChatClient: duplex approval reuses the paused sequence", "[client][bidi]") {
    BidiFixture f;
    REQUIRE(f.client->is_bidi());
    REQUIRE(f.client->submit("pay 5"));
    REQUIRE(f.channel->count_sent("message") == 1);
    REQUIRE(f.client->busy());

    f.push_sse({{"type", "start"}, {"messageId", "a1"}});
    f.push_sse(tool_input("c1", "pay", {{"amount", 5}}));
    f.push_sse(approval_request("c1"));
    REQUIRE(f.client->pump(0));

    REQUIRE(f.rec.approvals.size() == 1);
    REQUIRE(f.client->connection()->timeout_armed());

    auto result = f.client->respond_to_approval("ap-c1", ApprovalDecision{true, {}});
    REQUIRE(result.success);
    REQUIRE(result.channel_used == TransportKind::Duplex);
    REQUIRE(f.channel->count_sent("message") == 2);
    REQUIRE(f.client->connection()->sequences_opened() == 1);
    REQUIRE(f.channel->sent_json(1)["messageId"] == "a1");

    f.push_sse({{"type", "tool-output-available"}, {"toolCallId", "c1"}, {"output", "done"}});
    f.push_sse(text_delta("Paid."));
    f.push_sse({{"type", "finish"}});
    f.channel->push_done();
    REQUIRE(f.client->pump(0));

    REQUIRE_FALSE(f.client->busy());
    REQUIRE(f.rec.closed.size() == 1);
    REQUIRE_FALSE(f.rec.closed[0].failed);
    REQUIRE(f.rec.resends.size() == 1);
    REQUIRE(f.channel->count_sent("message") == 2);
    REQUIRE(f.client->conversation().messages().back().text() == "Paid.");
}

TEST_CASE("ChatClient: new turn after a closed one opens a new sequence", "[client][bidi]") {
    BidiFixture f;
    f.client->submit("one");
    f.push_sse(text_delta("1"));
    f.push_sse({{"type", "finish"}});
    f.channel->push_done();
    f.client->pump(0);

    f.client->submit("two");
    REQUIRE(f.client->connection()->sequences_opened() == 2);
    REQUIRE(f.channel->connect_calls == 1);
}

TEST_CASE("ChatClient: duplex confirmation targets the original call", "[client][bidi]") {
    BidiFixture f;
    f.client->submit("pay 5");
    f.push_sse({{"type", "start"}, {"messageId", "a1"}});
    f.push_sse(confirmation_input("confirmation-1"));
    f.client->pump(0);
    REQUIRE(f.client->pending_approvals().size() == 1);

    auto result = f.client->respond_to_approval("confirmation-1",
                                                ApprovalDecision{true, std::string("go ahead")});

    REQUIRE(result.success);
    REQUIRE(result.channel_used == TransportKind::Duplex);
    REQUIRE(f.channel->sent.size() == 2);
    auto part = f.channel->sent_json(1)["messages"][0]["content"][0];
    REQUIRE(part["toolCallId"] == "orig-1");
    REQUIRE(part["toolName"] == "pay");
    REQUIRE(part["result"]["approved"] == true);
    REQUIRE(part["result"]["user_message"] == "go ahead");

    // Already delivered on the channel: no history resend
    REQUIRE(f.rec.resends.empty());
    REQUIRE(f.client->pending_approvals().empty());
    REQUIRE(f.client->conversation().find_tool("confirmation-1")->state ==
            ToolState::OutputAvailable);

    // The backend was still streaming, so its answer arrives on the same sequence
    REQUIRE(f.client->busy());
    f.push_sse(text_delta("Paid."));
    f.push_sse({{"type", "finish"}});
    f.channel->push_done();
    REQUIRE(f.client->pump(0));

    REQUIRE(f.client->connection()->sequences_opened() == 1);
    REQUIRE(f.client->conversation().messages().back().text() == "Paid.");
    REQUIRE_FALSE(f.client->busy());
    REQUIRE(f.rec.closed.size() == 1);
    REQUIRE(f.rec.resends.empty());
}

TEST_CASE("ChatClient: duplex confirmation after a closed turn reads the reply", "[client][bidi]") {
    BidiFixture f;
    f.client->submit("pay 5");
    f.push_sse({{"type", "start"}, {"messageId", "a1"}});
    f.push_sse(confirmation_input("confirmation-1"));
    f.push_sse({{"type", "finish"}});
    f.channel->push_done();
    f.client->pump(0);
    REQUIRE_FALSE(f.client->busy());
    REQUIRE(f.rec.closed.size() == 1);

    auto result = f.client->respond_to_approval("confirmation-1", ApprovalDecision{true, {}});
    REQUIRE(result.success);
    REQUIRE(result.channel_used == TransportKind::Duplex);
    REQUIRE(f.client->connection()->sequences_opened() == 2);
    REQUIRE(f.client->busy());

    f.push_sse(text_delta("Paid."));
    f.push_sse({{"type", "finish"}});
    f.channel->push_done();
    REQUIRE(f.client->pump(0));

    REQUIRE(f.client->conversation().messages().back().text() == "Paid.");
    REQUIRE(f.rec.deltas.back() == "Paid.");
    REQUIRE(f.rec.closed.size() == 2);
    REQUIRE_FALSE(f.rec.closed[1].failed);
    REQUIRE_FALSE(f.client->connection()->receiver().state().approval_pending);
    REQUIRE_FALSE(f.client->busy());
    REQUIRE(f.rec.resends.empty());
    REQUIRE(f.channel->count_sent("message") == 2);
}

TEST_CASE("ChatClient: duplex confirmation with no channel", "[client][bidi]") {
    BidiFixture f;
    f.client->submit("pay 5");
    f.push_sse(confirmation_input("confirmation-1"));
    f.client->pump(0);
    f.client->connection()->close();
    REQUIRE(f.client->connection()->channel() == nullptr);

    auto result = f.client->respond_to_approval("confirmation-1", ApprovalDecision{true, {}});

    REQUIRE_FALSE(result.success);
    REQUIRE(result.channel_used == TransportKind::None);
    REQUIRE(result.error == "no transport");
    REQUIRE(f.client->pending_approvals().size() == 1);
}

TEST_CASE("ChatClient: duplex confirmation on a lost channel", "[client][bidi]") {
    BidiFixture f;
    f.client->submit("pay 5");
    f.push_sse(confirmation_input("confirmation-1"));
    f.client->pump(0);
    f.channel->state = ReadyState::Closed;

    auto result = f.client->respond_to_approval("confirmation-1", ApprovalDecision{true, {}});

    REQUIRE_FALSE(result.success);
    REQUIRE(result.error == "transport binding lost");
    REQUIRE(f.client->pending_approvals().size() == 1);
}

TEST_CASE("ChatClient: duplex frontend tool result goes out once", "[client][bidi]") {
    BidiFixture f;
    std::vector<std::unique_ptr<Tool>> tools;
    tools.push_back(std::make_unique<EchoTool>());
    f.client->set_tools(std::move(tools));

    f.client->submit("echo hi");
    f.push_sse({{"type", "start"}, {"messageId", "a1"}});
    f.push_sse(tool_input("c1", "echo", {{"text", "hi"}}));
    f.push_sse({{"type", "finish"}});
    f.channel->push_done();
    f.client->pump(0);

    REQUIRE(f.rec.executed.size() == 1);
    REQUIRE(f.channel->count_sent("tool_result") == 1);
    auto result = f.channel->sent_json(1);
    REQUIRE(result["toolCallId"] == "c1");
    REQUIRE(result["result"]["echo"] == "hi");
    REQUIRE(f.rec.resends.empty());
    REQUIRE(f.channel->count_sent("message") == 1);

    // The turn that issued the call had ended; the answer comes on a new sequence
    REQUIRE(f.client->connection()->sequences_opened() == 2);
    REQUIRE(f.client->busy());
    f.push_sse(text_delta("You said hi."));
    f.push_sse({{"type", "finish"}});
    f.channel->push_done();
    REQUIRE(f.client->pump(0));

    REQUIRE(f.client->conversation().messages().back().text() == "You said hi.");
    REQUIRE(f.rec.closed.size() == 2);
    REQUIRE_FALSE(f.client->busy());
    REQUIRE(f.rec.executed.size() == 1);
    REQUIRE(f.channel->count_sent("tool_result") == 1);
    REQUIRE(f.channel->count_sent("message") == 1);
}

TEST_CASE("ChatClient: tool result within an open turn keeps the sequence", "[client][bidi]") {
    BidiFixture f;
    std::vector<std::unique_ptr<Tool>> tools;
    tools.push_back(std::make_unique<EchoTool>());
    f.client->set_tools(std::move(tools));

    f.client->submit("echo hi");
    f.push_sse({{"type", "start"}, {"messageId", "a1"}});
    f.push_sse(tool_input("c1", "echo", {{"text", "hi"}}));
    f.client->pump(0);

    REQUIRE(f.channel->count_sent("tool_result") == 1);
    REQUIRE(f.client->connection()->sequences_opened() == 1);

    f.push_sse(text_delta("ok"));
    f.push_sse({{"type", "finish"}});
    f.channel->push_done();
    f.client->pump(0);

    REQUIRE(f.client->conversation().messages().back().text() == "ok");
    REQUIRE(f.rec.closed.size() == 1);
}

TEST_CASE("ChatClient: tool result on a lost channel falls back to a resend", "[client][bidi]") {
    BidiFixture f;
    std::vector<std::unique_ptr<Tool>> tools;
    tools.push_back(std::make_unique<EchoTool>());
    f.client->set_tools(std::move(tools));

    f.client->submit("echo hi");
    f.push_sse(tool_input("c1", "echo", {{"text", "hi"}}));
    f.push_sse({{"type", "finish"}});
    f.channel->push_done();
    f.channel->fail_sends = true;
    f.client->pump(0);

    REQUIRE(f.rec.executed.size() == 1);
    REQUIRE(f.channel->count_sent("tool_result") == 0);
    REQUIRE(f.rec.errors.size() >= 1);
    REQUIRE(f.rec.errors[0].type == ErrorType::Network);
    // Not delivered, so the policy ships the output with the history instead
    REQUIRE(f.rec.resends.size() == 1);
}

TEST_CASE("ChatClient: settled tool calls are forgotten once answered", "[client][bidi]") {
    BidiFixture f;
    std::vector<std::unique_ptr<Tool>> tools;
    tools.push_back(std::make_unique<EchoTool>());
    f.client->set_tools(std::move(tools));

    f.client->submit("echo hi");
    f.push_sse({{"type", "start"}, {"messageId", "a1"}});
    f.push_sse(tool_input("c1", "echo", {{"text", "hi"}}));
    f.push_sse({{"type", "finish"}});
    f.channel->push_done();
    f.client->pump(0);
    REQUIRE(f.client->tracked_call_count() == 1);

    f.push_sse(text_delta("done"));
    f.push_sse({{"type", "finish"}});
    f.channel->push_done();
    f.client->pump(0);

    REQUIRE(f.client->tracked_call_count() == 0);
    REQUIRE(f.rec.executed.size() == 1);
}

TEST_CASE("ChatClient: pending approvals stay tracked after text", "[client][bidi]") {
    BidiFixture f;
    f.client->submit("pay 5");
    f.push_sse({{"type", "start"}, {"messageId", "a1"}});
    f.push_sse(text_delta("Let me check."));
    f.push_sse(tool_input("c1", "pay"));
    f.push_sse(approval_request("c1"));
    f.push_sse({{"type", "finish"}});
    f.channel->push_done();
    f.client->pump(0);

    REQUIRE(f.rec.approvals.size() == 1);
    REQUIRE(f.client->tracked_call_count() == 1);
}

TEST_CASE("ChatClient: approval timeout fails the turn", "[client][bidi]") {
    BidiFixture f;
    f.client->submit("pay 5");
    f.push_sse(tool_input("c1", "pay"));
    f.push_sse(approval_request("c1"));
    f.client->pump(0);

    f.now += 60001;
    f.client->pump(0);

    REQUIRE(f.rec.errors.size() == 1);
    REQUIRE(f.rec.errors[0].type == ErrorType::Timeout);
    REQUIRE(f.rec.closed.size() == 1);
    REQUIRE(f.rec.closed[0].failed);
    REQUIRE_FALSE(f.client->busy());
}

TEST_CASE("ChatClient: duplex connect failure", "[client][bidi]") {
    BidiFixture f;
    f.channel->connect_ok = false;

    REQUIRE_FALSE(f.client->submit("hi"));
    REQUIRE(f.rec.errors.size() == 1);
    REQUIRE(f.rec.errors[0].type == ErrorType::Network);
    REQUIRE(f.rec.closed.size() == 1);
    REQUIRE(f.rec.closed[0].failed);
}

TEST_CASE("ChatClient: interrupt closes the turn", "[client][bidi]") {
    BidiFixture f;
    f.client->submit("tell me a story");
    f.push_sse(text_delta("Once"));
    f.client->pump(0);
    REQUIRE(f.client->busy());

    REQUIRE(f.client->interrupt(std::string("user")));

    REQUIRE(f.channel->count_sent("interrupt") == 1);
    REQUIRE_FALSE(f.client->busy());
    REQUIRE(f.rec.closed.size() == 1);
}

TEST_CASE("ChatClient: audio file is streamed in chunks", "[client][bidi]") {
    BidiFixture f;
    auto path = std::filesystem::temp_directory_path() / ("toolgate_audio_" + generate_id());
    {
        std::ofstream out(path, std::ios::binary);
        out << std::string(7000, '\x01');
    }

    std::string error;
    REQUIRE(f.client->send_audio_file(path.string(), error));
    std::filesystem::remove(path);

    REQUIRE(f.channel->count_sent("audio_control") == 2);
    REQUIRE(f.channel->count_sent("audio_chunk") == 3);
    REQUIRE(f.channel->sent_json(0)["action"] == "start");
    REQUIRE(f.channel->sent_json(4)["action"] == "stop");
    REQUIRE(f.channel->sent_json(1)["sampleRate"] == 16000);
}

TEST_CASE("ChatClient: audio errors", "[client][bidi]") {
    BidiFixture f;
    std::string error;
    REQUIRE_FALSE(f.client->send_audio_file("/nonexistent/toolgate.pcm", error));
    REQUIRE(error.find("cannot open") != std::string::npos);
}
