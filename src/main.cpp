#include "config.hpp"
#include "chat_client.hpp"
#include "chunk_log.hpp"
#include "channels/websocket_channel.hpp"
#include "http.hpp"
#include "plugin.hpp"
#include "event_bus.hpp"
#include "event.hpp"
#include "stream_relay.hpp"
#include "util.hpp"
#include <iostream>
#include <string>
#include <cstring>
#include <cstdlib>
#include <atomic>
#include <csignal>

static std::atomic<bool> g_shutdown{false};
static std::atomic<bool> g_interrupt{false};

static void signal_handler(int sig) {
    if (sig == SIGINT) g_interrupt.store(true);
    else g_shutdown.store(true);
}

static void print_usage() {
    std::cout << "Usage: toolgate [options]\n"
              << "\n"
              << "Options:\n"
              << "  -m, --message MSG    Send a single message, wait for the turn and exit\n"
              << "  --mode MODE          Transport: bidi (WebSocket) or sse (HTTP stream)\n"
              << "  --url URL            Backend endpoint for the selected transport\n"
              << "  --timeout MS         Approval response timeout in milliseconds\n"
              << "  --replay FILE        Decode a chunk log and print its events\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Interactive commands:\n"
              << "  /approve ID [why]    Approve a pending tool call\n"
              << "  /deny ID [why]       Deny a pending tool call\n"
              << "  /pending             List pending approvals\n"
              << "  /interrupt           Interrupt the current turn (bidi)\n"
              << "  /audio FILE          Stream raw 16 kHz mono PCM (bidi)\n"
              << "  /status              Show transport and history info\n"
              << "  /clear               Clear conversation history\n"
              << "  /help                Show available commands\n"
              << "  /quit, /exit         Exit the REPL\n"
              << "\n"
              << "Environment variables:\n"
              << "  TOOLGATE_MODE        bidi or sse\n"
              << "  TOOLGATE_WS_URL      WebSocket endpoint (default: ws://localhost:8000/live)\n"
              << "  TOOLGATE_SSE_URL     Stream endpoint (default: http://localhost:8000/stream)\n"
              << "  TOOLGATE_APPROVAL_TIMEOUT_MS  Approval response timeout\n"
              << "  TOOLGATE_LOCATION    \"lat,lon\" reported by get_location\n"
              << "  TOOLGATE_DEBUG       1 to enable debug output\n";
}

static int run_replay(const std::string& path) {
    toolgate::ChunkPlayer player;
    std::string error;
    if (!player.load(path, error)) {
        std::cerr << "Error: " << error << "\n";
        return 1;
    }

    auto result = player.replay([](const toolgate::ProtocolEvent& ev) {
        std::cout << ev.type;
        if (!ev.payload.is_null()) std::cout << " " << ev.payload.dump();
        std::cout << "\n";
    });

    std::cout << "\n" << player.entries().size() << " chunks, "
              << result.events.size() << " events, "
              << result.turns << " turns, "
              << result.malformed_frames << " malformed frames, "
              << result.duplicate_sentinels << " duplicate [DONE]\n"
              << "approval_pending=" << (result.final_state.approval_pending ? "true" : "false")
              << " turn_closed=" << (result.final_state.turn_closed ? "true" : "false") << "\n";
    return 0;
}

// Pump until the turn finishes or waits on the user.
static void wait_for_turn(toolgate::ChatClient& client) {
    while (!g_shutdown.load() && client.busy() && client.pending_approvals().empty()) {
        if (g_interrupt.exchange(false)) {
            client.interrupt(std::string("user interrupt"));
            break;
        }
        if (!client.pump(200)) break;
    }
}

static void print_pending(const toolgate::ChatClient& client) {
    auto pending = client.pending_approvals();
    if (pending.empty()) {
        std::cout << "No pending approvals.\n";
        return;
    }
    for (const auto* part : pending) {
        std::cout << "  " << part->tool_call_id << "  " << part->tool_name << " "
                  << part->input.dump() << "\n";
    }
}

static void handle_decision(toolgate::ChatClient& client, const std::string& args,
                            bool approved) {
    std::string rest = toolgate::trim(args);
    if (rest.empty()) {
        std::cout << "Usage: " << (approved ? "/approve" : "/deny") << " ID [reason]\n";
        return;
    }
    toolgate::ApprovalDecision decision;
    decision.approved = approved;
    auto space = rest.find(' ');
    std::string id = rest.substr(0, space);
    if (space != std::string::npos) {
        std::string reason = toolgate::trim(rest.substr(space + 1));
        if (!reason.empty()) decision.reason = reason;
    }

    auto result = client.respond_to_approval(id, decision);
    if (!result.success) {
        std::cout << "Error: " << result.error << "\n";
        return;
    }
    std::cout << (approved ? "Approved " : "Denied ") << id << " via "
              << toolgate::transport_kind_to_string(result.channel_used) << "\n";
    wait_for_turn(client);
}

int main(int argc, char* argv[]) try {
    std::string message;
    std::string mode;
    std::string url;
    std::string timeout;
    std::string replay_path;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if ((std::strcmp(argv[i], "-m") == 0 || std::strcmp(argv[i], "--message") == 0) && i + 1 < argc) {
            message = argv[++i];
        } else if (std::strcmp(argv[i], "--mode") == 0 && i + 1 < argc) {
            mode = argv[++i];
        } else if (std::strcmp(argv[i], "--url") == 0 && i + 1 < argc) {
            url = argv[++i];
        } else if (std::strcmp(argv[i], "--timeout") == 0 && i + 1 < argc) {
            timeout = argv[++i];
        } else if (std::strcmp(argv[i], "--replay") == 0 && i + 1 < argc) {
            replay_path = argv[++i];
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    if (!replay_path.empty()) return run_replay(replay_path);

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    std::signal(SIGPIPE, SIG_IGN);

    toolgate::http_init();
    toolgate::http_set_abort_flag(&g_interrupt);
    auto config = toolgate::Config::load();

    // Override config with CLI args
    if (!mode.empty()) {
        if (mode != "bidi" && mode != "sse") {
            std::cerr << "Error: --mode must be bidi or sse\n";
            return 1;
        }
        config.mode = mode;
    }
    if (!url.empty()) {
        if (config.is_bidi()) config.bidi.url = url;
        else config.sse.url = url;
    }
    if (!timeout.empty()) {
        char* end = nullptr;
        unsigned long ms = std::strtoul(timeout.c_str(), &end, 10);
        if (!end || *end != '\0') {
            std::cerr << "Error: --timeout expects milliseconds\n";
            return 1;
        }
        config.bidi.approval_timeout_ms = static_cast<uint32_t>(ms);
    }

    toolgate::EventBus bus;
    toolgate::StreamRelay relay(std::cout, bus);
    relay.set_show_latency(config.debug);
    relay.subscribe_events();

    toolgate::PlatformHttpClient http_client;
    toolgate::BidiConfig bidi = config.bidi;
    toolgate::ChatClient client(config, bus,
        [bidi]() -> std::shared_ptr<toolgate::DuplexChannel> {
            return std::make_shared<toolgate::WebSocketChannel>(
                bidi.url, bidi.connect_timeout_ms, bidi.max_message_bytes);
        },
        http_client);

    // Single message mode
    if (!message.empty()) {
        bool ok = client.submit(message);
        wait_for_turn(client);
        std::cout << "\n";
        toolgate::http_cleanup();
        return ok ? 0 : 1;
    }

    std::cout << "toolgate\n"
              << "Transport: " << config.mode << " | "
              << (config.is_bidi() ? config.bidi.url : config.sse.url) << "\n"
              << "Type /help for commands, /quit to exit.\n\n";

    std::string line;
    while (!g_shutdown.load()) {
        std::cout << "toolgate> " << std::flush;

        if (!std::getline(std::cin, line)) {
            // EOF (Ctrl+D)
            std::cout << "\n";
            break;
        }
        g_interrupt.store(false);

        line = toolgate::trim(line);
        if (line.empty()) continue;

        if (line[0] == '/') {
            if (line == "/quit" || line == "/exit") {
                break;
            } else if (line == "/status") {
                const auto& conv = client.conversation();
                std::cout << "Transport: " << config.mode << "\n"
                          << "Conversation: " << conv.id() << "\n"
                          << "History: " << conv.messages().size() << " messages (revision "
                          << conv.revision() << ")\n"
                          << "Pending approvals: " << client.pending_approvals().size() << "\n"
                          << "Resend ledger: " << client.policy().ledger_size() << " entries\n";
                if (auto* conn = client.connection()) {
                    auto channel = conn->channel();
                    std::cout << "Channel: "
                              << (channel ? toolgate::ready_state_to_string(channel->ready_state())
                                          : "none")
                              << "\n";
                }
                std::cout << "Tools:";
                for (const auto& name : client.tool_names()) std::cout << " " << name;
                std::cout << "\n";
            } else if (line == "/clear") {
                client.clear_history();
                std::cout << "History cleared.\n";
            } else if (line == "/pending") {
                print_pending(client);
            } else if (line.compare(0, 8, "/approve") == 0) {
                handle_decision(client, line.substr(8), true);
            } else if (line.compare(0, 5, "/deny") == 0) {
                handle_decision(client, line.substr(5), false);
            } else if (line == "/interrupt") {
                if (client.interrupt()) std::cout << "Interrupted.\n";
            } else if (line.compare(0, 7, "/audio ") == 0) {
                std::string error;
                if (client.send_audio_file(toolgate::trim(line.substr(7)), error)) {
                    std::cout << "Audio sent.\n";
                    wait_for_turn(client);
                } else {
                    std::cout << "Error: " << error << "\n";
                }
            } else if (line == "/help") {
                std::cout << "Commands:\n"
                          << "  /approve ID [why]  Approve a pending tool call\n"
                          << "  /deny ID [why]     Deny a pending tool call\n"
                          << "  /pending           List pending approvals\n"
                          << "  /interrupt         Interrupt the current turn\n"
                          << "  /audio FILE        Stream raw PCM audio\n"
                          << "  /status            Show current status\n"
                          << "  /clear             Clear conversation history\n"
                          << "  /quit              Exit\n"
                          << "  /help              Show this help\n";
            } else {
                std::cout << "Unknown command: " << line << "\n";
            }
            continue;
        }

        client.submit(line);
        wait_for_turn(client);
        std::cout << "\n";
        if (!client.pending_approvals().empty()) print_pending(client);
    }

    if (client.is_bidi() && client.busy()) client.interrupt();
    toolgate::http_cleanup();
    return 0;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
