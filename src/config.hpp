#pragma once
#include <string>
#include <cstdint>
#include <vector>
#include <utility>
#include <nlohmann/json.hpp>

namespace toolgate {

struct BidiConfig {
    std::string url = "ws://localhost:8000/live";
    uint32_t connect_timeout_ms = 30000;
    uint32_t approval_timeout_ms = 60000;
    uint32_t ping_interval_ms = 2000;   // 0 disables keepalive
    uint32_t max_message_bytes = 16 * 1024 * 1024;
};

struct SseConfig {
    std::string url = "http://localhost:8000/stream";
    uint32_t timeout_seconds = 300;
    std::vector<std::pair<std::string, std::string>> headers;
};

struct ChunkLogConfig {
    bool enabled = false;
    std::string path = "~/.toolgate/chunks.jsonl";
};

struct ToolsConfig {
    std::string location;  // "lat,lon" reported by get_location; empty = unavailable
};

struct Config {
    std::string mode = "bidi";  // "bidi" or "sse"
    bool debug = false;

    BidiConfig bidi;
    SseConfig sse;
    ChunkLogConfig chunk_log;
    ToolsConfig tools;

    // Load from ~/.toolgate/config.json + env vars
    static Config load();

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Parse an already merged JSON document (no env overrides)
    static Config from_json(const nlohmann::json& j);

    bool is_bidi() const { return mode == "bidi"; }
};

} // namespace toolgate
