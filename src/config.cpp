#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>

namespace toolgate {

nlohmann::json Config::defaults_json() {
    return {
        {"mode", "bidi"},
        {"debug", false},
        {"bidi", {
            {"url", "ws://localhost:8000/live"},
            {"connect_timeout_ms", 30000},
            {"approval_timeout_ms", 60000},
            {"ping_interval_ms", 2000},
            {"max_message_bytes", 16 * 1024 * 1024}
        }},
        {"sse", {
            {"url", "http://localhost:8000/stream"},
            {"timeout_seconds", 300},
            {"headers", nlohmann::json::object()}
        }},
        {"chunk_log", {
            {"enabled", false},
            {"path", "~/.toolgate/chunks.jsonl"}
        }},
        {"tools", {
            {"location", ""}
        }}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

static void read_u32(const nlohmann::json& obj, const char* key, uint32_t& out) {
    if (obj.contains(key) && obj[key].is_number_integer() && obj[key].get<int64_t>() >= 0)
        out = static_cast<uint32_t>(obj[key].get<int64_t>());
}

static bool parse_u32(const char* text, uint32_t& out) {
    char* end = nullptr;
    unsigned long v = std::strtoul(text, &end, 10);
    if (end == text || *end != '\0') return false;
    out = static_cast<uint32_t>(v);
    return true;
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;

    if (j.contains("mode") && j["mode"].is_string())
        cfg.mode = j["mode"].get<std::string>();
    if (j.contains("debug") && j["debug"].is_boolean())
        cfg.debug = j["debug"].get<bool>();

    if (j.contains("bidi") && j["bidi"].is_object()) {
        auto& b = j["bidi"];
        if (b.contains("url") && b["url"].is_string())
            cfg.bidi.url = b["url"].get<std::string>();
        read_u32(b, "connect_timeout_ms", cfg.bidi.connect_timeout_ms);
        read_u32(b, "approval_timeout_ms", cfg.bidi.approval_timeout_ms);
        read_u32(b, "ping_interval_ms", cfg.bidi.ping_interval_ms);
        read_u32(b, "max_message_bytes", cfg.bidi.max_message_bytes);
    }

    if (j.contains("sse") && j["sse"].is_object()) {
        auto& s = j["sse"];
        if (s.contains("url") && s["url"].is_string())
            cfg.sse.url = s["url"].get<std::string>();
        read_u32(s, "timeout_seconds", cfg.sse.timeout_seconds);
        if (s.contains("headers") && s["headers"].is_object()) {
            for (auto& [name, value] : s["headers"].items()) {
                if (value.is_string())
                    cfg.sse.headers.emplace_back(name, value.get<std::string>());
            }
        }
    }

    if (j.contains("chunk_log") && j["chunk_log"].is_object()) {
        auto& c = j["chunk_log"];
        if (c.contains("enabled") && c["enabled"].is_boolean())
            cfg.chunk_log.enabled = c["enabled"].get<bool>();
        if (c.contains("path") && c["path"].is_string())
            cfg.chunk_log.path = c["path"].get<std::string>();
    }

    if (j.contains("tools") && j["tools"].is_object()) {
        auto& t = j["tools"];
        if (t.contains("location") && t["location"].is_string())
            cfg.tools.location = t["location"].get<std::string>();
    }

    return cfg;
}

Config Config::load() {
    std::string config_path = expand_home("~/.toolgate/config.json");
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                atomic_write_file(config_path, j.dump(4) + "\n");
                std::cerr << "[config] Migrated config with new defaults: "
                          << config_path << "\n";
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Malformed config, using defaults: " << e.what() << "\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n"))
            std::cerr << "[config] Created default config: " << config_path << "\n";
    }

    Config cfg = from_json(j);

    // Environment variables always override config file
    if (const char* v = std::getenv("TOOLGATE_MODE"))
        cfg.mode = v;
    if (const char* v = std::getenv("TOOLGATE_WS_URL"))
        cfg.bidi.url = v;
    if (const char* v = std::getenv("TOOLGATE_SSE_URL"))
        cfg.sse.url = v;
    if (const char* v = std::getenv("TOOLGATE_APPROVAL_TIMEOUT_MS")) {
        if (!parse_u32(v, cfg.bidi.approval_timeout_ms))
            std::cerr << "[config] Ignoring invalid TOOLGATE_APPROVAL_TIMEOUT_MS: " << v << "\n";
    }
    if (const char* v = std::getenv("TOOLGATE_DEBUG"))
        cfg.debug = std::string(v) == "1" || std::string(v) == "true";
    if (const char* v = std::getenv("TOOLGATE_LOCATION"))
        cfg.tools.location = v;

    if (cfg.mode != "bidi" && cfg.mode != "sse") {
        std::cerr << "[config] Unknown mode '" << cfg.mode << "', falling back to bidi\n";
        cfg.mode = "bidi";
    }

    return cfg;
}

} // namespace toolgate
