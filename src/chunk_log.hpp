#pragma once
#include "channel.hpp"
#include "event_receiver.hpp"
#include "protocol_event.hpp"
#include <cstdint>
#include <fstream>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace toolgate {

constexpr const char* kChunkModeBidi = "adk-bidi";
constexpr const char* kChunkModeSse = "adk-sse";

// One JSONL line of a chunk log.
struct ChunkEntry {
    int64_t timestamp = 0;
    std::string session_id;
    std::string mode;       // adk-bidi | adk-sse
    std::string location;   // frontend-ws-chunk | frontend-sse-chunk
    std::string direction;  // in | out
    uint64_t sequence_number = 0;
    std::string chunk;

    nlohmann::json to_json() const;
    // Throws nlohmann::json::exception on missing or mistyped fields.
    static ChunkEntry from_json(const nlohmann::json& j);
};

// Appends every raw chunk crossing the transport boundary to a JSONL file.
class ChunkLogger {
public:
    ChunkLogger(std::string path, std::string session_id, std::string mode);

    // Returns false (and logs once) if the file cannot be written.
    bool log(const std::string& direction, const std::string& chunk);

    const std::string& path() const { return path_; }
    uint64_t entries_written() const { return sequence_; }

private:
    bool ensure_open();

    std::string path_;
    std::string session_id_;
    std::string mode_;
    std::string location_;
    std::ofstream out_;
    uint64_t sequence_ = 0;
    bool failed_ = false;
};

// Duplex channel decorator that records traffic to a ChunkLogger.
class LoggingChannel : public DuplexChannel {
public:
    LoggingChannel(std::shared_ptr<DuplexChannel> inner, std::shared_ptr<ChunkLogger> logger);

    std::string channel_name() const override { return inner_->channel_name(); }
    ReadyState ready_state() const override { return inner_->ready_state(); }
    bool connect(std::string& error) override { return inner_->connect(error); }
    bool send_text(const std::string& text) override;
    bool poll(int timeout_ms, const TextMessageCallback& on_message) override;
    void close(uint16_t code = 1000, const std::string& reason = "") override {
        inner_->close(code, reason);
    }

private:
    std::shared_ptr<DuplexChannel> inner_;
    std::shared_ptr<ChunkLogger> logger_;
};

// final_state describes the last turn in the log; counters cover all turns.
struct ReplayResult {
    std::vector<ProtocolEvent> events;
    ReceiverState final_state;
    size_t turns = 0;
    size_t malformed_frames = 0;
    size_t duplicate_sentinels = 0;
};

// Loads a chunk log and feeds its inbound chunks back through the decoder.
class ChunkPlayer {
public:
    bool load(const std::string& path, std::string& error);

    const std::vector<ChunkEntry>& entries() const { return entries_; }
    size_t skipped_lines() const { return skipped_; }

    // Entries are replayed in sequence_number order. Duplex chunks are whole
    // messages; stream chunks are arbitrary byte slices of one response.
    ReplayResult replay(const std::function<void(const ProtocolEvent&)>& on_event = {}) const;

private:
    std::vector<ChunkEntry> entries_;
    size_t skipped_ = 0;
};

} // namespace toolgate
