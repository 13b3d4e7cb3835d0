#include "chunk_log.hpp"
#include "frame_codec.hpp"
#include "util.hpp"
#include <algorithm>
#include <filesystem>
#include <iostream>

namespace toolgate {

nlohmann::json ChunkEntry::to_json() const {
    return {
        {"timestamp", timestamp},
        {"session_id", session_id},
        {"mode", mode},
        {"location", location},
        {"direction", direction},
        {"sequence_number", sequence_number},
        {"chunk", chunk}
    };
}

ChunkEntry ChunkEntry::from_json(const nlohmann::json& j) {
    ChunkEntry e;
    e.timestamp = j.at("timestamp").get<int64_t>();
    e.session_id = j.value("session_id", "");
    e.mode = j.at("mode").get<std::string>();
    e.location = j.value("location", "");
    e.direction = j.at("direction").get<std::string>();
    e.sequence_number = j.at("sequence_number").get<uint64_t>();
    const auto& chunk = j.at("chunk");
    e.chunk = chunk.is_string() ? chunk.get<std::string>() : chunk.dump();
    return e;
}

// ── ChunkLogger ─────────────────────────────────────────────────

ChunkLogger::ChunkLogger(std::string path, std::string session_id, std::string mode)
    : path_(expand_home(path)), session_id_(std::move(session_id)), mode_(std::move(mode))
{
    location_ = mode_ == kChunkModeBidi ? "frontend-ws-chunk" : "frontend-sse-chunk";
}

bool ChunkLogger::ensure_open() {
    if (out_.is_open()) return true;
    if (failed_) return false;

    std::error_code ec;
    auto parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) std::filesystem::create_directories(parent, ec);

    out_.open(path_, std::ios::app);
    if (!out_.is_open()) {
        std::cerr << "[chunk_log] Cannot open " << path_ << ", chunk logging disabled\n";
        failed_ = true;
        return false;
    }
    return true;
}

bool ChunkLogger::log(const std::string& direction, const std::string& chunk) {
    if (!ensure_open()) return false;

    ChunkEntry e;
    e.timestamp = epoch_millis();
    e.session_id = session_id_;
    e.mode = mode_;
    e.location = location_;
    e.direction = direction;
    e.sequence_number = ++sequence_;
    e.chunk = chunk;

    // Raw chunks may split UTF-8 sequences; replace rather than throw
    out_ << e.to_json().dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)
         << "\n";
    out_.flush();
    return static_cast<bool>(out_);
}

// ── LoggingChannel ──────────────────────────────────────────────

LoggingChannel::LoggingChannel(std::shared_ptr<DuplexChannel> inner,
                               std::shared_ptr<ChunkLogger> logger)
    : inner_(std::move(inner)), logger_(std::move(logger)) {}

bool LoggingChannel::send_text(const std::string& text) {
    bool ok = inner_->send_text(text);
    if (ok) logger_->log("out", text);
    return ok;
}

bool LoggingChannel::poll(int timeout_ms, const TextMessageCallback& on_message) {
    return inner_->poll(timeout_ms, [&](const std::string& text) {
        logger_->log("in", text);
        on_message(text);
    });
}

// ── ChunkPlayer ─────────────────────────────────────────────────

bool ChunkPlayer::load(const std::string& path, std::string& error) {
    std::ifstream in(expand_home(path));
    if (!in.is_open()) {
        error = "cannot open " + path;
        return false;
    }

    entries_.clear();
    skipped_ = 0;
    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        if (trim(line).empty()) continue;
        auto j = nlohmann::json::parse(line, nullptr, false);
        if (j.is_discarded() || !j.is_object()) {
            std::cerr << "[chunk_log] Skipping malformed line " << line_no << "\n";
            ++skipped_;
            continue;
        }
        try {
            entries_.push_back(ChunkEntry::from_json(j));
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[chunk_log] Skipping line " << line_no << ": " << e.what() << "\n";
            ++skipped_;
        }
    }
    std::stable_sort(entries_.begin(), entries_.end(),
                     [](const ChunkEntry& a, const ChunkEntry& b) {
                         return a.sequence_number < b.sequence_number;
                     });
    return true;
}

ReplayResult ChunkPlayer::replay(const std::function<void(const ProtocolEvent&)>& on_event) const {
    FrameCodec codec;
    EventReceiver receiver;
    ReplayResult result;
    bool after_done = false;

    auto emit = [&](const std::vector<ProtocolEvent>& events) {
        for (const auto& ev : events) {
            // Content after a sentinel belongs to the next turn
            if (after_done && ev.kind != EventKind::Done && ev.kind != EventKind::Pong) {
                result.duplicate_sentinels += receiver.duplicate_sentinels();
                receiver.reset();
                after_done = false;
            }
            if (ev.kind == EventKind::Done && !after_done) {
                after_done = true;
                ++result.turns;
            }
            receiver.observe(ev);
            if (on_event) on_event(ev);
            result.events.push_back(ev);
        }
    };

    for (const auto& entry : entries_) {
        if (entry.direction != "in") continue;
        emit(codec.decode(entry.chunk));
        if (entry.mode == kChunkModeBidi) emit(codec.flush());
    }
    emit(codec.flush());

    result.final_state = receiver.state();
    result.malformed_frames = codec.malformed_count();
    result.duplicate_sentinels += receiver.duplicate_sentinels();
    return result;
}

} // namespace toolgate
