// Streaming POST over POSIX sockets and OpenSSL (Linux builds).
#ifdef __linux__

#include "http.hpp"
#include "socket_connection.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

namespace toolgate {

void http_init() {}
void http_cleanup() {}

void http_set_abort_flag(const std::atomic<bool>* flag) {
    SocketConnection::set_abort_flag(flag);
}

// ── Request building ───────────────────────────────────────────

static std::string build_post(const ParsedUrl& url,
                              const std::string& body,
                              const std::vector<Header>& headers) {
    std::string req;
    req.reserve(512 + body.size());
    req += "POST " + url.path + " HTTP/1.1\r\n";
    req += "Host: " + url.host + "\r\n";

    bool has_content_length = false;
    for (const auto& h : headers) {
        req += h.first + ": " + h.second + "\r\n";
        if (h.first == "Content-Length") has_content_length = true;
    }
    if (!body.empty() && !has_content_length)
        req += "Content-Length: " + std::to_string(body.size()) + "\r\n";
    req += "Connection: close\r\n\r\n";
    req += body;
    return req;
}

// ── Response parsing ───────────────────────────────────────────

// Read a CRLF-terminated line, using leftover as a look-ahead buffer.
static std::string read_line(SocketConnection& conn, std::string& leftover) {
    while (true) {
        size_t pos = leftover.find('\n');
        if (pos != std::string::npos) {
            std::string line = leftover.substr(0, pos);
            leftover.erase(0, pos + 1);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            return line;
        }
        char buf[4096];
        ssize_t n = conn.read_some(buf, sizeof(buf));
        if (n <= 0) return "";
        leftover.append(buf, static_cast<size_t>(n));
    }
}

static std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// Parse status line + headers; populates is_chunked / content_length.
static long parse_response_headers(SocketConnection& conn, std::string& leftover,
                                    bool& is_chunked, size_t& content_length) {
    is_chunked     = false;
    content_length = 0;

    std::string status_line = read_line(conn, leftover);
    if (status_line.empty()) return 0;

    // "HTTP/1.1 200 OK": three-digit code after the first space
    size_t sp1 = status_line.find(' ');
    if (sp1 == std::string::npos || sp1 + 4 > status_line.size()) return 0;
    std::string code = status_line.substr(sp1 + 1, 3);
    if (!std::all_of(code.begin(), code.end(),
                     [](unsigned char c) { return std::isdigit(c); }))
        return 0;
    long status = std::strtol(code.c_str(), nullptr, 10);

    while (true) {
        std::string line = read_line(conn, leftover);
        if (line.empty()) break; // blank line ends headers

        size_t colon = line.find(':');
        if (colon == std::string::npos) continue;

        std::string name  = lowercase(line.substr(0, colon));
        std::string value = lowercase(line.substr(colon + 1));
        while (!value.empty() && (value[0] == ' ' || value[0] == '\t'))
            value.erase(0, 1);

        if (name == "transfer-encoding")
            is_chunked = (value.find("chunked") != std::string::npos);
        else if (name == "content-length")
            content_length = std::strtoul(value.c_str(), nullptr, 10);
    }
    return status;
}

// Read exactly n bytes, consuming leftover first.
static bool read_exactly(SocketConnection& conn, std::string& leftover,
                          size_t n, std::string& out) {
    while (n > 0) {
        if (!leftover.empty()) {
            size_t take = std::min(n, leftover.size());
            out.append(leftover, 0, take);
            leftover.erase(0, take);
            n -= take;
            continue;
        }
        char buf[4096];
        ssize_t got = conn.read_some(buf, std::min(n, sizeof(buf)));
        if (got <= 0) return false;
        out.append(buf, static_cast<size_t>(got));
        n -= static_cast<size_t>(got);
    }
    return true;
}

// Hands the body to callback as it is read, undoing chunked encoding.
static bool read_body(SocketConnection& conn, std::string& leftover,
                             bool is_chunked, size_t content_length,
                             const BodyChunkCallback& callback) {
    if (is_chunked) {
        for (;;) {
            std::string size_line = read_line(conn, leftover);
            if (size_line.empty()) break;
            // Chunk size is hex, may have extensions after ';'
            size_t chunk_size = std::strtoul(size_line.c_str(), nullptr, 16);
            if (chunk_size == 0) break;

            size_t remaining = chunk_size;
            while (remaining > 0) {
                if (!leftover.empty()) {
                    size_t take = std::min(remaining, leftover.size());
                    if (!callback(leftover.c_str(), take)) return false;
                    leftover.erase(0, take);
                    remaining -= take;
                    continue;
                }
                char buf[4096];
                ssize_t n = conn.read_some(buf, std::min(remaining, sizeof(buf)));
                if (n <= 0) return true; // server closed mid-chunk
                if (!callback(buf, static_cast<size_t>(n))) return false;
                remaining -= static_cast<size_t>(n);
            }
            std::string crlf;
            if (!read_exactly(conn, leftover, 2, crlf)) return true;
        }
    } else {
        bool use_length = (content_length > 0);
        size_t remaining = content_length;

        while (!use_length || remaining > 0) {
            if (!leftover.empty()) {
                size_t take = use_length
                    ? std::min(remaining, leftover.size())
                    : leftover.size();
                if (!callback(leftover.c_str(), take)) return false;
                leftover.erase(0, take);
                if (use_length) remaining -= take;
                continue;
            }
            size_t want = use_length
                ? std::min(remaining, static_cast<size_t>(4096))
                : 4096;
            char buf[4096];
            ssize_t n = conn.read_some(buf, want);
            if (n <= 0) break;
            if (!callback(buf, static_cast<size_t>(n))) return false;
            if (use_length) remaining -= static_cast<size_t>(n);
        }
    }
    return true;
}

// Opens the connection, sends the request and parses the response head.
static long open_request(SocketConnection& conn, const std::string& url_str,
                         const std::string& body, const std::vector<Header>& headers,
                         long timeout_secs, std::string& leftover,
                         bool& is_chunked, size_t& content_length) {
    ParsedUrl url;
    try {
        url = parse_url(url_str);
    } catch (const std::invalid_argument& e) {
        std::cerr << "[http] " << e.what() << "\n";
        return 0;
    }
    if (!conn.connect(url, timeout_secs)) return 0;

    std::string request = build_post(url, body, headers);
    if (!conn.write_all(request.c_str(), request.size())) return 0;

    return parse_response_headers(conn, leftover, is_chunked, content_length);
}

// ── Public API ─────────────────────────────────────────────────

HttpResponse SocketHttpClient::post_stream(const std::string& url,
                                           const std::string& body,
                                           const std::vector<Header>& headers,
                                           BodyChunkCallback on_chunk,
                                           long timeout_seconds) {
    SocketConnection conn;
    std::string leftover;
    bool   is_chunked     = false;
    size_t content_length = 0;
    long status = open_request(conn, url, body, headers, timeout_seconds,
                               leftover, is_chunked, content_length);
    if (status == 0) return {};

    HttpResponse resp;
    resp.status_code = status;
    if (status < 400) {
        read_body(conn, leftover, is_chunked, content_length, on_chunk);
        return resp;
    }
    read_body(conn, leftover, is_chunked, content_length,
              [&resp](const char* data, size_t len) {
                  resp.body.append(data, len);
                  return true;
              });
    return resp;
}

} // namespace toolgate

#endif // __linux__
