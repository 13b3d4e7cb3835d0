#pragma once
#include <atomic>
#include <string>
#include <cstddef>
#include <sys/types.h>

typedef struct ssl_ctx_st SSL_CTX;
typedef struct ssl_st SSL;

namespace toolgate {

struct ParsedUrl {
    std::string scheme;
    bool tls = false;
    std::string host;
    std::string port;
    std::string path; // includes leading / and query string
};

// Accepts http, https, ws and wss. Throws std::invalid_argument otherwise.
ParsedUrl parse_url(const std::string& url);

// RAII TCP connection with optional TLS (OpenSSL).
class SocketConnection {
public:
    SocketConnection() = default;
    ~SocketConnection();
    SocketConnection(const SocketConnection&) = delete;
    SocketConnection& operator=(const SocketConnection&) = delete;

    bool connect(const ParsedUrl& url, long timeout_secs);

    // >0 bytes read, 0 on EOF, -1 on error or abort.
    // Socket timeouts are 1-second slices so the abort flag is honoured.
    ssize_t read_some(char* buf, size_t len);

    bool write_all(const char* buf, size_t len);

    // True if data is ready within timeout_ms (buffered TLS data counts).
    bool wait_readable(int timeout_ms);

    bool is_open() const { return fd_ >= 0; }

    // Global flag checked by reads; set once at startup.
    static void set_abort_flag(const std::atomic<bool>* flag);

    // Long-lived connections opt out so an interrupt aborts only requests.
    void set_abortable(bool abortable) { abortable_ = abortable; }

private:
    void set_socket_timeout(long secs);

    int      fd_  = -1;
    SSL_CTX* ctx_ = nullptr;
    SSL*     ssl_ = nullptr;
    bool     abortable_ = true;
};

} // namespace toolgate
