#include "socket_connection.hpp"

#include <openssl/ssl.h>
#include <openssl/err.h>

#include <sys/socket.h>
#include <sys/select.h>
#include <sys/time.h>
#include <netdb.h>
#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <stdexcept>

namespace toolgate {

static const std::atomic<bool>* g_socket_abort_flag = nullptr;

void SocketConnection::set_abort_flag(const std::atomic<bool>* flag) {
    g_socket_abort_flag = flag;
}

// ── URL parsing ────────────────────────────────────────────────

ParsedUrl parse_url(const std::string& url) {
    ParsedUrl result{};
    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos)
        throw std::invalid_argument("invalid URL: " + url);

    result.scheme = url.substr(0, scheme_end);
    if (result.scheme != "http" && result.scheme != "https" &&
        result.scheme != "ws" && result.scheme != "wss")
        throw std::invalid_argument("unsupported URL scheme: " + result.scheme);
    result.tls = (result.scheme == "https" || result.scheme == "wss");

    size_t host_start = scheme_end + 3;
    size_t path_start = url.find('/', host_start);
    std::string host_port = (path_start == std::string::npos)
        ? url.substr(host_start)
        : url.substr(host_start, path_start - host_start);
    if (host_port.empty())
        throw std::invalid_argument("URL without host: " + url);

    result.path = (path_start == std::string::npos) ? "/" : url.substr(path_start);

    size_t colon = host_port.find(':');
    if (colon != std::string::npos) {
        result.host = host_port.substr(0, colon);
        result.port = host_port.substr(colon + 1);
    } else {
        result.host = host_port;
        result.port = result.tls ? "443" : "80";
    }
    return result;
}

// ── Connection ─────────────────────────────────────────────────

SocketConnection::~SocketConnection() {
    if (ssl_) { SSL_shutdown(ssl_); SSL_free(ssl_); }
    if (ctx_) SSL_CTX_free(ctx_);
    if (fd_ >= 0) ::close(fd_);
}

bool SocketConnection::connect(const ParsedUrl& url, long timeout_secs) {
    struct addrinfo hints{};
    hints.ai_family   = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* res = nullptr;
    if (getaddrinfo(url.host.c_str(), url.port.c_str(), &hints, &res) != 0)
        return false;

    bool connected = false;
    for (auto* ai = res; ai && !connected; ai = ai->ai_next) {
        fd_ = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd_ < 0) continue;

        // Non-blocking connect so we can honour timeout_secs.
        int flags = fcntl(fd_, F_GETFL, 0);
        fcntl(fd_, F_SETFL, flags | O_NONBLOCK);

        int rc = ::connect(fd_, ai->ai_addr, ai->ai_addrlen);
        if (rc == 0) {
            fcntl(fd_, F_SETFL, flags);
            connected = true;
        } else if (errno == EINPROGRESS) {
            fd_set wset;
            FD_ZERO(&wset);
            FD_SET(fd_, &wset);
            struct timeval tv{timeout_secs, 0};
            rc = select(fd_ + 1, nullptr, &wset, nullptr, &tv);
            if (rc > 0) {
                int err = 0;
                socklen_t elen = sizeof(err);
                getsockopt(fd_, SOL_SOCKET, SO_ERROR, &err, &elen);
                if (err == 0) {
                    fcntl(fd_, F_SETFL, flags);
                    connected = true;
                }
            }
        }
        if (!connected) { ::close(fd_); fd_ = -1; }
    }
    freeaddrinfo(res);
    if (!connected) return false;

    if (url.tls) {
        set_socket_timeout(timeout_secs);

        ctx_ = SSL_CTX_new(TLS_client_method());
        if (!ctx_) return false;
        SSL_CTX_set_verify(ctx_, SSL_VERIFY_PEER, nullptr);
        SSL_CTX_set_default_verify_paths(ctx_);
        SSL_CTX_set_min_proto_version(ctx_, TLS1_2_VERSION);

        ssl_ = SSL_new(ctx_);
        if (!ssl_) return false;
        SSL_set_fd(ssl_, fd_);
        SSL_set_tlsext_host_name(ssl_, url.host.c_str()); // SNI

        if (SSL_connect(ssl_) != 1) return false;
    }

    set_socket_timeout(1);
    return true;
}

ssize_t SocketConnection::read_some(char* buf, size_t len) {
    while (true) {
        if (abortable_ && g_socket_abort_flag &&
            g_socket_abort_flag->load(std::memory_order_relaxed))
            return -1;

        ssize_t n;
        if (ssl_) {
            n = SSL_read(ssl_, buf, static_cast<int>(len));
            if (n > 0) return n;
            int err = SSL_get_error(ssl_, static_cast<int>(n));
            if (err == SSL_ERROR_ZERO_RETURN) return 0;
            if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE)
                continue;
            if (err == SSL_ERROR_SYSCALL &&
                (errno == EAGAIN || errno == EWOULDBLOCK))
                continue; // 1-second slice expired
            return -1;
        } else {
            n = ::recv(fd_, buf, len, 0);
            if (n > 0) return n;
            if (n == 0) return 0;
            if (errno == EAGAIN || errno == EWOULDBLOCK) continue;
            return -1;
        }
    }
}

bool SocketConnection::write_all(const char* buf, size_t len) {
    while (len > 0) {
        ssize_t n;
        if (ssl_) {
            n = SSL_write(ssl_, buf, static_cast<int>(len));
            if (n <= 0) {
                int err = SSL_get_error(ssl_, static_cast<int>(n));
                if (err == SSL_ERROR_WANT_WRITE || err == SSL_ERROR_WANT_READ)
                    continue;
                return false;
            }
        } else {
            n = ::send(fd_, buf, len, 0);
            if (n < 0) {
                if (errno == EAGAIN || errno == EWOULDBLOCK) continue;
                return false;
            }
        }
        buf += n;
        len -= static_cast<size_t>(n);
    }
    return true;
}

bool SocketConnection::wait_readable(int timeout_ms) {
    if (fd_ < 0) return false;
    if (ssl_ && SSL_pending(ssl_) > 0) return true;

    fd_set rset;
    FD_ZERO(&rset);
    FD_SET(fd_, &rset);
    struct timeval tv{timeout_ms / 1000, (timeout_ms % 1000) * 1000};
    int rc = select(fd_ + 1, &rset, nullptr, nullptr, &tv);
    return rc > 0;
}

void SocketConnection::set_socket_timeout(long secs) {
    struct timeval tv{secs, 0};
    setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    setsockopt(fd_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

} // namespace toolgate
