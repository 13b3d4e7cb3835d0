#pragma once
#include <atomic>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace toolgate {

// Process-wide setup and teardown. No-op on Linux; initialises libcurl elsewhere.
void http_init();
void http_cleanup();

// In-flight transfers stop once *flag becomes true (checked about once a second).
void http_set_abort_flag(const std::atomic<bool>* flag);

using Header = std::pair<std::string, std::string>;

// status_code 0 means the request never produced a response.
// body is only filled for error statuses (>= 400).
struct HttpResponse {
    long status_code = 0;
    std::string body;
};

// Receives response body bytes as they arrive. Return false to stop reading.
using BodyChunkCallback = std::function<bool(const char* data, size_t len)>;

// Streaming POST client used by the SSE transport; injectable for tests.
class HttpClient {
public:
    virtual ~HttpClient() = default;
    virtual HttpResponse post_stream(const std::string& url,
                                     const std::string& body,
                                     const std::vector<Header>& headers,
                                     BodyChunkCallback on_chunk,
                                     long timeout_seconds) = 0;
};

// One implementation per platform; CMakeLists.txt picks the source file.
#ifdef __linux__
class SocketHttpClient : public HttpClient {
public:
    HttpResponse post_stream(const std::string& url,
                             const std::string& body,
                             const std::vector<Header>& headers,
                             BodyChunkCallback on_chunk,
                             long timeout_seconds) override;
};
using PlatformHttpClient = SocketHttpClient;
#else
class CurlHttpClient : public HttpClient {
public:
    HttpResponse post_stream(const std::string& url,
                             const std::string& body,
                             const std::vector<Header>& headers,
                             BodyChunkCallback on_chunk,
                             long timeout_seconds) override;
};
using PlatformHttpClient = CurlHttpClient;
#endif

} // namespace toolgate
