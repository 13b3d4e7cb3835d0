// Streaming POST over libcurl (non-Linux builds).
#ifndef __linux__

#include "http.hpp"

#include <curl/curl.h>

#include <iostream>
#include <string>

namespace toolgate {

static const std::atomic<bool>* g_http_abort_flag = nullptr;

void http_init() {
    curl_global_init(CURL_GLOBAL_ALL);
}

void http_cleanup() {
    curl_global_cleanup();
}

void http_set_abort_flag(const std::atomic<bool>* flag) {
    g_http_abort_flag = flag;
}

// Called by curl ~once per second; return non-zero to abort the transfer.
static int abort_progress_cb(void* /*clientp*/,
                              curl_off_t /*dltotal*/, curl_off_t /*dlnow*/,
                              curl_off_t /*ultotal*/, curl_off_t /*ulnow*/) {
    if (g_http_abort_flag && g_http_abort_flag->load(std::memory_order_relaxed))
        return 1;
    return 0;
}

static void apply_abort_hook(CURL* curl) {
    if (g_http_abort_flag) {
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, abort_progress_cb);
    }
}

struct StreamContext {
    CURL* curl;
    const BodyChunkCallback* on_chunk;
    std::string error_body;
    bool aborted = false;
};

static size_t stream_write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    size_t total = size * nmemb;
    auto* ctx = static_cast<StreamContext*>(userdata);
    if (ctx->aborted) return 0;

    long status = 0;
    curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &status);
    if (status >= 400) {
        ctx->error_body.append(ptr, total);
        return total;
    }

    if (!(*ctx->on_chunk)(ptr, total)) {
        ctx->aborted = true;
        return 0;
    }
    return total;
}

static curl_slist* build_headers(const std::vector<Header>& headers) {
    curl_slist* list = nullptr;
    for (const auto& h : headers) {
        std::string entry = h.first + ": " + h.second;
        list = curl_slist_append(list, entry.c_str());
    }
    return list;
}

// ── RAII curl handle with common setup ────────────────────────

struct CurlRequest {
    CURL* curl = curl_easy_init();
    curl_slist* hlist = nullptr;

    CurlRequest() = default;
    ~CurlRequest() {
        curl_slist_free_all(hlist);
        if (curl) curl_easy_cleanup(curl);
    }
    CurlRequest(const CurlRequest&) = delete;
    CurlRequest& operator=(const CurlRequest&) = delete;

    explicit operator bool() const { return curl != nullptr; }
};

static void setup_post(CurlRequest& req, const std::string& url, const std::string& body,
                       const std::vector<Header>& headers, long timeout) {
    req.hlist = build_headers(headers);
    curl_easy_setopt(req.curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(req.curl, CURLOPT_HTTPHEADER, req.hlist);
    curl_easy_setopt(req.curl, CURLOPT_TIMEOUT, timeout);
    curl_easy_setopt(req.curl, CURLOPT_POST, 1L);
    curl_easy_setopt(req.curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(req.curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    apply_abort_hook(req.curl);
}

// ── Public API ────────────────────────────────────────────────

HttpResponse CurlHttpClient::post_stream(const std::string& url,
                                         const std::string& body,
                                         const std::vector<Header>& headers,
                                         BodyChunkCallback on_chunk,
                                         long timeout_seconds) {
    CurlRequest req;
    if (!req) return {};
    setup_post(req, url, body, headers, timeout_seconds);
    StreamContext ctx{req.curl, &on_chunk, {}, false};
    curl_easy_setopt(req.curl, CURLOPT_WRITEFUNCTION, stream_write_cb);
    curl_easy_setopt(req.curl, CURLOPT_WRITEDATA, &ctx);

    HttpResponse response;
    CURLcode res = curl_easy_perform(req.curl);
    if (res == CURLE_OK || (res == CURLE_WRITE_ERROR && ctx.aborted))
        curl_easy_getinfo(req.curl, CURLINFO_RESPONSE_CODE, &response.status_code);
    else
        std::cerr << "[http] " << curl_easy_strerror(res) << "\n";
    response.body = std::move(ctx.error_body);
    return response;
}

} // namespace toolgate

#endif // !__linux__
