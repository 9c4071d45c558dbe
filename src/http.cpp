// libcurl HTTP client for non-Linux builds. Linux uses http_socket.cpp.
#ifndef __linux__

#include "http.hpp"

#include <curl/curl.h>
#include <memory>
#include <string>

namespace docrelay {

static const std::atomic<bool>* g_abort_flag = nullptr;

void http_init() {
    curl_global_init(CURL_GLOBAL_ALL);
}

void http_cleanup() {
    curl_global_cleanup();
}

void http_set_abort_flag(const std::atomic<bool>* flag) {
    g_abort_flag = flag;
}

static const char* const kReceiverAbort = "aborted by receiver";

// State shared with the curl callbacks for one POST.
struct Transfer {
    CURL* curl = nullptr;
    const std::atomic<bool>* cancel = nullptr;
    StreamHandlers* stream = nullptr; // null: collect into body
    std::string body;
    bool head_delivered = false;
    bool refused = false;
};

// Hands status and content type to on_head once, before the first body
// bytes, or after the transfer when the body was empty.
static bool deliver_head(Transfer& t) {
    if (t.head_delivered) return true;
    t.head_delivered = true;
    if (!t.stream || !t.stream->on_head) return true;

    long status = 0;
    char* content_type = nullptr;
    curl_easy_getinfo(t.curl, CURLINFO_RESPONSE_CODE, &status);
    curl_easy_getinfo(t.curl, CURLINFO_CONTENT_TYPE, &content_type);
    return t.stream->on_head(status, content_type ? content_type : "");
}

static size_t on_body(char* data, size_t size, size_t nmemb, void* userdata) {
    auto& t = *static_cast<Transfer*>(userdata);
    size_t len = size * nmemb;
    if (t.refused) return 0;

    if (!t.stream) {
        t.body.append(data, len);
        return len;
    }
    if (!deliver_head(t) || (t.stream->on_chunk && !t.stream->on_chunk(data, len))) {
        t.refused = true;
        return 0;
    }
    return len;
}

// curl calls this about once a second; non-zero aborts the transfer.
static int on_progress(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto& t = *static_cast<Transfer*>(userdata);
    if (g_abort_flag && g_abort_flag->load(std::memory_order_relaxed)) return 1;
    return t.cancel && t.cancel->load(std::memory_order_relaxed) ? 1 : 0;
}

struct CurlDeleter {
    void operator()(CURL* c) const { curl_easy_cleanup(c); }
};
struct SlistDeleter {
    void operator()(curl_slist* l) const { curl_slist_free_all(l); }
};

static HttpResponse transfer(const std::string& url,
                             const std::string& body,
                             const std::vector<Header>& headers,
                             long timeout_secs,
                             StreamHandlers* stream) {
    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl) return {0, "", "curl_easy_init failed"};

    curl_slist* raw_list = nullptr;
    for (const auto& h : headers)
        raw_list = curl_slist_append(raw_list, (h.first + ": " + h.second).c_str());
    std::unique_ptr<curl_slist, SlistDeleter> header_list(raw_list);

    Transfer t;
    t.curl = curl.get();
    t.cancel = stream ? stream->cancel : nullptr;
    t.stream = stream;

    CURL* c = curl.get();
    curl_easy_setopt(c, CURLOPT_URL, url.c_str());
    curl_easy_setopt(c, CURLOPT_HTTPHEADER, header_list.get());
    curl_easy_setopt(c, CURLOPT_TIMEOUT, timeout_secs);
    curl_easy_setopt(c, CURLOPT_POST, 1L);
    curl_easy_setopt(c, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(c, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(c, CURLOPT_WRITEFUNCTION, on_body);
    curl_easy_setopt(c, CURLOPT_WRITEDATA, &t);
    curl_easy_setopt(c, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(c, CURLOPT_XFERINFOFUNCTION, on_progress);
    curl_easy_setopt(c, CURLOPT_XFERINFODATA, &t);

    HttpResponse resp;
    CURLcode rc = curl_easy_perform(c);
    curl_easy_getinfo(c, CURLINFO_RESPONSE_CODE, &resp.status_code);
    resp.body = std::move(t.body);

    if (rc != CURLE_OK)
        resp.error = t.refused ? kReceiverAbort : curl_easy_strerror(rc);
    else if (stream && !deliver_head(t))
        resp.error = kReceiverAbort;
    return resp;
}

HttpResponse http_post(const std::string& url,
                       const std::string& body,
                       const std::vector<Header>& headers,
                       long timeout_seconds) {
    return transfer(url, body, headers, timeout_seconds, nullptr);
}

HttpResponse http_stream_post_raw(const std::string& url,
                                  const std::string& body,
                                  const std::vector<Header>& headers,
                                  StreamHandlers handlers,
                                  long timeout_seconds) {
    return transfer(url, body, headers, timeout_seconds, &handlers);
}

HttpResponse PlatformHttpClient::post(const std::string& url,
                                      const std::string& body,
                                      const std::vector<Header>& headers,
                                      long timeout_seconds) {
    return http_post(url, body, headers, timeout_seconds);
}

HttpResponse HttpClient::stream_post_raw(const std::string& url,
                                         const std::string& body,
                                         const std::vector<Header>& headers,
                                         StreamHandlers handlers,
                                         long timeout_seconds) {
    return http_stream_post_raw(url, body, headers, std::move(handlers), timeout_seconds);
}

} // namespace docrelay

#endif // !__linux__
