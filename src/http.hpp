#pragma once
#include <atomic>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace docrelay {

// Process-wide transport setup and teardown. Only the libcurl build has
// work to do here.
void http_init();
void http_cleanup();

// Flag polled by every transfer in flight, about once a second. Raised on
// shutdown; a single transfer is cancelled through StreamHandlers::cancel.
void http_set_abort_flag(const std::atomic<bool>* flag);

using Header = std::pair<std::string, std::string>;

// status_code stays 0 when no response head arrived. error is empty when
// the exchange ran to its natural end.
struct HttpResponse {
    long status_code = 0;
    std::string body;
    std::string error;
};

// Receivers for a streamed reply. on_head runs once, before any body
// bytes; on_chunk gets the de-chunked body as it arrives. Returning false
// from either drops the connection.
struct StreamHandlers {
    std::function<bool(long status_code, const std::string& content_type)> on_head;
    std::function<bool(const char* data, size_t len)> on_chunk;
    const std::atomic<bool>* cancel = nullptr;
};

constexpr long kPostTimeoutSeconds = 120;
constexpr long kStreamTimeoutSeconds = 600;

class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual HttpResponse post(const std::string& url,
                              const std::string& body,
                              const std::vector<Header>& headers,
                              long timeout_seconds = kPostTimeoutSeconds) = 0;

    // Defaults to http_stream_post_raw().
    virtual HttpResponse stream_post_raw(const std::string& url,
                                         const std::string& body,
                                         const std::vector<Header>& headers,
                                         StreamHandlers handlers,
                                         long timeout_seconds = kStreamTimeoutSeconds);
};

// Sockets plus OpenSSL on Linux (http_socket.cpp), libcurl elsewhere
// (http.cpp). The build compiles exactly one of the two.
class PlatformHttpClient : public HttpClient {
public:
    HttpResponse post(const std::string& url,
                      const std::string& body,
                      const std::vector<Header>& headers,
                      long timeout_seconds = kPostTimeoutSeconds) override;
};

HttpResponse http_post(const std::string& url,
                       const std::string& body,
                       const std::vector<Header>& headers,
                       long timeout_seconds = kPostTimeoutSeconds);

// The reply body goes to handlers.on_chunk; HttpResponse::body stays empty.
HttpResponse http_stream_post_raw(const std::string& url,
                                  const std::string& body,
                                  const std::vector<Header>& headers,
                                  StreamHandlers handlers,
                                  long timeout_seconds = kStreamTimeoutSeconds);

} // namespace docrelay
