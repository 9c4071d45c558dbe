// HTTP/1.1 client for Linux builds: POSIX sockets, OpenSSL for https.
// http.cpp holds the libcurl client used on other platforms.
#ifdef __linux__

#include "http.hpp"
#include "util.hpp"

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <string>

namespace docrelay {

static const std::atomic<bool>* g_abort_flag = nullptr;

void http_init() {}
void http_cleanup() {}

void http_set_abort_flag(const std::atomic<bool>* flag) {
    g_abort_flag = flag;
}

static const char* const kReceiverAbort = "aborted by receiver";
static constexpr size_t kReadBlock = 4096;
static constexpr size_t kUntilClose = std::numeric_limits<size_t>::max();

using ByteSink = std::function<bool(const char* data, size_t len)>;

// ── Target ──────────────────────────────────────────────────────

struct Target {
    bool secure = false;
    std::string authority; // as written in the URL, sent as Host
    std::string host;
    std::string port;
    std::string resource;  // path and query, starts with '/'
};

static bool split_url(const std::string& url, Target& out, std::string& error) {
    size_t start;
    if (starts_with(url, "https://")) {
        out.secure = true;
        start = 8;
    } else if (starts_with(url, "http://")) {
        start = 7;
    } else {
        error = "unsupported URL: " + url;
        return false;
    }

    size_t end = url.find_first_of("/?#", start);
    out.authority = url.substr(start, end == std::string::npos ? end : end - start);
    std::string rest = end == std::string::npos ? "" : url.substr(end);
    rest = rest.substr(0, rest.find('#'));
    if (rest.empty() || rest[0] != '/') rest.insert(0, "/");
    out.resource = rest;

    std::string port;
    if (!out.authority.empty() && out.authority[0] == '[') {
        size_t close = out.authority.find(']');
        if (close == std::string::npos) {
            error = "bad IPv6 host in URL: " + url;
            return false;
        }
        out.host = out.authority.substr(1, close - 1);
        if (out.authority.size() > close + 2 && out.authority[close + 1] == ':')
            port = out.authority.substr(close + 2);
    } else {
        size_t colon = out.authority.rfind(':');
        out.host = out.authority.substr(0, colon);
        if (colon != std::string::npos) port = out.authority.substr(colon + 1);
    }
    if (out.host.empty()) {
        error = "missing host in URL: " + url;
        return false;
    }
    out.port = port.empty() ? (out.secure ? "443" : "80") : port;
    return true;
}

// ── Wire ────────────────────────────────────────────────────────

// One TCP connection, TLS-wrapped for https, closed on destruction.
// After setup every blocking read or write gives up after a second so the
// abort flag, the cancel flag and the deadline are seen on an idle stream.
class Wire {
public:
    using Clock = std::chrono::steady_clock;

    explicit Wire(const std::atomic<bool>* cancel) : cancel_(cancel) {}
    ~Wire() {
        if (ssl_) {
            SSL_shutdown(ssl_);
            SSL_free(ssl_);
        }
        if (ctx_) SSL_CTX_free(ctx_);
        if (fd_ >= 0) ::close(fd_);
    }
    Wire(const Wire&) = delete;
    Wire& operator=(const Wire&) = delete;

    bool open(const Target& target, long timeout_secs) {
        deadline_ = Clock::now() + std::chrono::seconds(timeout_secs);
        if (!dial(target, timeout_secs)) return false;
        if (target.secure) {
            set_io_timeout(timeout_secs);
            if (!start_tls(target.host)) return false;
        }
        set_io_timeout(1);
        return true;
    }

    // Why the last receive() or transmit() failed; empty otherwise.
    const std::string& error() const { return error_; }

    // >0 bytes read, 0 on orderly close, -1 on failure.
    ssize_t receive(char* buf, size_t len) {
        for (;;) {
            if (interrupted()) return -1;

            if (!ssl_) {
                ssize_t n = ::recv(fd_, buf, len, 0);
                if (n >= 0) return n;
                if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
                error_ = std::string("read failed: ") + std::strerror(errno);
                return -1;
            }

            ERR_clear_error();
            errno = 0;
            int n = SSL_read(ssl_, buf, static_cast<int>(len));
            if (n > 0) return n;
            int code = SSL_get_error(ssl_, n);
            if (code == SSL_ERROR_ZERO_RETURN) return 0;
            if (code == SSL_ERROR_WANT_READ || code == SSL_ERROR_WANT_WRITE) continue;
            if (code == SSL_ERROR_SYSCALL) {
                if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
                if (errno == 0) return 0; // peer closed without close_notify
            }
            error_ = "TLS read failed";
            return -1;
        }
    }

    bool transmit(const std::string& data) {
        const char* p = data.data();
        size_t left = data.size();
        while (left > 0) {
            if (interrupted()) return false;

            ssize_t n;
            if (ssl_) {
                ERR_clear_error();
                errno = 0;
                int w = SSL_write(ssl_, p, static_cast<int>(left));
                if (w <= 0) {
                    int code = SSL_get_error(ssl_, w);
                    if (code == SSL_ERROR_WANT_READ || code == SSL_ERROR_WANT_WRITE) continue;
                    if (code == SSL_ERROR_SYSCALL && (errno == EAGAIN || errno == EINTR)) continue;
                    return fail("TLS write failed");
                }
                n = w;
            } else {
                n = ::send(fd_, p, left, MSG_NOSIGNAL);
                if (n < 0) {
                    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
                    return fail(std::string("write failed: ") + std::strerror(errno));
                }
            }
            p += n;
            left -= static_cast<size_t>(n);
        }
        return true;
    }

private:
    bool fail(std::string why) {
        error_ = std::move(why);
        return false;
    }

    bool interrupted() {
        if (g_abort_flag && g_abort_flag->load(std::memory_order_relaxed))
            return !fail("aborted");
        if (cancel_ && cancel_->load(std::memory_order_relaxed))
            return !fail("cancelled");
        if (Clock::now() >= deadline_)
            return !fail("timed out");
        return false;
    }

    bool dial(const Target& target, long timeout_secs) {
        addrinfo hints{};
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;

        addrinfo* found = nullptr;
        int rc = ::getaddrinfo(target.host.c_str(), target.port.c_str(), &hints, &found);
        if (rc != 0)
            return fail("could not resolve host " + target.host + ": " + ::gai_strerror(rc));

        for (addrinfo* ai = found; ai && fd_ < 0; ai = ai->ai_next)
            fd_ = connect_within(ai, timeout_secs);
        ::freeaddrinfo(found);

        if (fd_ < 0) return fail("could not connect to " + target.authority);
        return true;
    }

    // Non-blocking connect bounded by timeout_secs. Returns a blocking fd, or -1.
    static int connect_within(const addrinfo* ai, long timeout_secs) {
        int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
        if (fd < 0) return -1;

        int flags = ::fcntl(fd, F_GETFL, 0);
        ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);

        bool ok = ::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0;
        if (!ok && errno == EINPROGRESS) {
            pollfd pfd{fd, POLLOUT, 0};
            int wait_ms = static_cast<int>(std::min(timeout_secs, 3600L) * 1000);
            if (::poll(&pfd, 1, wait_ms) == 1) {
                int err = 0;
                socklen_t len = sizeof(err);
                ok = ::getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len) == 0 && err == 0;
            }
        }
        if (!ok) {
            ::close(fd);
            return -1;
        }
        ::fcntl(fd, F_SETFL, flags);
        return fd;
    }

    bool start_tls(const std::string& host) {
        ctx_ = SSL_CTX_new(TLS_client_method());
        if (!ctx_) return fail("TLS context setup failed");
        SSL_CTX_set_min_proto_version(ctx_, TLS1_2_VERSION);
        SSL_CTX_set_default_verify_paths(ctx_);
        SSL_CTX_set_verify(ctx_, SSL_VERIFY_PEER, nullptr);

        ssl_ = SSL_new(ctx_);
        if (!ssl_) return fail("TLS session setup failed");
        SSL_set_fd(ssl_, fd_);
        SSL_set_tlsext_host_name(ssl_, host.c_str());
        SSL_set1_host(ssl_, host.c_str());

        ERR_clear_error();
        if (SSL_connect(ssl_) != 1) {
            char reason[256];
            ERR_error_string_n(ERR_get_error(), reason, sizeof(reason));
            return fail(std::string("TLS handshake failed: ") + reason);
        }
        return true;
    }

    void set_io_timeout(long secs) {
        timeval tv{};
        tv.tv_sec = secs;
        ::setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        ::setsockopt(fd_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
    }

    int fd_ = -1;
    SSL_CTX* ctx_ = nullptr;
    SSL* ssl_ = nullptr;
    const std::atomic<bool>* cancel_;
    Clock::time_point deadline_ = Clock::time_point::max();
    std::string error_;
};

// ── Reader ──────────────────────────────────────────────────────

// Buffered reads over a Wire. Bytes fetched past what a call consumed
// wait in pending_ for the next one.
class Reader {
public:
    enum class Flow { Complete, Closed, Refused };

    explicit Reader(Wire& wire) : wire_(wire) {}

    // Next line without its line ending. False on close or failure.
    bool line(std::string& out) {
        size_t nl;
        while ((nl = pending_.find('\n')) == std::string::npos) {
            if (fill() <= 0) return false;
        }
        out.assign(pending_, 0, nl);
        pending_.erase(0, nl + 1);
        if (!out.empty() && out.back() == '\r') out.pop_back();
        return true;
    }

    // Hands the next count bytes to sink as they arrive. kUntilClose
    // forwards everything up to connection close.
    Flow forward(size_t count, const ByteSink& sink) {
        while (count > 0) {
            if (pending_.empty() && fill() <= 0) return Flow::Closed;
            size_t take = std::min(count, pending_.size());
            if (!sink(pending_.data(), take)) return Flow::Refused;
            pending_.erase(0, take);
            if (count != kUntilClose) count -= take;
        }
        return Flow::Complete;
    }

    bool skip(size_t count) {
        return forward(count, [](const char*, size_t) { return true; }) == Flow::Complete;
    }

private:
    ssize_t fill() {
        char buf[kReadBlock];
        ssize_t n = wire_.receive(buf, sizeof(buf));
        if (n > 0) pending_.append(buf, static_cast<size_t>(n));
        return n;
    }

    Wire& wire_;
    std::string pending_;
};

// ── Reply ───────────────────────────────────────────────────────

struct ReplyHead {
    long status = 0;
    bool chunked = false;
    bool sized = false;
    size_t length = 0;
    std::string content_type; // lowercased
};

// Status stays 0 when the reply does not start with an HTTP status line.
static ReplyHead read_head(Reader& in) {
    ReplyHead head;
    std::string line;
    if (!in.line(line) || !starts_with(line, "HTTP/")) return head;

    size_t sp = line.find(' ');
    if (sp == std::string::npos) return head;
    const char* digits = line.c_str() + sp + 1;
    char* end = nullptr;
    long code = std::strtol(digits, &end, 10);
    if (end == digits || code < 100 || code > 999) return head;

    while (in.line(line) && !line.empty()) {
        size_t colon = line.find(':');
        if (colon == std::string::npos) continue;
        std::string name = to_lower(trim(line.substr(0, colon)));
        std::string value = to_lower(trim(line.substr(colon + 1)));

        if (name == "transfer-encoding") {
            head.chunked = value.find("chunked") != std::string::npos;
        } else if (name == "content-length") {
            char* stop = nullptr;
            unsigned long long n = std::strtoull(value.c_str(), &stop, 10);
            if (stop != value.c_str()) {
                head.sized = true;
                head.length = static_cast<size_t>(n);
            }
        } else if (name == "content-type") {
            head.content_type = value;
        }
    }
    head.status = code;
    return head;
}

// Passes the body to sink with chunked framing removed.
static Reader::Flow read_body(Reader& in, const ReplyHead& head, const ByteSink& sink) {
    if (!head.chunked)
        return in.forward(head.sized ? head.length : kUntilClose, sink);

    std::string size_line;
    while (in.line(size_line)) {
        size_t size = std::strtoul(size_line.c_str(), nullptr, 16);
        if (size == 0) return Reader::Flow::Complete;
        Reader::Flow flow = in.forward(size, sink);
        if (flow != Reader::Flow::Complete) return flow;
        if (!in.skip(2)) break;
    }
    return Reader::Flow::Closed;
}

static std::string request_text(const Target& target,
                                const std::string& body,
                                const std::vector<Header>& headers) {
    std::string out;
    out.reserve(256 + body.size());
    out += "POST " + target.resource + " HTTP/1.1\r\n";
    out += "Host: " + target.authority + "\r\n";

    bool sized = false;
    for (const auto& h : headers) {
        out += h.first + ": " + h.second + "\r\n";
        if (to_lower(h.first) == "content-length") sized = true;
    }
    if (!sized) out += "Content-Length: " + std::to_string(body.size()) + "\r\n";
    out += "Connection: close\r\n\r\n";
    out += body;
    return out;
}

// One POST over a fresh connection. With stream set the head and body go
// to its handlers; otherwise the body is collected into the response.
static HttpResponse exchange(const std::string& url,
                             const std::string& body,
                             const std::vector<Header>& headers,
                             long timeout_secs,
                             StreamHandlers* stream) {
    HttpResponse resp;
    Target target;
    if (!split_url(url, target, resp.error)) return resp;

    Wire wire(stream ? stream->cancel : nullptr);
    if (!wire.open(target, timeout_secs) ||
        !wire.transmit(request_text(target, body, headers))) {
        resp.error = wire.error();
        return resp;
    }

    Reader in(wire);
    ReplyHead head = read_head(in);
    if (head.status == 0) {
        resp.error = wire.error().empty() ? "malformed response" : wire.error();
        return resp;
    }
    resp.status_code = head.status;

    ByteSink sink = [&resp](const char* data, size_t len) {
        resp.body.append(data, len);
        return true;
    };
    if (stream) {
        if (stream->on_head && !stream->on_head(head.status, head.content_type)) {
            resp.error = kReceiverAbort;
            return resp;
        }
        sink = stream->on_chunk ? stream->on_chunk
                                : ByteSink([](const char*, size_t) { return true; });
    }

    Reader::Flow flow = read_body(in, head, sink);
    if (flow == Reader::Flow::Refused) {
        resp.error = kReceiverAbort;
    } else if (!wire.error().empty()) {
        resp.error = wire.error();
    } else if (flow == Reader::Flow::Closed && (head.chunked || head.sized)) {
        // Framed body ended early: a chunk or the Content-Length came up short.
        resp.error = "connection closed before end of body";
    }
    return resp;
}

// ── Public API ──────────────────────────────────────────────────

HttpResponse http_post(const std::string& url,
                       const std::string& body,
                       const std::vector<Header>& headers,
                       long timeout_seconds) {
    return exchange(url, body, headers, timeout_seconds, nullptr);
}

HttpResponse http_stream_post_raw(const std::string& url,
                                  const std::string& body,
                                  const std::vector<Header>& headers,
                                  StreamHandlers handlers,
                                  long timeout_seconds) {
    return exchange(url, body, headers, timeout_seconds, &handlers);
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

#endif // __linux__
