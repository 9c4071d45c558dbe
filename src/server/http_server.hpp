#pragma once
#include <string>
#include <functional>
#include <map>
#include <memory>
#include <atomic>
#include <mutex>
#include <thread>
#include <vector>
#include <cstdint>
#include <cstddef>

namespace docrelay {

// A parsed inbound HTTP request from the reverse proxy.
struct InboundRequest {
    std::string method;   // "GET" or "POST"
    std::string path;     // e.g. "/api/generate"
    std::map<std::string, std::string> headers;        // header names lowercased
    std::string body;

    // Return a header value (name is matched lowercased), or "" if absent.
    std::string header(const std::string& name) const;
};

struct InboundResponse {
    int         status       = 200;
    std::string content_type = "application/json";
    std::string body;
};

// Where a handler writes its answer: either one complete response via
// send(), or an event stream via begin_stream() / write_chunk() / end_stream().
class ResponseWriter {
public:
    virtual ~ResponseWriter() = default;

    virtual void send(const InboundResponse& response) = 0;

    // Send a 200 head for a chunked event stream. Returns false if the peer is gone.
    virtual bool begin_stream(const std::string& content_type) = 0;

    // Send one chunk. Returns false if the peer is gone.
    virtual bool write_chunk(const char* data, size_t len) = 0;

    // Send the terminating zero-length chunk.
    virtual void end_stream() = 0;

    // True once send() or begin_stream() has been called.
    virtual bool started() const = 0;
};

// ResponseWriter over a connected socket. HTTP/1.1 chunked encoding for streams.
class SocketResponseWriter : public ResponseWriter {
public:
    explicit SocketResponseWriter(int fd) : fd_(fd) {}

    void send(const InboundResponse& response) override;
    bool begin_stream(const std::string& content_type) override;
    bool write_chunk(const char* data, size_t len) override;
    void end_stream() override;
    bool started() const override { return started_; }

private:
    bool send_all(const char* data, size_t len);

    int  fd_;
    bool started_ = false;
    bool broken_  = false;
};

// Multi-connection TCP HTTP server meant to sit behind a local reverse proxy
// (nginx/Caddy); not exposed to the internet directly. Each accepted
// connection is served on its own worker thread, up to max_connections at a
// time (further connections get 503). One request per connection.
class HttpServer {
public:
    using Handler = std::function<void(const InboundRequest&, ResponseWriter&)>;

    // listen_addr:     "host:port", e.g. "127.0.0.1:8787"
    // max_body:        maximum POST body size in bytes; larger bodies get 413
    // max_connections: concurrent worker limit
    HttpServer(std::string listen_addr, uint32_t max_body,
               uint32_t max_connections, Handler handler);
    ~HttpServer();

    // Start background accept thread. Returns false and populates error on failure.
    bool start(std::string& error);

    // Signal the accept thread to stop, then join it and every worker.
    // Handlers should watch their cancellation flag so long relays end promptly.
    void stop();

    // Port actually bound (useful with port 0 in tests).
    uint16_t bound_port() const { return bound_port_; }

    size_t active_connections() const;

private:
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void accept_loop();
    void handle_connection(int client_fd) const;
    void reap_workers(bool wait_all);

    std::string listen_addr_;
    uint32_t    max_body_;
    uint32_t    max_connections_;
    Handler     handler_;

    int  server_fd_        = -1;
    int  shutdown_pipe_[2] = {-1, -1};
    uint16_t bound_port_   = 0;
    std::atomic<bool> running_{false};
    std::thread thread_;

    mutable std::mutex workers_mutex_;
    std::vector<Worker> workers_;
};

// Parse "host:port" into host and port.  Returns false if the string is
// malformed or the port is out of range. Port 0 is accepted only when
// allow_ephemeral is true.
bool parse_listen_addr(const std::string& addr, std::string& host, uint16_t& port,
                       bool allow_ephemeral = false);

// Parse the request line and headers of a raw HTTP head (without the final
// blank line). Returns false if the request line is malformed.
bool parse_request_head(const std::string& head, InboundRequest& req);

} // namespace docrelay
