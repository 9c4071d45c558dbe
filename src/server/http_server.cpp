#include "server/http_server.hpp"
#include "util.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <stdexcept>

// Without MSG_NOSIGNAL (macOS) the listener sets SO_NOSIGPIPE instead.
#ifndef MSG_NOSIGNAL
#define MSG_NOSIGNAL 0
#endif

namespace docrelay {

static constexpr size_t kMaxHeadBytes = 16384;
static constexpr int kRequestReadTimeoutSecs = 10;

static void close_fd(int& fd) {
    if (fd >= 0) ::close(fd);
    fd = -1;
}

// ── Request parsing ─────────────────────────────────────────────

std::string InboundRequest::header(const std::string& name) const {
    auto found = headers.find(to_lower(name));
    if (found == headers.end()) return "";
    return found->second;
}

bool parse_listen_addr(const std::string& addr, std::string& host, uint16_t& port,
                       bool allow_ephemeral) {
    size_t colon = addr.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 >= addr.size()) return false;

    std::string digits = addr.substr(colon + 1);
    char* end = nullptr;
    long value = std::strtol(digits.c_str(), &end, 10);
    if (*end != '\0' || value < 0 || value > 65535) return false;
    if (value == 0 && !allow_ephemeral) return false;

    host = addr.substr(0, colon);
    port = static_cast<uint16_t>(value);
    return true;
}

bool parse_request_head(const std::string& head, InboundRequest& req) {
    std::vector<std::string> lines = split(head, '\n');
    for (auto& line : lines) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
    }
    if (lines.empty()) return false;

    // METHOD SP target SP HTTP/x.y
    std::vector<std::string> parts;
    for (const auto& word : split(lines[0], ' ')) {
        if (!word.empty()) parts.push_back(word);
    }
    if (parts.size() != 3 || !starts_with(parts[2], "HTTP/")) return false;

    req.method = parts[0];
    req.path = parts[1].substr(0, parts[1].find('?'));

    for (size_t i = 1; i < lines.size(); ++i) {
        size_t colon = lines[i].find(':');
        if (colon == std::string::npos) continue;
        std::string name = to_lower(trim(lines[i].substr(0, colon)));
        req.headers[name] = trim(lines[i].substr(colon + 1));
    }
    return true;
}

// ── Response writing ────────────────────────────────────────────

static const char* reason_phrase(int status) {
    switch (status) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 413: return "Payload Too Large";
        case 500: return "Internal Server Error";
        case 502: return "Bad Gateway";
        case 503: return "Service Unavailable";
        case 504: return "Gateway Timeout";
        default:  return status < 400 ? "OK" : "Error";
    }
}

static InboundResponse json_error(int status, const char* message) {
    return {status, "application/json", std::string("{\"error\":\"") + message + "\"}"};
}

bool SocketResponseWriter::send_all(const char* data, size_t len) {
    while (!broken_ && len > 0) {
        ssize_t sent = ::send(fd_, data, len, MSG_NOSIGNAL);
        if (sent < 0 && errno == EINTR) continue;
        if (sent <= 0) {
            broken_ = true;
            break;
        }
        data += sent;
        len -= static_cast<size_t>(sent);
    }
    return !broken_;
}

void SocketResponseWriter::send(const InboundResponse& response) {
    if (started_) return;
    started_ = true;

    std::string text = "HTTP/1.1 " + std::to_string(response.status) + " ";
    text += reason_phrase(response.status);
    text += "\r\nContent-Type: " + response.content_type;
    text += "\r\nContent-Length: " + std::to_string(response.body.size());
    text += "\r\nConnection: close\r\n\r\n";
    text += response.body;
    send_all(text.data(), text.size());
}

bool SocketResponseWriter::begin_stream(const std::string& content_type) {
    if (started_) return false;
    started_ = true;

    std::string text = "HTTP/1.1 200 OK\r\nContent-Type: " + content_type + "\r\n";
    text += "Cache-Control: no-cache\r\n";
    text += "Connection: keep-alive\r\n";
    text += "X-Accel-Buffering: no\r\n";
    text += "Transfer-Encoding: chunked\r\n\r\n";
    return send_all(text.data(), text.size());
}

bool SocketResponseWriter::write_chunk(const char* data, size_t len) {
    if (len == 0) return !broken_; // a zero-length chunk would end the body
    char size_line[24];
    int n = std::snprintf(size_line, sizeof(size_line), "%zx\r\n", len);
    if (!send_all(size_line, static_cast<size_t>(n))) return false;
    if (!send_all(data, len)) return false;
    return send_all("\r\n", 2);
}

void SocketResponseWriter::end_stream() {
    send_all("0\r\n\r\n", 5);
}

// ── Connection handling ─────────────────────────────────────────

// Reads one request off fd. On a protocol problem the error reply has
// already been written through out and false is returned.
static bool read_request(int fd, uint32_t max_body, InboundRequest& req, ResponseWriter& out) {
    std::string data;
    char block[4096];
    size_t head_end;

    while ((head_end = data.find("\r\n\r\n")) == std::string::npos) {
        if (data.size() > kMaxHeadBytes) {
            out.send(json_error(400, "Headers too large"));
            return false;
        }
        ssize_t got = ::recv(fd, block, sizeof(block), 0);
        if (got <= 0) return false;
        data.append(block, static_cast<size_t>(got));
    }

    if (!parse_request_head(data.substr(0, head_end), req)) {
        out.send(json_error(400, "Malformed request"));
        return false;
    }
    if (req.method != "POST") return true;

    unsigned long long expected = std::strtoull(req.header("content-length").c_str(), nullptr, 10);
    if (expected > max_body) {
        out.send(json_error(413, "Payload too large"));
        return false;
    }

    req.body = data.substr(head_end + 4);
    while (req.body.size() < expected) {
        ssize_t got = ::recv(fd, block, sizeof(block), 0);
        if (got <= 0) break;
        req.body.append(block, static_cast<size_t>(got));
    }
    if (req.body.size() > expected) req.body.resize(static_cast<size_t>(expected));
    return true;
}

void HttpServer::handle_connection(int fd) const {
    SocketResponseWriter out(fd);
    InboundRequest req;
    if (!read_request(fd, max_body_, req, out)) return;

    try {
        handler_(req, out);
    } catch (const std::exception& e) {
        std::cerr << "[server] " << req.method << " " << req.path
                  << " failed: " << e.what() << "\n";
        if (!out.started()) out.send(json_error(500, "Internal error"));
        return;
    }

    if (!out.started()) out.send(json_error(500, "No response"));
}

// ── HttpServer ──────────────────────────────────────────────────

HttpServer::HttpServer(std::string listen_addr,
                       uint32_t max_body,
                       uint32_t max_connections,
                       Handler handler)
    : listen_addr_(std::move(listen_addr))
    , max_body_(max_body)
    , max_connections_(max_connections == 0 ? 1 : max_connections)
    , handler_(std::move(handler))
{}

HttpServer::~HttpServer() {
    stop();
}

// Bound and listening IPv4 socket, or -1 with error set.
static int open_listener(const std::string& host, uint16_t port, uint16_t& bound_port,
                         std::string& error) {
    sockaddr_in sa{};
    sa.sin_family = AF_INET;
    sa.sin_port = htons(port);
    if (::inet_pton(AF_INET, host.c_str(), &sa.sin_addr) != 1) {
        error = "Invalid bind address: " + host;
        return -1;
    }

    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        error = "Failed to create server socket";
        return -1;
    }
    int one = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
#ifdef SO_NOSIGPIPE
    ::setsockopt(fd, SOL_SOCKET, SO_NOSIGPIPE, &one, sizeof(one));
#endif

    if (::bind(fd, reinterpret_cast<sockaddr*>(&sa), sizeof(sa)) != 0) {
        error = std::string("bind failed: ") + std::strerror(errno);
    } else if (::listen(fd, 64) != 0) {
        error = std::string("listen failed: ") + std::strerror(errno);
    } else {
        socklen_t len = sizeof(sa);
        if (::getsockname(fd, reinterpret_cast<sockaddr*>(&sa), &len) == 0)
            bound_port = ntohs(sa.sin_port);
        return fd;
    }
    ::close(fd);
    return -1;
}

bool HttpServer::start(std::string& error) {
    std::string host;
    uint16_t port = 0;
    if (!parse_listen_addr(listen_addr_, host, port, true)) {
        error = "Invalid listen address: " + listen_addr_;
        return false;
    }

    server_fd_ = open_listener(host, port, bound_port_, error);
    if (server_fd_ < 0) return false;

    if (::pipe(shutdown_pipe_) != 0) {
        error = "Failed to create shutdown pipe";
        close_fd(server_fd_);
        return false;
    }

    running_.store(true);
    thread_ = std::thread(&HttpServer::accept_loop, this);
    return true;
}

void HttpServer::stop() {
    if (!running_.exchange(false)) return;

    char wake = 1;
    if (::write(shutdown_pipe_[1], &wake, 1) < 0)
        std::cerr << "[server] Failed to wake accept loop\n";
    if (thread_.joinable()) thread_.join();
    reap_workers(true);

    close_fd(server_fd_);
    close_fd(shutdown_pipe_[0]);
    close_fd(shutdown_pipe_[1]);
}

size_t HttpServer::active_connections() const {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    size_t busy = 0;
    for (const auto& w : workers_) busy += w.done->load() ? 0 : 1;
    return busy;
}

void HttpServer::reap_workers(bool wait_all) {
    std::vector<Worker> finished;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        size_t i = 0;
        while (i < workers_.size()) {
            if (wait_all || workers_[i].done->load()) {
                finished.push_back(std::move(workers_[i]));
                workers_.erase(workers_.begin() + static_cast<std::ptrdiff_t>(i));
            } else {
                ++i;
            }
        }
    }
    for (auto& w : finished) {
        if (w.thread.joinable()) w.thread.join();
    }
}

void HttpServer::accept_loop() {
    pollfd watch[2] = {
        {server_fd_, POLLIN, 0},
        {shutdown_pipe_[0], POLLIN, 0},
    };

    while (running_.load()) {
        watch[0].revents = watch[1].revents = 0;
        int ready = ::poll(watch, 2, 1000);
        reap_workers(false);
        if (ready <= 0) continue;
        if (watch[1].revents & POLLIN) break;
        if (!(watch[0].revents & POLLIN)) continue;

        int client = ::accept(server_fd_, nullptr, nullptr);
        if (client < 0) continue;

        timeval tv{};
        tv.tv_sec = kRequestReadTimeoutSecs;
        ::setsockopt(client, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

        if (active_connections() >= max_connections_) {
            SocketResponseWriter(client).send(json_error(503, "Server busy"));
            ::close(client);
            continue;
        }

        auto done = std::make_shared<std::atomic<bool>>(false);
        Worker worker{std::thread([this, client, done]() {
            handle_connection(client);
            ::close(client);
            done->store(true);
        }), done};
        std::lock_guard<std::mutex> lock(workers_mutex_);
        workers_.push_back(std::move(worker));
    }
}

} // namespace docrelay
