#pragma once
#include "server/http_server.hpp"
#include "config.hpp"
#include "sink.hpp"
#include <atomic>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace docrelay {

class HttpClient;
class ArtifactStore;
struct GenerationSession;

// OutboundSink over a chunked HTTP response.
class EventStreamSink : public OutboundSink {
public:
    explicit EventStreamSink(ResponseWriter& out) : out_(out) {}

    bool open() override;
    bool write(const char* data, size_t len) override;
    void close() override;

private:
    ResponseWriter& out_;
};

// Routes inbound API requests:
//
//   GET  /health
//   POST /api/generate        stream relay, JSON fallback, or action=refine
//   GET  /api/projects/<slug>
//
// Owner identity is taken from the configured owner header. When a proxy
// secret is configured, /api/ requests without a matching x-relay-secret
// are refused and carry no identity.
class Gateway {
public:
    // store may be null (persistence disabled). shutdown is observed by every
    // in-flight relay.
    Gateway(const Config& config, HttpClient& upstream, ArtifactStore* store,
            const std::atomic<bool>* shutdown = nullptr);

    void handle(const InboundRequest& req, ResponseWriter& out);

private:
    void handle_generate(const InboundRequest& req, ResponseWriter& out);
    void handle_refine(const nlohmann::json& body, ResponseWriter& out);
    void handle_project(const std::string& slug, ResponseWriter& out);

    void relay_stream(const nlohmann::json& body, const GenerationSession& session,
                      ResponseWriter& out);
    void generate_json(const nlohmann::json& body, const GenerationSession& session,
                       ResponseWriter& out);

    // Answer with an upstream JSON body, persisting its docs when the
    // session has an owner.
    void reply_with_upstream_json(long status_code, const std::string& body,
                                  const GenerationSession& session,
                                  ResponseWriter& out);

    std::optional<std::string> resolve_owner(const InboundRequest& req) const;
    bool authorized(const InboundRequest& req) const;

    std::string generate_body(const nlohmann::json& body, bool stream) const;

    ServerConfig server_;
    UpstreamConfig upstream_config_;
    HttpClient& upstream_;
    ArtifactStore* store_;
    const std::atomic<bool>* shutdown_;
};

} // namespace docrelay
