#include "server/gateway.hpp"
#include "artifact_store.hpp"
#include "completion.hpp"
#include "http.hpp"
#include "stream_relay.hpp"
#include "util.hpp"

#include <iostream>

namespace docrelay {

static InboundResponse json_error(int status, const std::string& message) {
    return {status, "application/json", nlohmann::json{{"error", message}}.dump()};
}

static std::string json_string(const nlohmann::json& j, const char* key) {
    if (j.contains(key) && j[key].is_string()) return j[key].get<std::string>();
    return "";
}

// ── EventStreamSink ───────────────────────────────────────────────────────────

bool EventStreamSink::open() {
    return out_.begin_stream("text/event-stream");
}

bool EventStreamSink::write(const char* data, size_t len) {
    return out_.write_chunk(data, len);
}

void EventStreamSink::close() {
    out_.end_stream();
}

// ── Gateway ───────────────────────────────────────────────────────────────────

Gateway::Gateway(const Config& config, HttpClient& upstream, ArtifactStore* store,
                 const std::atomic<bool>* shutdown)
    : server_(config.server)
    , upstream_config_(config.upstream)
    , upstream_(upstream)
    , store_(store)
    , shutdown_(shutdown)
{
    while (!upstream_config_.agent_url.empty() && upstream_config_.agent_url.back() == '/')
        upstream_config_.agent_url.pop_back();
}

void Gateway::handle(const InboundRequest& req, ResponseWriter& out) {
    if (req.path == "/health") {
        if (req.method != "GET") {
            out.send(json_error(405, "Method not allowed"));
            return;
        }
        out.send({200, "application/json", R"({"status":"ok","service":"docrelay"})"});
        return;
    }

    if (starts_with(req.path, "/api/") && !authorized(req)) {
        std::cerr << "[gateway] Rejected " << req.method << " " << req.path
                  << ": bad relay secret\n";
        out.send(json_error(403, "Forbidden"));
        return;
    }

    if (req.path == "/api/generate") {
        if (req.method != "POST") {
            out.send(json_error(405, "Method not allowed"));
            return;
        }
        handle_generate(req, out);
        return;
    }

    const std::string projects_prefix = "/api/projects/";
    if (starts_with(req.path, projects_prefix)) {
        if (req.method != "GET") {
            out.send(json_error(405, "Method not allowed"));
            return;
        }
        std::string slug = req.path.substr(projects_prefix.size());
        if (slug.empty() || slug.find('/') != std::string::npos) {
            out.send(json_error(404, "Not found"));
            return;
        }
        handle_project(slug, out);
        return;
    }

    out.send(json_error(404, "Not found"));
}

bool Gateway::authorized(const InboundRequest& req) const {
    if (server_.proxy_secret.empty()) return true;
    return req.header("x-relay-secret") == server_.proxy_secret;
}

std::optional<std::string> Gateway::resolve_owner(const InboundRequest& req) const {
    std::string owner = trim(req.header(server_.owner_header));
    if (owner.empty()) return std::nullopt;
    return owner;
}

void Gateway::handle_generate(const InboundRequest& req, ResponseWriter& out) {
    auto body = nlohmann::json::parse(req.body, nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        out.send(json_error(400, "Invalid JSON body"));
        return;
    }

    if (json_string(body, "action") == "refine") {
        handle_refine(body, out);
        return;
    }

    GenerationSession session;
    session.repo_url = json_string(body, "repo_url");
    if (session.repo_url.empty()) {
        out.send(json_error(400, "repo_url is required"));
        return;
    }
    session.repo_name = json_string(body, "repo_name");
    if (session.repo_name.empty()) session.repo_name = repo_name_from_url(session.repo_url);
    session.owner = resolve_owner(req);

    bool stream = body.contains("stream") && body["stream"].is_boolean() && body["stream"].get<bool>();

    std::cerr << "[gateway] Generate " << session.repo_name
              << (stream ? " (stream)" : "")
              << (session.owner ? "" : " anonymous") << "\n";

    if (stream) {
        relay_stream(body, session, out);
    } else {
        generate_json(body, session, out);
    }
}

std::string Gateway::generate_body(const nlohmann::json& body, bool stream) const {
    nlohmann::json up = {
        {"repo_url", body["repo_url"]},
        {"doc_type", nullptr},
        {"stream", stream},
    };
    std::string doc_type = json_string(body, "doc_type");
    if (!doc_type.empty()) up["doc_type"] = doc_type;
    std::string token = json_string(body, "auth_token");
    if (!token.empty()) up["auth_token"] = token;
    return up.dump();
}

void Gateway::relay_stream(const nlohmann::json& body, const GenerationSession& session,
                           ResponseWriter& out) {
    UpstreamRequest request;
    request.url = upstream_config_.agent_url + "/generate";
    request.body = generate_body(body, true);
    request.headers = {{"Content-Type", "application/json"},
                       {"Accept", "text/event-stream"}};
    request.timeout_seconds = upstream_config_.generate_timeout;

    EventStreamSink sink(out);
    StreamRelay relay(upstream_, store_);
    RelayResult result = relay.run(request, session, sink, shutdown_);

    if (result.sink_opened) {
        std::cerr << "[gateway] Relay " << session.repo_name << " "
                  << outcome_name(result.outcome) << ", " << result.forwarded_bytes
                  << " bytes" << (result.slug ? ", saved as " + *result.slug : "") << "\n";
        return;
    }

    switch (result.outcome) {
        case RelayOutcome::NotStream:
            reply_with_upstream_json(result.status_code, result.body, session, out);
            break;
        case RelayOutcome::Cancelled:
            out.send(json_error(503, "Server shutting down"));
            break;
        default:
            std::cerr << "[gateway] Agent unreachable: " << result.error << "\n";
            out.send(json_error(502, result.error.empty() ? "Agent unreachable" : result.error));
            break;
    }
}

void Gateway::generate_json(const nlohmann::json& body, const GenerationSession& session,
                            ResponseWriter& out) {
    HttpResponse resp = upstream_.post(
        upstream_config_.agent_url + "/generate",
        generate_body(body, false),
        {{"Content-Type", "application/json"}},
        upstream_config_.generate_timeout);

    if (resp.status_code == 0) {
        std::cerr << "[gateway] Agent unreachable: " << resp.error << "\n";
        out.send(json_error(502, resp.error.empty() ? "Agent unreachable" : resp.error));
        return;
    }
    reply_with_upstream_json(resp.status_code, resp.body, session, out);
}

void Gateway::reply_with_upstream_json(long status_code, const std::string& body,
                                       const GenerationSession& session,
                                       ResponseWriter& out) {
    if (status_code < 200 || status_code >= 300) {
        std::cerr << "[gateway] Agent error " << status_code << ": "
                  << body.substr(0, 200) << "\n";
        out.send(json_error(502, "Agent error: " + std::to_string(status_code)));
        return;
    }

    auto j = nlohmann::json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        out.send(json_error(502, "Invalid response from agent"));
        return;
    }

    if (session.owner && store_ && j.contains("docs") && !j.contains("error")) {
        try {
            j["slug"] = store_->upsert(*session.owner, session.repo_url,
                                       session.repo_name, j["docs"]);
        } catch (const std::exception& e) {
            std::cerr << "[gateway] Failed to persist " << session.repo_name
                      << ": " << e.what() << "\n";
        }
    }
    out.send({200, "application/json", j.dump()});
}

void Gateway::handle_refine(const nlohmann::json& body, ResponseWriter& out) {
    if (!body.contains("current_docs") || json_string(body, "prompt").empty()) {
        out.send(json_error(400, "current_docs and prompt are required"));
        return;
    }

    nlohmann::json up = {
        {"current_docs", body["current_docs"]},
        {"prompt", body["prompt"]},
        {"repo_name", json_string(body, "repo_name")},
    };

    HttpResponse resp = upstream_.post(
        upstream_config_.agent_url + "/refine",
        up.dump(),
        {{"Content-Type", "application/json"}},
        upstream_config_.refine_timeout);

    if (resp.status_code == 0) {
        std::cerr << "[gateway] Agent unreachable: " << resp.error << "\n";
        out.send(json_error(502, resp.error.empty() ? "Agent unreachable" : resp.error));
        return;
    }
    if (resp.status_code < 200 || resp.status_code >= 300) {
        out.send(json_error(502, "Agent error: " + std::to_string(resp.status_code)));
        return;
    }
    out.send({200, "application/json", resp.body});
}

void Gateway::handle_project(const std::string& slug, ResponseWriter& out) {
    if (!store_) {
        out.send(json_error(404, "Not found"));
        return;
    }

    std::optional<Artifact> artifact;
    try {
        artifact = store_->get(slug);
    } catch (const std::exception& e) {
        std::cerr << "[gateway] Failed to load " << slug << ": " << e.what() << "\n";
        out.send(json_error(500, "Failed to load project"));
        return;
    }

    if (!artifact) {
        out.send(json_error(404, "Not found"));
        return;
    }
    out.send({200, "application/json", nlohmann::json{{"docs", artifact->docs}}.dump()});
}

} // namespace docrelay
