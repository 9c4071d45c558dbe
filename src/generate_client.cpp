#include "generate_client.hpp"
#include <nlohmann/json.hpp>

namespace docrelay {

std::string generate_request_body(const GenerateOptions& opts) {
    nlohmann::json body = {
        {"repo_url", opts.repo_url},
        {"stream", opts.stream},
    };
    if (!opts.doc_type.empty()) body["doc_type"] = opts.doc_type;
    return body.dump();
}

GenerationState run_generation(HttpClient& http, const GenerateOptions& opts,
                               StreamConsumer& consumer,
                               const std::atomic<bool>* cancel) {
    std::string url = opts.server_url;
    while (!url.empty() && url.back() == '/') url.pop_back();
    url += "/api/generate";

    std::vector<Header> headers = {{"Content-Type", "application/json"}};
    if (opts.stream) headers.push_back({"Accept", "text/event-stream"});
    if (!opts.owner.empty()) headers.push_back({opts.owner_header, opts.owner});
    if (!opts.relay_secret.empty()) headers.push_back({"x-relay-secret", opts.relay_secret});

    std::string body = generate_request_body(opts);
    consumer.begin();

    if (!opts.stream) {
        HttpResponse resp = http.post(url, body, headers, opts.timeout_seconds);
        if (resp.status_code == 0) {
            consumer.fail(resp.error.empty() ? "no response from server" : resp.error);
        } else {
            consumer.apply_json_response(resp.status_code, resp.body);
        }
        return consumer.state();
    }

    bool streaming = false;
    std::string json_body;

    StreamHandlers handlers;
    handlers.cancel = cancel;
    handlers.on_head = [&](long status, const std::string& content_type) {
        streaming = consumer.on_response(status, content_type);
        return true;
    };
    handlers.on_chunk = [&](const char* data, size_t len) {
        if (streaming) {
            consumer.feed(data, len);
        } else {
            json_body.append(data, len);
        }
        return true;
    };

    HttpResponse resp = http.stream_post_raw(url, body, headers, handlers, opts.timeout_seconds);

    if (cancel && cancel->load()) {
        consumer.cancel();
    } else if (!resp.error.empty() || resp.status_code == 0) {
        consumer.fail(resp.error.empty() ? "no response from server" : resp.error);
    } else if (streaming) {
        consumer.finish();
    } else {
        consumer.apply_json_response(resp.status_code, json_body);
    }
    return consumer.state();
}

} // namespace docrelay
