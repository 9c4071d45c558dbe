#pragma once
#include "consumer.hpp"
#include "http.hpp"
#include <atomic>
#include <string>

namespace docrelay {

struct GenerateOptions {
    std::string server_url = "http://127.0.0.1:8787";
    std::string repo_url;
    std::string doc_type;                     // empty = let the agent decide
    std::string owner;                        // empty = anonymous, nothing persisted
    std::string owner_header = "x-owner-id";
    std::string relay_secret;                 // sent as x-relay-secret when set
    bool stream = true;
    long timeout_seconds = 600;
};

// Build the POST /api/generate body for opts.
std::string generate_request_body(const GenerateOptions& opts);

// Drive one generation request against a relay server, feeding every byte
// of the response into consumer. Returns the consumer's final state:
// Completed, Failed, or Idle when cancel was raised mid-request.
GenerationState run_generation(HttpClient& http, const GenerateOptions& opts,
                               StreamConsumer& consumer,
                               const std::atomic<bool>* cancel = nullptr);

} // namespace docrelay
