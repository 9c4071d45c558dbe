#pragma once
#include "completion.hpp"
#include "http.hpp"
#include "sink.hpp"
#include <atomic>
#include <optional>
#include <string>
#include <vector>
#include <cstddef>

namespace docrelay {

class ArtifactStore;

// One upstream call to the generation agent.
struct UpstreamRequest {
    std::string url;
    std::string body;
    std::vector<Header> headers;
    long timeout_seconds = 600;
};

enum class RelayOutcome {
    Completed,       // upstream closed naturally, sink closed
    NotStream,       // upstream answered without an event stream; body captured
    UpstreamFailed,  // transport failure or timeout
    Cancelled,       // cancellation flag raised
    ClientGone,      // the sink refused bytes
};

const char* outcome_name(RelayOutcome outcome);

struct RelayResult {
    RelayOutcome outcome = RelayOutcome::UpstreamFailed;
    long status_code = 0;              // upstream status, 0 if never received
    std::string content_type;          // upstream content type
    std::string body;                  // upstream body when outcome == NotStream
    std::string error;
    bool sink_opened = false;          // if false the caller still owes a response
    size_t forwarded_bytes = 0;
    std::optional<std::string> slug;   // set when the result was persisted
};

// Tees an upstream event stream into an outbound sink.
//
// Every chunk is written to the sink before anything else happens to it.
// When the session has an owner (and a store is configured) a copy of each
// chunk is accumulated; after upstream closes naturally the first "done"
// frame is persisted and a "saved" frame is appended before the sink closes.
// Upstream failure, cancellation or a vanished client skip persistence.
class StreamRelay {
public:
    // store may be null: every relay is then a pure passthrough.
    StreamRelay(HttpClient& upstream, ArtifactStore* store);

    RelayResult run(const UpstreamRequest& request,
                    const GenerationSession& session,
                    OutboundSink& sink,
                    const std::atomic<bool>* cancel = nullptr);

private:
    HttpClient& upstream_;
    ArtifactStore* store_;
};

} // namespace docrelay
