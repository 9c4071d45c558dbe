#include "stream_relay.hpp"
#include "artifact_store.hpp"
#include "frame.hpp"
#include "frame_observer.hpp"

#include <iostream>
#include <memory>

namespace docrelay {

const char* outcome_name(RelayOutcome outcome) {
    switch (outcome) {
        case RelayOutcome::Completed:      return "completed";
        case RelayOutcome::NotStream:      return "not-stream";
        case RelayOutcome::UpstreamFailed: return "upstream-failed";
        case RelayOutcome::Cancelled:      return "cancelled";
        case RelayOutcome::ClientGone:     return "client-gone";
    }
    return "unknown";
}

StreamRelay::StreamRelay(HttpClient& upstream, ArtifactStore* store)
    : upstream_(upstream), store_(store)
{}

RelayResult StreamRelay::run(const UpstreamRequest& request,
                             const GenerationSession& session,
                             OutboundSink& sink,
                             const std::atomic<bool>* cancel) {
    RelayResult result;

    // Only persisting relays pay for decoding
    std::unique_ptr<FrameObserver> observer;
    if (session.owner && store_) {
        observer = std::make_unique<FrameObserver>();
    }

    bool streaming = false;
    bool client_gone = false;

    StreamHandlers handlers;
    handlers.cancel = cancel;
    handlers.on_head = [&](long status, const std::string& content_type) {
        result.status_code = status;
        result.content_type = content_type;
        streaming = status >= 200 && status < 300 && is_event_stream(content_type);
        if (!streaming) return true;

        result.sink_opened = true;
        if (!sink.open()) {
            client_gone = true;
            return false;
        }
        return true;
    };
    handlers.on_chunk = [&](const char* data, size_t len) {
        if (!streaming) {
            result.body.append(data, len);
            return true;
        }
        if (!sink.write(data, len)) {
            client_gone = true;
            return false;
        }
        result.forwarded_bytes += len;
        if (observer) observer->observe(data, len);
        return true;
    };

    HttpResponse resp = upstream_.stream_post_raw(
        request.url, request.body, request.headers, handlers, request.timeout_seconds);
    if (result.status_code == 0) result.status_code = resp.status_code;
    result.error = resp.error;

    bool cancelled = cancel && cancel->load();

    if (client_gone) {
        result.outcome = RelayOutcome::ClientGone;
    } else if (cancelled) {
        result.outcome = RelayOutcome::Cancelled;
    } else if (!resp.error.empty() || result.status_code == 0) {
        result.outcome = RelayOutcome::UpstreamFailed;
        if (result.error.empty()) result.error = "no response from upstream";
    } else if (!streaming) {
        result.outcome = RelayOutcome::NotStream;
    } else {
        result.outcome = RelayOutcome::Completed;
    }

    if (!result.sink_opened) return result;

    if (result.outcome == RelayOutcome::Completed && observer) {
        try {
            auto payload = observer->terminal_payload();
            observer->discard();
            if (payload) {
                CompletionHandler completion(*store_, session);
                result.slug = completion.complete(*payload, sink);
            }
        } catch (const std::exception& e) {
            std::cerr << "[relay] Completion failed for " << session.repo_name
                      << ": " << e.what() << "\n";
        }
    } else if (result.outcome != RelayOutcome::Completed) {
        std::cerr << "[relay] " << session.repo_name << " ended "
                  << outcome_name(result.outcome)
                  << (result.error.empty() ? "" : ": " + result.error)
                  << " after " << result.forwarded_bytes << " bytes\n";
    }

    sink.close();
    return result;
}

} // namespace docrelay
