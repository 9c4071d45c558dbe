#pragma once
#include "sse.hpp"
#include <string>
#include <optional>
#include <cstddef>
#include <nlohmann/json.hpp>

namespace docrelay {

class EventBus;

enum class GenerationState { Idle, Requesting, Streaming, Completed, Failed };

const char* state_name(GenerationState state);

// Client-side view of one generation request. Decodes relayed frames as they
// arrive and keeps the state a progress display needs.
//
//   idle -> requesting -> streaming -> completed | failed
//
// "done" stores the result but keeps streaming (a "saved" frame may follow);
// only an "error" frame or the end of the transport leaves streaming.
// Frames with unparseable or mis-shaped payloads are dropped individually.
// Every change is also published on the optional EventBus.
class StreamConsumer {
public:
    explicit StreamConsumer(EventBus* bus = nullptr);

    // Start a request; clears everything from a previous run.
    void begin();

    // Response status and content type arrived. Returns true when the body is
    // an event stream to pass to feed(); false when the caller should collect
    // the body for apply_json_response() (or the request already failed).
    bool on_response(long status_code, const std::string& content_type);

    // Feed raw bytes of the event stream.
    void feed(const char* data, size_t len);
    void feed(const std::string& chunk) { feed(chunk.data(), chunk.size()); }

    // The transport closed normally. A stream without a "done" frame still
    // completes, just without a result.
    void finish();

    // The transport failed (connection refused, reset, timeout).
    void fail(const std::string& message);

    // Non-stream fallback: {"docs", "slug"?} completes, {"error"} fails.
    void apply_json_response(long status_code, const std::string& body);

    // Abandon the request (user navigated away). Not an error: back to idle.
    void cancel();

    GenerationState state() const { return state_; }
    int progress() const { return progress_; }
    const std::string& message() const { return message_; }
    bool has_result() const { return has_result_; }
    const nlohmann::json& result() const { return result_; }
    const std::string& error() const { return error_; }
    const std::optional<std::string>& slug() const { return slug_; }
    bool persisted() const { return slug_.has_value(); }
    size_t frames_dispatched() const { return frames_dispatched_; }

private:
    void dispatch(const Frame& frame);
    void on_progress(const nlohmann::json& payload);
    void on_done(const nlohmann::json& payload);
    void on_error(const nlohmann::json& payload);
    void on_saved(const nlohmann::json& payload);
    void transition(GenerationState to);
    void set_failed(const std::string& error);

    EventBus* bus_;
    FrameDecoder decoder_;
    GenerationState state_ = GenerationState::Idle;
    int progress_ = 0;
    std::string message_;
    bool has_result_ = false;
    nlohmann::json result_;
    std::string error_;
    std::optional<std::string> slug_;
    size_t frames_dispatched_ = 0;
};

} // namespace docrelay
