#pragma once
#include <string>

namespace docrelay {

// Event kinds carried on the relay wire protocol.
namespace frame_kinds {
    constexpr const char* Progress = "progress";
    constexpr const char* Done     = "done";
    constexpr const char* Error    = "error";
    constexpr const char* Saved    = "saved";  // synthesized by the relay, never upstream
} // namespace frame_kinds

// One event-stream frame: an event kind plus its (JSON) payload.
// The payload is kept as raw text; only consumers that need fields parse it.
struct Frame {
    std::string kind;
    std::string payload;
};

// Encode as "event: <kind>\ndata: <payload>\n\n".
std::string encode_frame(const std::string& kind, const std::string& payload);
std::string encode_frame(const Frame& frame);

// True for "text/event-stream", ignoring case and any parameters.
bool is_event_stream(const std::string& content_type);

} // namespace docrelay
