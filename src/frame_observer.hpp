#pragma once
#include <string>
#include <optional>
#include <cstddef>
#include <nlohmann/json.hpp>

namespace docrelay {

// One-shot scan of a complete event-stream text for the first terminal frame.
//
// Tracks the kind declared by "event: " lines. The first "data: " line seen
// while the kind is "done" whose (trimmed) remainder parses as JSON ends the
// scan. A blank line clears the tracked kind unless it is "done".
//
// Returns std::nullopt when no such frame exists (nothing to persist).
std::optional<nlohmann::json> find_done_payload(const std::string& text);

// Accumulates the relayed bytes of one stream so the terminal frame can be
// located once the stream has closed. Only instantiated when the result has
// to be persisted.
class FrameObserver {
public:
    void observe(const char* data, size_t len) { accumulated_.append(data, len); }

    std::optional<nlohmann::json> terminal_payload() const {
        return find_done_payload(accumulated_);
    }

    size_t observed_bytes() const { return accumulated_.size(); }

    void discard() {
        accumulated_.clear();
        accumulated_.shrink_to_fit();
    }

private:
    std::string accumulated_;
};

} // namespace docrelay
