#pragma once
#include "frame.hpp"
#include <string>
#include <functional>
#include <cstddef>

namespace docrelay {

// Callback receives each complete frame in arrival order.
using FrameCallback = std::function<void(const Frame& frame)>;

// Incremental event-stream decoder. Keeps its state across feed() calls so a
// line or a frame may be split at any byte boundary.
//
//   event: X   sets the pending kind
//   data: Y    captures the payload (several data lines are joined with '\n')
//   <blank>    dispatches the frame if it has data, then clears the pending
//              kind and payload unconditionally
//
// Comment lines (":...") and unknown fields are ignored.
class FrameDecoder {
public:
    // Feed raw bytes, triggers callback for every completed frame
    void feed(const char* data, size_t len, const FrameCallback& callback);
    void feed(const std::string& chunk, const FrameCallback& callback);

    // Reset decoder state
    void reset();

    // Unconsumed tail of the last chunk (a line without its '\n' yet)
    const std::string& partial_line() const { return partial_line_; }

    // Kind declared by the most recent "event:" line of the open frame
    const std::string& pending_kind() const { return pending_kind_; }

private:
    void process_line(std::string line, const FrameCallback& callback);

    std::string partial_line_;
    std::string pending_kind_;
    std::string pending_data_;
    bool has_data_ = false;
};

} // namespace docrelay
