#pragma once
#include <cstddef>

namespace docrelay {

// Destination of a relayed event stream (normally the waiting client).
//
// Lifecycle: open() once, write() any number of times, close() once.
// The relay calls close() exactly once if and only if open() was called.
class OutboundSink {
public:
    virtual ~OutboundSink() = default;

    // Start the outbound event stream. Return false if the client is gone.
    virtual bool open() = 0;

    // Forward bytes verbatim. Return false if the client is gone.
    virtual bool write(const char* data, size_t len) = 0;

    // End the outbound stream.
    virtual void close() = 0;
};

} // namespace docrelay
