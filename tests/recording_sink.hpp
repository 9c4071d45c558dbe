#pragma once
#include "sink.hpp"
#include <string>

namespace docrelay {

// Captures everything written to it and counts lifecycle calls.
class RecordingSink : public OutboundSink {
public:
    std::string bytes;
    int open_calls = 0;
    int write_calls = 0;
    int close_calls = 0;
    bool writes_after_close = false;

    bool refuse_open = false;
    int accept_writes = -1;  // refuse every write after this many (-1 = never)

    bool open() override {
        ++open_calls;
        return !refuse_open;
    }

    bool write(const char* data, size_t len) override {
        if (close_calls > 0) writes_after_close = true;
        if (accept_writes >= 0 && write_calls >= accept_writes) {
            ++write_calls;
            return false;
        }
        ++write_calls;
        bytes.append(data, len);
        return true;
    }

    void close() override { ++close_calls; }
};

} // namespace docrelay
