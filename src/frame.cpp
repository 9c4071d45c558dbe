#include "frame.hpp"
#include "util.hpp"

namespace docrelay {

std::string encode_frame(const std::string& kind, const std::string& payload) {
    std::string out;
    out.reserve(kind.size() + payload.size() + 16);
    out += "event: ";
    out += kind;
    out += "\ndata: ";
    out += payload;
    out += "\n\n";
    return out;
}

std::string encode_frame(const Frame& frame) {
    return encode_frame(frame.kind, frame.payload);
}

bool is_event_stream(const std::string& content_type) {
    std::string media = content_type.substr(0, content_type.find(';'));
    return to_lower(trim(media)) == "text/event-stream";
}

} // namespace docrelay
