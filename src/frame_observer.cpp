#include "frame_observer.hpp"
#include "frame.hpp"
#include "util.hpp"

namespace docrelay {

std::optional<nlohmann::json> find_done_payload(const std::string& text) {
    static const std::string event_prefix = "event: ";
    static const std::string data_prefix  = "data: ";

    std::string kind;
    size_t pos = 0;
    while (pos <= text.size()) {
        size_t newline = text.find('\n', pos);
        if (newline == std::string::npos) newline = text.size();
        std::string line = text.substr(pos, newline - pos);
        pos = newline + 1;

        if (!line.empty() && line.back() == '\r') line.pop_back();

        if (starts_with(line, event_prefix)) {
            kind = trim(line.substr(event_prefix.size()));
        } else if (starts_with(line, data_prefix) && kind == frame_kinds::Done) {
            auto payload = nlohmann::json::parse(
                trim(line.substr(data_prefix.size())), nullptr, false);
            if (!payload.is_discarded()) return payload;
        } else if (line.empty() && kind != frame_kinds::Done) {
            // A "done" kind outlives its frame boundary
            kind.clear();
        }
    }
    return std::nullopt;
}

} // namespace docrelay
