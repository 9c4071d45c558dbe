#include "sse.hpp"

namespace docrelay {

void FrameDecoder::feed(const char* data, size_t len, const FrameCallback& callback) {
    partial_line_.append(data, len);

    size_t pos = 0;
    while (pos < partial_line_.size()) {
        size_t newline = partial_line_.find('\n', pos);
        if (newline == std::string::npos) break;

        std::string line = partial_line_.substr(pos, newline - pos);
        pos = newline + 1;
        process_line(std::move(line), callback);
    }

    // Incomplete line - keep remainder for the next feed
    partial_line_.erase(0, pos);
}

void FrameDecoder::feed(const std::string& chunk, const FrameCallback& callback) {
    feed(chunk.data(), chunk.size(), callback);
}

void FrameDecoder::process_line(std::string line, const FrameCallback& callback) {
    // Remove trailing \r if present
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }

    if (line.empty()) {
        // Empty line = dispatch frame
        if (has_data_) {
            Frame frame{pending_kind_, pending_data_};
            pending_kind_.clear();
            pending_data_.clear();
            has_data_ = false;
            callback(frame);
            return;
        }
        pending_kind_.clear();
    } else if (line.rfind("event:", 0) == 0) {
        pending_kind_ = line.substr(line.size() > 6 && line[6] == ' ' ? 7 : 6);
    } else if (line.rfind("data:", 0) == 0) {
        if (has_data_) {
            pending_data_ += '\n';
        }
        // Handle both "data: payload" (with space) and "data:payload" (without)
        pending_data_ += line.substr(line.size() > 5 && line[5] == ' ' ? 6 : 5);
        has_data_ = true;
    }
    // Ignore other lines (comments starting with :, id:, retry:)
}

void FrameDecoder::reset() {
    partial_line_.clear();
    pending_kind_.clear();
    pending_data_.clear();
    has_data_ = false;
}

} // namespace docrelay
