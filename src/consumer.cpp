#include "consumer.hpp"
#include "event.hpp"
#include "event_bus.hpp"
#include "frame.hpp"

#include <algorithm>

namespace docrelay {

const char* state_name(GenerationState state) {
    switch (state) {
        case GenerationState::Idle:       return "idle";
        case GenerationState::Requesting: return "requesting";
        case GenerationState::Streaming:  return "streaming";
        case GenerationState::Completed:  return "completed";
        case GenerationState::Failed:     return "failed";
    }
    return "unknown";
}

StreamConsumer::StreamConsumer(EventBus* bus) : bus_(bus) {}

void StreamConsumer::begin() {
    decoder_.reset();
    progress_ = 0;
    message_.clear();
    has_result_ = false;
    result_ = nullptr;
    error_.clear();
    slug_.reset();
    frames_dispatched_ = 0;
    transition(GenerationState::Requesting);
}

bool StreamConsumer::on_response(long status_code, const std::string& content_type) {
    if (state_ != GenerationState::Requesting) return false;

    if (status_code < 200 || status_code >= 300) {
        // The JSON error body, if any, arrives through apply_json_response()
        return false;
    }
    if (!is_event_stream(content_type)) return false;

    transition(GenerationState::Streaming);
    return true;
}

void StreamConsumer::feed(const char* data, size_t len) {
    if (state_ != GenerationState::Streaming) return;
    decoder_.feed(data, len, [this](const Frame& frame) { dispatch(frame); });
}

void StreamConsumer::finish() {
    if (state_ == GenerationState::Streaming) {
        transition(GenerationState::Completed);
    } else if (state_ == GenerationState::Requesting) {
        set_failed("connection closed before a response arrived");
    }
}

void StreamConsumer::fail(const std::string& message) {
    if (state_ == GenerationState::Requesting || state_ == GenerationState::Streaming) {
        set_failed(message);
    }
}

void StreamConsumer::apply_json_response(long status_code, const std::string& body) {
    if (state_ != GenerationState::Requesting) return;

    auto j = nlohmann::json::parse(body, nullptr, false);
    bool ok_status = status_code >= 200 && status_code < 300;

    if (j.is_object() && j.contains("error")) {
        const auto& e = j["error"];
        set_failed(e.is_string() ? e.get<std::string>() : e.dump());
        return;
    }
    if (!ok_status) {
        set_failed("request failed with status " + std::to_string(status_code));
        return;
    }
    if (!j.is_object()) {
        set_failed("malformed response");
        return;
    }

    if (j.contains("docs")) on_done(j);
    if (j.contains("slug") && j["slug"].is_string()) {
        nlohmann::json saved = {{"slug", j["slug"]},
                                {"repoName", j.value("repoName", std::string{})}};
        on_saved(saved);
    }
    transition(GenerationState::Completed);
}

void StreamConsumer::cancel() {
    decoder_.reset();
    transition(GenerationState::Idle);
}

void StreamConsumer::dispatch(const Frame& frame) {
    // Frames after an error frame are not applied
    if (state_ != GenerationState::Streaming) return;

    auto payload = nlohmann::json::parse(frame.payload, nullptr, false);
    if (payload.is_discarded() || !payload.is_object()) return;

    if (frame.kind == frame_kinds::Progress) {
        on_progress(payload);
    } else if (frame.kind == frame_kinds::Done) {
        on_done(payload);
    } else if (frame.kind == frame_kinds::Error) {
        on_error(payload);
    } else if (frame.kind == frame_kinds::Saved) {
        on_saved(payload);
    } else {
        return;
    }
    ++frames_dispatched_;
}

void StreamConsumer::on_progress(const nlohmann::json& payload) {
    if (!payload.contains("progress") || !payload["progress"].is_number()) return;

    // Clamp before narrowing; a huge or fractional number must not overflow int.
    progress_ = static_cast<int>(std::clamp(payload["progress"].get<double>(), 0.0, 100.0));
    if (payload.contains("message") && payload["message"].is_string())
        message_ = payload["message"].get<std::string>();

    if (bus_) {
        GenerationProgressEvent ev;
        ev.progress = progress_;
        ev.message = message_;
        bus_->publish(ev);
    }
}

void StreamConsumer::on_done(const nlohmann::json& payload) {
    if (!payload.contains("docs")) return;

    result_ = payload["docs"];
    has_result_ = true;
    progress_ = 100;

    if (bus_) {
        GenerationResultEvent ev;
        ev.docs = result_;
        bus_->publish(ev);
    }
}

void StreamConsumer::on_error(const nlohmann::json& payload) {
    if (!payload.contains("error")) return;
    const auto& e = payload["error"];
    set_failed(e.is_string() ? e.get<std::string>() : e.dump());
}

void StreamConsumer::on_saved(const nlohmann::json& payload) {
    if (!payload.contains("slug") || !payload["slug"].is_string()) return;
    auto slug = payload["slug"].get<std::string>();
    if (slug.empty()) return;

    slug_ = slug;

    if (bus_) {
        ArtifactSavedEvent ev;
        ev.slug = slug;
        ev.repo_name = payload.value("repoName", std::string{});
        bus_->publish(ev);
    }
}

void StreamConsumer::set_failed(const std::string& error) {
    error_ = error;
    if (bus_) {
        GenerationErrorEvent ev;
        ev.error = error;
        bus_->publish(ev);
    }
    transition(GenerationState::Failed);
}

void StreamConsumer::transition(GenerationState to) {
    if (state_ == to) return;
    GenerationState from = state_;
    state_ = to;

    if (bus_) {
        GenerationStateChangedEvent ev;
        ev.from = state_name(from);
        ev.to = state_name(to);
        bus_->publish(ev);
    }
}

} // namespace docrelay
