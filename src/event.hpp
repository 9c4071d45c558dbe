#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace docrelay {

// Tag-based event dispatch without RTTI or dynamic_cast.
// Events are stack-allocated structs; never deleted through base pointer.

struct Event {
    const char* type_tag;
};

// ── Event tags ──────────────────────────────────────────────────

namespace event_tags {
    constexpr const char* GenerationStateChanged = "GenerationStateChanged";
    constexpr const char* GenerationProgress     = "GenerationProgress";
    constexpr const char* GenerationResult       = "GenerationResult";
    constexpr const char* GenerationError        = "GenerationError";
    constexpr const char* ArtifactSaved          = "ArtifactSaved";
} // namespace event_tags

// ── Event structs ───────────────────────────────────────────────

struct GenerationStateChangedEvent : Event {
    static constexpr const char* TAG = event_tags::GenerationStateChanged;
    std::string from;
    std::string to;

    GenerationStateChangedEvent() { type_tag = TAG; }
};

struct GenerationProgressEvent : Event {
    static constexpr const char* TAG = event_tags::GenerationProgress;
    int progress = 0;      // 0-100
    std::string message;

    GenerationProgressEvent() { type_tag = TAG; }
};

struct GenerationResultEvent : Event {
    static constexpr const char* TAG = event_tags::GenerationResult;
    nlohmann::json docs;

    GenerationResultEvent() { type_tag = TAG; }
};

struct GenerationErrorEvent : Event {
    static constexpr const char* TAG = event_tags::GenerationError;
    std::string error;

    GenerationErrorEvent() { type_tag = TAG; }
};

struct ArtifactSavedEvent : Event {
    static constexpr const char* TAG = event_tags::ArtifactSaved;
    std::string slug;
    std::string repo_name;

    ArtifactSavedEvent() { type_tag = TAG; }
};

} // namespace docrelay
