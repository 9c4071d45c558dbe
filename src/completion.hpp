#pragma once
#include "sink.hpp"
#include <string>
#include <optional>
#include <nlohmann/json.hpp>

namespace docrelay {

class ArtifactStore;

// Bound once per relay invocation. An owner is present only for
// authenticated callers; without one nothing is persisted.
struct GenerationSession {
    std::optional<std::string> owner;
    std::string repo_url;
    std::string repo_name;
};

// Persists the terminal result of a relayed stream and announces it with a
// synthesized "saved" frame. Fires at most once per instance.
class CompletionHandler {
public:
    CompletionHandler(ArtifactStore& store, GenerationSession session);

    // Persist done_payload["docs"] and append {"slug", "repoName"} as a
    // "saved" frame to sink. Returns the slug when persisted.
    //
    // A payload without "docs", a second call, or a store failure is logged
    // and yields std::nullopt without touching the sink. Never throws for
    // store errors.
    std::optional<std::string> complete(const nlohmann::json& done_payload,
                                        OutboundSink& sink);

    bool fired() const { return fired_; }

private:
    ArtifactStore& store_;
    GenerationSession session_;
    bool fired_ = false;
};

} // namespace docrelay
