#include "completion.hpp"
#include "artifact_store.hpp"
#include "frame.hpp"

#include <iostream>

namespace docrelay {

CompletionHandler::CompletionHandler(ArtifactStore& store, GenerationSession session)
    : store_(store), session_(std::move(session))
{}

std::optional<std::string> CompletionHandler::complete(const nlohmann::json& done_payload,
                                                       OutboundSink& sink) {
    if (fired_) {
        std::cerr << "[completion] Ignoring repeated terminal frame for "
                  << session_.repo_name << "\n";
        return std::nullopt;
    }
    fired_ = true;

    if (!session_.owner) return std::nullopt;

    if (!done_payload.is_object() || !done_payload.contains("docs")) {
        std::cerr << "[completion] Terminal frame for " << session_.repo_name
                  << " has no docs, nothing to persist\n";
        return std::nullopt;
    }

    std::string slug;
    try {
        slug = store_.upsert(*session_.owner, session_.repo_url,
                             session_.repo_name, done_payload["docs"]);
    } catch (const std::exception& e) {
        std::cerr << "[completion] Failed to persist " << session_.repo_name
                  << ": " << e.what() << "\n";
        return std::nullopt;
    }

    nlohmann::json saved = {{"slug", slug}, {"repoName", session_.repo_name}};
    std::string frame = encode_frame(frame_kinds::Saved, saved.dump());
    if (!sink.write(frame.data(), frame.size())) {
        std::cerr << "[completion] Client left before saved frame for " << slug << "\n";
    }
    return slug;
}

} // namespace docrelay
