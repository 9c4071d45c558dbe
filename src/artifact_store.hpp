#pragma once
#include <string>
#include <optional>
#include <memory>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace docrelay {

struct Config; // forward declaration

// A persisted generation result. One record per (owner, repo name).
struct Artifact {
    std::string slug;
    std::string owner;
    std::string repo_url;
    std::string repo_name;
    std::string doc_type;
    nlohmann::json docs;
    uint64_t created_at = 0;
    uint64_t updated_at = 0;
};

// Persistence gateway for generated documentation.
// Implementations are safe to call from concurrent relay threads.
class ArtifactStore {
public:
    virtual ~ArtifactStore() = default;

    virtual std::string backend_name() const = 0;

    // Insert or replace the artifact for (owner, repo_name) and return its
    // slug. Repeating the call with the same owner and repo name overwrites
    // the record (last write wins). Throws std::runtime_error on storage failure.
    virtual std::string upsert(const std::string& owner,
                               const std::string& repo_url,
                               const std::string& repo_name,
                               const nlohmann::json& docs) = 0;

    // Look up an artifact by slug.
    virtual std::optional<Artifact> get(const std::string& slug) = 0;

    // Number of stored artifacts.
    virtual uint32_t count() = 0;
};

// Lowercase, collapse runs of characters outside [a-z0-9] to '-', and strip
// leading/trailing '-'. "My Repo_v2" -> "my-repo-v2"
std::string slugify(const std::string& name);

// Persistence key: slugify(repo_name) + "-" + first 8 characters of owner.
// The owner prefix keeps different owners of same-named repos apart.
std::string make_slug(const std::string& repo_name, const std::string& owner);

// docs["doc_type"] when it is a non-empty string, otherwise "auto".
std::string doc_type_of(const nlohmann::json& docs);

// Create the backend named by config.store.backend via the plugin registry.
std::unique_ptr<ArtifactStore> create_artifact_store(const Config& config);

} // namespace docrelay
