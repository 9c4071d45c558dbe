#pragma once
#include "../artifact_store.hpp"
#include <mutex>
#include <string>
#include <vector>
#include <unordered_map>

namespace docrelay {

// File-backed store: the whole artifact set lives in one JSON array that is
// rewritten atomically on every upsert. Suited to small single-host installs.
class JsonArtifactStore : public ArtifactStore {
public:
    explicit JsonArtifactStore(const std::string& path);

    std::string backend_name() const override { return "json"; }

    std::string upsert(const std::string& owner,
                       const std::string& repo_url,
                       const std::string& repo_name,
                       const nlohmann::json& docs) override;

    std::optional<Artifact> get(const std::string& slug) override;

    uint32_t count() override;

private:
    void load();
    void save();
    void rebuild_index();

    std::string path_;
    std::vector<Artifact> artifacts_;
    std::unordered_map<std::string, size_t> slug_index_; // slug -> artifacts_ index
    mutable std::mutex mutex_;
};

} // namespace docrelay
