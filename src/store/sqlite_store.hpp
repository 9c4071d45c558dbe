#pragma once
#include "../artifact_store.hpp"
#include <mutex>
#include <string>

struct sqlite3; // forward declare

namespace docrelay {

class SqliteArtifactStore : public ArtifactStore {
public:
    // Opens (or creates) the database at path. ":memory:" is accepted.
    // Throws std::runtime_error when the database cannot be opened.
    explicit SqliteArtifactStore(const std::string& path);
    ~SqliteArtifactStore() override;

    // Non-copyable
    SqliteArtifactStore(const SqliteArtifactStore&) = delete;
    SqliteArtifactStore& operator=(const SqliteArtifactStore&) = delete;

    std::string backend_name() const override { return "sqlite"; }

    std::string upsert(const std::string& owner,
                       const std::string& repo_url,
                       const std::string& repo_name,
                       const nlohmann::json& docs) override;

    std::optional<Artifact> get(const std::string& slug) override;

    uint32_t count() override;

private:
    void init_schema();

    sqlite3* db_ = nullptr;
    std::string path_;
    mutable std::mutex mutex_;
};

} // namespace docrelay
