#include "json_store.hpp"
#include "../config.hpp"
#include "../plugin.hpp"
#include "../util.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>
#include <stdexcept>

static docrelay::StoreRegistrar reg_json("json",
    [](const docrelay::Config& config) {
        std::string path = config.store.path;
        if (path.empty()) {
            path = docrelay::expand_home("~/.docrelay/artifacts.json");
        }
        return std::make_unique<docrelay::JsonArtifactStore>(path);
    });

namespace docrelay {

static nlohmann::json artifact_to_json(const Artifact& a) {
    return {
        {"slug", a.slug},
        {"owner", a.owner},
        {"repo_url", a.repo_url},
        {"repo_name", a.repo_name},
        {"doc_type", a.doc_type},
        {"docs", a.docs},
        {"created_at", a.created_at},
        {"updated_at", a.updated_at}
    };
}

static Artifact artifact_from_json(const nlohmann::json& j) {
    Artifact a;
    a.slug       = j.value("slug", std::string{});
    a.owner      = j.value("owner", std::string{});
    a.repo_url   = j.value("repo_url", std::string{});
    a.repo_name  = j.value("repo_name", std::string{});
    a.doc_type   = j.value("doc_type", std::string{"auto"});
    a.docs       = j.contains("docs") ? j["docs"] : nlohmann::json();
    a.created_at = j.value("created_at", uint64_t{0});
    a.updated_at = j.value("updated_at", uint64_t{0});
    return a;
}

JsonArtifactStore::JsonArtifactStore(const std::string& path) : path_(path) {
    load();
}

void JsonArtifactStore::load() {
    std::ifstream file(path_);
    if (!file.is_open()) return;

    try {
        nlohmann::json j = nlohmann::json::parse(file);
        if (!j.is_array()) return;

        artifacts_.clear();
        artifacts_.reserve(j.size());
        for (const auto& item : j) {
            if (!item.is_object()) continue;
            auto a = artifact_from_json(item);
            if (!a.slug.empty()) artifacts_.push_back(std::move(a));
        }
        rebuild_index();
    } catch (const nlohmann::json::exception& e) {
        // Corrupt file: start fresh, the next upsert rewrites it
        std::cerr << "[store] Ignoring unreadable " << path_ << ": " << e.what() << "\n";
        artifacts_.clear();
        slug_index_.clear();
    }
}

void JsonArtifactStore::save() {
    nlohmann::json j = nlohmann::json::array();
    for (const auto& a : artifacts_) {
        j.push_back(artifact_to_json(a));
    }
    if (!atomic_write_file(path_, j.dump(2))) {
        throw std::runtime_error("JsonArtifactStore: failed to write " + path_);
    }
}

void JsonArtifactStore::rebuild_index() {
    slug_index_.clear();
    slug_index_.reserve(artifacts_.size());
    for (size_t i = 0; i < artifacts_.size(); ++i) {
        slug_index_[artifacts_[i].slug] = i;
    }
}

std::string JsonArtifactStore::upsert(const std::string& owner,
                                      const std::string& repo_url,
                                      const std::string& repo_name,
                                      const nlohmann::json& docs) {
    std::string slug = make_slug(repo_name, owner);
    uint64_t now = epoch_seconds();

    std::lock_guard<std::mutex> lock(mutex_);

    // A failed file write puts the in-memory record back as it was.
    auto it = slug_index_.find(slug);
    std::optional<Artifact> previous;
    if (it != slug_index_.end()) {
        previous = artifacts_[it->second];
        auto& a = artifacts_[it->second];
        if (!repo_url.empty()) a.repo_url = repo_url;
        a.repo_name  = repo_name;
        a.doc_type   = doc_type_of(docs);
        a.docs       = docs;
        a.updated_at = now;
    } else {
        Artifact a;
        a.slug       = slug;
        a.owner      = owner;
        a.repo_url   = repo_url;
        a.repo_name  = repo_name;
        a.doc_type   = doc_type_of(docs);
        a.docs       = docs;
        a.created_at = now;
        a.updated_at = now;
        slug_index_[slug] = artifacts_.size();
        artifacts_.push_back(std::move(a));
    }

    try {
        save();
    } catch (const std::exception&) {
        if (previous) {
            artifacts_[slug_index_[slug]] = std::move(*previous);
        } else {
            artifacts_.pop_back();
            slug_index_.erase(slug);
        }
        throw;
    }
    return slug;
}

std::optional<Artifact> JsonArtifactStore::get(const std::string& slug) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = slug_index_.find(slug);
    if (it == slug_index_.end()) return std::nullopt;
    return artifacts_[it->second];
}

uint32_t JsonArtifactStore::count() {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<uint32_t>(artifacts_.size());
}

} // namespace docrelay
