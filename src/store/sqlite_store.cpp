#include "sqlite_store.hpp"
#include "../config.hpp"
#include "../plugin.hpp"
#include "../util.hpp"
#include <nlohmann/json.hpp>
#include <sqlite3.h>
#include <filesystem>
#include <stdexcept>

static docrelay::StoreRegistrar reg_sqlite("sqlite",
    [](const docrelay::Config& config) {
        std::string path = config.store.path;
        if (path.empty()) {
            path = docrelay::expand_home("~/.docrelay/artifacts.db");
        }
        return std::make_unique<docrelay::SqliteArtifactStore>(path);
    });

namespace docrelay {

// RAII wrapper for sqlite3_stmt
struct StmtGuard {
    sqlite3_stmt* stmt = nullptr;
    ~StmtGuard() { if (stmt) sqlite3_finalize(stmt); }
};

SqliteArtifactStore::SqliteArtifactStore(const std::string& path) : path_(path) {
    // Ensure parent directory exists
    if (path_ != ":memory:") {
        auto parent = std::filesystem::path(path_).parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent);
        }
    }

    if (sqlite3_open(path_.c_str(), &db_) != SQLITE_OK) {
        std::string err = db_ ? sqlite3_errmsg(db_) : "unknown error";
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        throw std::runtime_error("SqliteArtifactStore: failed to open database: " + err);
    }

    // Concurrent relays may upsert while another connection reads
    sqlite3_busy_timeout(db_, 5000);
    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
    sqlite3_exec(db_, "PRAGMA synchronous=NORMAL;", nullptr, nullptr, nullptr);

    init_schema();
}

SqliteArtifactStore::~SqliteArtifactStore() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

void SqliteArtifactStore::init_schema() {
    const char* create_table =
        "CREATE TABLE IF NOT EXISTS artifacts ("
        "  slug       TEXT PRIMARY KEY,"
        "  owner      TEXT NOT NULL,"
        "  repo_url   TEXT NOT NULL,"
        "  repo_name  TEXT NOT NULL,"
        "  doc_type   TEXT NOT NULL,"
        "  docs       TEXT NOT NULL,"
        "  created_at INTEGER NOT NULL,"
        "  updated_at INTEGER NOT NULL"
        ");";
    char* err = nullptr;
    if (sqlite3_exec(db_, create_table, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw std::runtime_error("SqliteArtifactStore: schema setup failed: " + msg);
    }

    sqlite3_exec(db_, "CREATE INDEX IF NOT EXISTS artifacts_owner ON artifacts(owner);",
                 nullptr, nullptr, nullptr);
}

std::string SqliteArtifactStore::upsert(const std::string& owner,
                                        const std::string& repo_url,
                                        const std::string& repo_name,
                                        const nlohmann::json& docs) {
    std::string slug = make_slug(repo_name, owner);
    std::string doc_type = doc_type_of(docs);
    std::string docs_text = docs.dump();
    auto now = static_cast<int64_t>(epoch_seconds());

    std::lock_guard<std::mutex> lock(mutex_);

    // created_at survives updates; an empty repo_url never clobbers a known one
    const char* sql =
        "INSERT INTO artifacts (slug, owner, repo_url, repo_name, doc_type, docs,"
        "                       created_at, updated_at)"
        " VALUES (?, ?, ?, ?, ?, ?, ?, ?)"
        " ON CONFLICT(slug) DO UPDATE SET"
        "  repo_url   = CASE WHEN excluded.repo_url <> '' THEN excluded.repo_url"
        "                    ELSE artifacts.repo_url END,"
        "  repo_name  = excluded.repo_name,"
        "  doc_type   = excluded.doc_type,"
        "  docs       = excluded.docs,"
        "  updated_at = excluded.updated_at;";

    StmtGuard g;
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error(std::string("SqliteArtifactStore: prepare failed: ")
                                 + sqlite3_errmsg(db_));
    }
    sqlite3_bind_text(g.stmt, 1, slug.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 2, owner.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 3, repo_url.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 4, repo_name.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 5, doc_type.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 6, docs_text.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(g.stmt, 7, now);
    sqlite3_bind_int64(g.stmt, 8, now);

    if (sqlite3_step(g.stmt) != SQLITE_DONE) {
        throw std::runtime_error(std::string("SqliteArtifactStore: upsert failed: ")
                                 + sqlite3_errmsg(db_));
    }
    return slug;
}

std::optional<Artifact> SqliteArtifactStore::get(const std::string& slug) {
    std::lock_guard<std::mutex> lock(mutex_);

    StmtGuard g;
    const char* sql =
        "SELECT slug, owner, repo_url, repo_name, doc_type, docs, created_at, updated_at"
        " FROM artifacts WHERE slug = ?;";
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error(std::string("SqliteArtifactStore: prepare failed: ")
                                 + sqlite3_errmsg(db_));
    }
    sqlite3_bind_text(g.stmt, 1, slug.c_str(), -1, SQLITE_STATIC);

    if (sqlite3_step(g.stmt) != SQLITE_ROW) return std::nullopt;

    auto text_col = [&g](int col) -> std::string {
        auto* v = sqlite3_column_text(g.stmt, col);
        return v ? reinterpret_cast<const char*>(v) : "";
    };

    Artifact a;
    a.slug       = text_col(0);
    a.owner      = text_col(1);
    a.repo_url   = text_col(2);
    a.repo_name  = text_col(3);
    a.doc_type   = text_col(4);
    a.docs       = nlohmann::json::parse(text_col(5), nullptr, false);
    a.created_at = static_cast<uint64_t>(sqlite3_column_int64(g.stmt, 6));
    a.updated_at = static_cast<uint64_t>(sqlite3_column_int64(g.stmt, 7));
    if (a.docs.is_discarded()) a.docs = nullptr;
    return a;
}

uint32_t SqliteArtifactStore::count() {
    std::lock_guard<std::mutex> lock(mutex_);

    StmtGuard g;
    if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM artifacts;", -1,
                           &g.stmt, nullptr) != SQLITE_OK) {
        return 0;
    }
    if (sqlite3_step(g.stmt) != SQLITE_ROW) return 0;
    return static_cast<uint32_t>(sqlite3_column_int(g.stmt, 0));
}

} // namespace docrelay
