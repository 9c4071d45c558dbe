#include <catch2/catch_test_macros.hpp>
#include "store/sqlite_store.hpp"
#include <filesystem>
#include <stdexcept>
#include <thread>
#include <vector>
#include <unistd.h>

using namespace docrelay;

static std::string test_db_path() {
    return "/tmp/docrelay_test_artifacts_" + std::to_string(getpid()) + ".db";
}

struct SqliteStoreFixture {
    std::string path = test_db_path();

    SqliteStoreFixture() { cleanup(); }
    ~SqliteStoreFixture() { cleanup(); }

    void cleanup() {
        std::filesystem::remove(path);
        std::filesystem::remove(path + "-wal");
        std::filesystem::remove(path + "-shm");
    }
};

TEST_CASE("SqliteArtifactStore: upsert and get", "[sqlite_store]") {
    SqliteArtifactStore store(":memory:");
    REQUIRE(store.backend_name() == "sqlite");

    nlohmann::json docs = {{"title", "Widgets"}, {"sections", {1, 2, 3}}};
    auto slug = store.upsert("0123456789", "https://github.com/acme/Widgets.git",
                             "Widgets", docs);
    REQUIRE(slug == "widgets-01234567");

    auto a = store.get(slug);
    REQUIRE(a.has_value());
    REQUIRE(a->owner == "0123456789");
    REQUIRE(a->repo_name == "Widgets");
    REQUIRE(a->doc_type == "auto");
    REQUIRE(a->docs == docs);
    REQUIRE(a->created_at > 0);
    REQUIRE(store.count() == 1);
}

TEST_CASE("SqliteArtifactStore: get unknown slug", "[sqlite_store]") {
    SqliteArtifactStore store(":memory:");
    REQUIRE_FALSE(store.get("missing-00000000").has_value());
    REQUIRE(store.count() == 0);
}

TEST_CASE("SqliteArtifactStore: repeated upsert is idempotent", "[sqlite_store]") {
    SqliteArtifactStore store(":memory:");
    nlohmann::json docs = {{"doc_type", "cli"}, {"title", "t"}};

    auto s1 = store.upsert("owner1234", "https://h/t", "t", docs);
    auto s2 = store.upsert("owner1234", "https://h/t", "t", docs);
    REQUIRE(s1 == s2);
    REQUIRE(store.count() == 1);
    REQUIRE(store.get(s1)->doc_type == "cli");
}

TEST_CASE("SqliteArtifactStore: last write wins, created_at kept", "[sqlite_store]") {
    SqliteArtifactStore store(":memory:");

    auto slug = store.upsert("owner1234", "https://h/t", "t", {{"v", 1}});
    auto created = store.get(slug)->created_at;
    store.upsert("owner1234", "", "t", {{"v", 2}});

    auto a = store.get(slug);
    REQUIRE(a->docs["v"] == 2);
    REQUIRE(a->created_at == created);
    REQUIRE(a->repo_url == "https://h/t");
}

TEST_CASE("SqliteArtifactStore: survives reopen", "[sqlite_store]") {
    SqliteStoreFixture f;
    std::string slug;
    {
        SqliteArtifactStore store(f.path);
        slug = store.upsert("owner1234", "https://h/x", "x", {{"k", "v"}});
    }
    SqliteArtifactStore reopened(f.path);
    auto a = reopened.get(slug);
    REQUIRE(a.has_value());
    REQUIRE(a->docs["k"] == "v");
}

TEST_CASE("SqliteArtifactStore: concurrent upserts of one slug", "[sqlite_store]") {
    SqliteStoreFixture f;
    SqliteArtifactStore store(f.path);

    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&store, i]() {
            store.upsert("owner1234", "https://h/x", "x", {{"writer", i}});
        });
    }
    for (auto& t : threads) t.join();

    REQUIRE(store.count() == 1);
    auto a = store.get("x-owner123");
    REQUIRE(a.has_value());
    REQUIRE(a->docs["writer"].get<int>() >= 0);
}

TEST_CASE("SqliteArtifactStore: unopenable path throws", "[sqlite_store]") {
    REQUIRE_THROWS_AS(SqliteArtifactStore("/proc/docrelay-no-such-dir/a.db"),
                      std::runtime_error);
}
