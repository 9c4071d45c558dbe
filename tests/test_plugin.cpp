#include <catch2/catch_test_macros.hpp>
#include "plugin.hpp"
#include "artifact_store.hpp"
#include "fake_artifact_store.hpp"
#include <filesystem>
#include <stdexcept>
#include <unistd.h>

using namespace docrelay;

TEST_CASE("PluginRegistry: built-in backends self-register", "[plugin]") {
    auto& reg = PluginRegistry::instance();
    REQUIRE(reg.has_store("json"));
#ifdef DOCRELAY_HAS_SQLITE_STORE
    REQUIRE(reg.has_store("sqlite"));
#endif
}

TEST_CASE("PluginRegistry: register and create custom store", "[plugin]") {
    auto& reg = PluginRegistry::instance();
    reg.register_store("test_fake", [](const Config&) {
        return std::make_unique<FakeArtifactStore>();
    });

    REQUIRE(reg.has_store("test_fake"));
    Config cfg;
    auto store = reg.create_store("test_fake", cfg);
    REQUIRE(store != nullptr);
    REQUIRE(store->backend_name() == "fake");
}

TEST_CASE("PluginRegistry: create unknown store throws", "[plugin]") {
    Config cfg;
    REQUIRE_THROWS_AS(PluginRegistry::instance().create_store("nonexistent_xyz", cfg),
                      std::invalid_argument);
}

TEST_CASE("PluginRegistry: store_names returns sorted list", "[plugin]") {
    auto names = PluginRegistry::instance().store_names();
    REQUIRE_FALSE(names.empty());
    for (size_t i = 1; i < names.size(); ++i) {
        REQUIRE(names[i - 1] < names[i]);
    }
}

TEST_CASE("create_artifact_store: uses configured backend and path", "[plugin]") {
    std::string path = "/tmp/docrelay_plugin_" + std::to_string(getpid()) + ".json";
    Config cfg;
    cfg.store.backend = "json";
    cfg.store.path = path;

    auto store = create_artifact_store(cfg);
    REQUIRE(store->backend_name() == "json");
    store->upsert("owner-1234", "https://h/r", "r", {{"k", 1}});
    REQUIRE(std::filesystem::exists(path));

    std::filesystem::remove(path);
}
