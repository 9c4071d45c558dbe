#include <catch2/catch_test_macros.hpp>
#include "config.hpp"
#include <fstream>
#include <sstream>
#include <filesystem>
#include <cstdlib>
#include <unistd.h>
#include <nlohmann/json.hpp>

using namespace docrelay;

// ── Default values ───────────────────────────────────────────────

TEST_CASE("Config: default values are sensible", "[config]") {
    Config cfg;
    REQUIRE(cfg.server.listen == "127.0.0.1:8787");
    REQUIRE(cfg.server.max_body == 1048576);
    REQUIRE(cfg.server.owner_header == "x-owner-id");
    REQUIRE(cfg.server.proxy_secret.empty());
    REQUIRE(cfg.upstream.agent_url == "http://localhost:8000");
    REQUIRE(cfg.upstream.generate_timeout == 600);
    REQUIRE(cfg.upstream.refine_timeout == 120);
    REQUIRE(cfg.store.path.empty());
}

TEST_CASE("Config::from_json: defaults_json matches struct defaults", "[config]") {
    Config a = Config::from_json(Config::defaults_json());
    Config b;
    REQUIRE(a.server.listen == b.server.listen);
    REQUIRE(a.server.max_connections == b.server.max_connections);
    REQUIRE(a.upstream.agent_url == b.upstream.agent_url);
    REQUIRE(a.store.backend == b.store.backend);
}

TEST_CASE("Config::from_json: reads every section", "[config]") {
    nlohmann::json j = {
        {"server", {{"listen", "0.0.0.0:9000"}, {"max_body", 2048},
                    {"max_connections", 4}, {"owner_header", "X-User-Id"},
                    {"proxy_secret", "s3cret"}}},
        {"upstream", {{"agent_url", "http://agent:8000"},
                      {"generate_timeout", 30}, {"refine_timeout", 10}}},
        {"store", {{"backend", "json"}, {"path", "/tmp/a.json"}}},
    };
    Config cfg = Config::from_json(j);
    REQUIRE(cfg.server.listen == "0.0.0.0:9000");
    REQUIRE(cfg.server.max_body == 2048);
    REQUIRE(cfg.server.max_connections == 4);
    REQUIRE(cfg.server.owner_header == "x-user-id");
    REQUIRE(cfg.server.proxy_secret == "s3cret");
    REQUIRE(cfg.upstream.agent_url == "http://agent:8000");
    REQUIRE(cfg.upstream.generate_timeout == 30);
    REQUIRE(cfg.upstream.refine_timeout == 10);
    REQUIRE(cfg.store.backend == "json");
    REQUIRE(cfg.store.path == "/tmp/a.json");
}

TEST_CASE("Config::from_json: wrong types and negatives are ignored", "[config]") {
    nlohmann::json j = {
        {"server", {{"listen", 42}, {"max_body", -1}}},
        {"upstream", "not an object"},
    };
    Config cfg = Config::from_json(j);
    REQUIRE(cfg.server.listen == "127.0.0.1:8787");
    REQUIRE(cfg.server.max_body == 1048576);
    REQUIRE(cfg.upstream.agent_url == "http://localhost:8000");
}

TEST_CASE("Config::from_json: values outside uint32 are ignored", "[config]") {
    nlohmann::json j = {
        {"server", {{"max_body", 4294967296ULL}, {"max_connections", 4294967295ULL}}},
        {"upstream", {{"generate_timeout", 99999999999LL}}},
    };
    Config cfg = Config::from_json(j);
    REQUIRE(cfg.server.max_body == 1048576);
    REQUIRE(cfg.server.max_connections == 4294967295u);
    REQUIRE(cfg.upstream.generate_timeout == 600);
}

TEST_CASE("Config::from_json: zero timeouts keep the defaults", "[config]") {
    nlohmann::json j = {
        {"upstream", {{"generate_timeout", 0}, {"refine_timeout", 0}}},
    };
    Config cfg = Config::from_json(j);
    REQUIRE(cfg.upstream.generate_timeout == 600);
    REQUIRE(cfg.upstream.refine_timeout == 120);
}

// ── Config::load_from ───────────────────────────────────────────

static std::string make_temp_dir() {
    auto path = std::filesystem::temp_directory_path() / "docrelay_cfg_XXXXXX";
    std::string tmpl = path.string();
    char* result = mkdtemp(tmpl.data());
    return result ? std::string(result) : "";
}

// RAII guard: temp dir for the config file, env overrides cleared
struct ConfigTestGuard {
    std::string dir;

    ConfigTestGuard() {
        dir = make_temp_dir();
        unsetenv("AGENT_URL");
        unsetenv("DOCRELAY_LISTEN");
        unsetenv("DOCRELAY_PROXY_SECRET");
        unsetenv("DOCRELAY_STORE_BACKEND");
        unsetenv("DOCRELAY_STORE_PATH");
    }

    ~ConfigTestGuard() {
        std::filesystem::remove_all(dir);
    }

    ConfigTestGuard(const ConfigTestGuard&) = delete;
    ConfigTestGuard& operator=(const ConfigTestGuard&) = delete;

    std::string config_path() const { return dir + "/.docrelay/config.json"; }

    void write_config(const std::string& content) {
        std::filesystem::create_directories(dir + "/.docrelay");
        std::ofstream f(config_path());
        f << content;
    }

    nlohmann::json read_config() const {
        std::ifstream f(config_path());
        return nlohmann::json::parse(f, nullptr, false);
    }
};

TEST_CASE("Config::load_from: reads config file", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({
        "server": { "listen": "127.0.0.1:9999", "proxy_secret": "abc" },
        "upstream": { "agent_url": "http://agent:1234", "generate_timeout": 45 }
    })");

    Config cfg = Config::load_from(g.config_path());
    REQUIRE(cfg.server.listen == "127.0.0.1:9999");
    REQUIRE(cfg.server.proxy_secret == "abc");
    REQUIRE(cfg.upstream.agent_url == "http://agent:1234");
    REQUIRE(cfg.upstream.generate_timeout == 45);
    REQUIRE(cfg.upstream.refine_timeout == 120);
}

TEST_CASE("Config::load_from: missing file is created with defaults", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    Config cfg = Config::load_from(g.config_path());
    REQUIRE(cfg.server.listen == "127.0.0.1:8787");
    REQUIRE(std::filesystem::exists(g.config_path()));
    REQUIRE(g.read_config() == Config::defaults_json());
}

TEST_CASE("Config::load_from: existing file gains new default keys", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({"server": {"listen": "127.0.0.1:7000"}})");
    Config cfg = Config::load_from(g.config_path());
    REQUIRE(cfg.server.listen == "127.0.0.1:7000");

    auto j = g.read_config();
    REQUIRE(j["server"]["listen"] == "127.0.0.1:7000");
    REQUIRE(j["server"].contains("owner_header"));
    REQUIRE(j.contains("upstream"));
    REQUIRE(j.contains("store"));
}

TEST_CASE("Config::load_from: malformed JSON falls back to defaults", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config("not valid json {{{");
    Config cfg = Config::load_from(g.config_path());
    REQUIRE(cfg.server.listen == "127.0.0.1:8787");
    REQUIRE(cfg.upstream.agent_url == "http://localhost:8000");

    // The malformed file is left for the operator to fix
    std::ifstream f(g.config_path());
    std::stringstream ss;
    ss << f.rdbuf();
    REQUIRE(ss.str() == "not valid json {{{");
}

TEST_CASE("Config::load_from: env vars override config file", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({"upstream": {"agent_url": "http://from-file:1"}})");
    setenv("AGENT_URL", "http://from-env:2", 1);
    setenv("DOCRELAY_LISTEN", "127.0.0.1:1111", 1);
    setenv("DOCRELAY_PROXY_SECRET", "env-secret", 1);
    setenv("DOCRELAY_STORE_BACKEND", "json", 1);
    setenv("DOCRELAY_STORE_PATH", "/tmp/env-store.json", 1);

    Config cfg = Config::load_from(g.config_path());
    REQUIRE(cfg.upstream.agent_url == "http://from-env:2");
    REQUIRE(cfg.server.listen == "127.0.0.1:1111");
    REQUIRE(cfg.server.proxy_secret == "env-secret");
    REQUIRE(cfg.store.backend == "json");
    REQUIRE(cfg.store.path == "/tmp/env-store.json");

    unsetenv("AGENT_URL");
    unsetenv("DOCRELAY_LISTEN");
    unsetenv("DOCRELAY_PROXY_SECRET");
    unsetenv("DOCRELAY_STORE_BACKEND");
    unsetenv("DOCRELAY_STORE_PATH");
}
