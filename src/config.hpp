#pragma once
#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace docrelay {

struct ServerConfig {
    std::string listen = "127.0.0.1:8787";
    uint32_t max_body = 1048576;        // bytes; larger request bodies get 413
    uint32_t max_connections = 64;      // concurrent relays
    std::string owner_header = "x-owner-id";
    std::string proxy_secret;           // required as x-relay-secret when set
};

struct UpstreamConfig {
    std::string agent_url = "http://localhost:8000";
    uint32_t generate_timeout = 600;    // seconds
    uint32_t refine_timeout = 120;      // seconds
};

struct StoreConfig {
#ifdef DOCRELAY_HAS_SQLITE_STORE
    std::string backend = "sqlite";
#else
    std::string backend = "json";
#endif
    std::string path;                   // empty = backend default under ~/.docrelay
};

struct Config {
    ServerConfig server;
    UpstreamConfig upstream;
    StoreConfig store;

    // Load from ~/.docrelay/config.json + env vars
    static Config load();

    // Load from an explicit path (created with defaults if missing) + env vars
    static Config load_from(const std::string& config_path);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Populate a Config from (already default-merged) JSON. Ignores env vars.
    static Config from_json(const nlohmann::json& j);
};

} // namespace docrelay
