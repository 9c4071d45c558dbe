#include "config.hpp"
#include "util.hpp"

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace docrelay {

nlohmann::json Config::defaults_json() {
    return {
        {"server", {
            {"listen", "127.0.0.1:8787"},
            {"max_body", 1048576},
            {"max_connections", 64},
            {"owner_header", "x-owner-id"},
            {"proxy_secret", ""}
        }},
        {"upstream", {
            {"agent_url", "http://localhost:8000"},
            {"generate_timeout", 600},
            {"refine_timeout", 120}
        }},
        {"store", {
#ifdef DOCRELAY_HAS_SQLITE_STORE
            {"backend", "sqlite"},
#else
            {"backend", "json"},
#endif
            {"path", ""}
        }}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

static void read_string(const nlohmann::json& obj, const char* key, std::string& out) {
    if (obj.contains(key) && obj[key].is_string())
        out = obj[key].get<std::string>();
}

// Leaves out untouched unless the value is an integer in [min, UINT32_MAX].
static void read_uint(const nlohmann::json& obj, const char* key, uint32_t& out,
                      uint32_t min = 0) {
    if (!obj.contains(key)) return;
    const auto& v = obj[key];
    if (!v.is_number_integer()) return;

    bool in_range = v.is_number_unsigned()
        ? v.get<uint64_t>() >= min && v.get<uint64_t>() <= UINT32_MAX
        : v.get<int64_t>() >= static_cast<int64_t>(min) &&
          v.get<int64_t>() <= static_cast<int64_t>(UINT32_MAX);
    if (!in_range) {
        std::cerr << "[config] Ignoring out-of-range " << key << ": " << v.dump() << "\n";
        return;
    }
    out = static_cast<uint32_t>(v.get<int64_t>());
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;

    if (j.contains("server") && j["server"].is_object()) {
        auto& s = j["server"];
        read_string(s, "listen", cfg.server.listen);
        read_uint(s, "max_body", cfg.server.max_body);
        read_uint(s, "max_connections", cfg.server.max_connections);
        read_string(s, "owner_header", cfg.server.owner_header);
        read_string(s, "proxy_secret", cfg.server.proxy_secret);
        cfg.server.owner_header = to_lower(cfg.server.owner_header);
    }

    if (j.contains("upstream") && j["upstream"].is_object()) {
        auto& u = j["upstream"];
        read_string(u, "agent_url", cfg.upstream.agent_url);
        read_uint(u, "generate_timeout", cfg.upstream.generate_timeout, 1);
        read_uint(u, "refine_timeout", cfg.upstream.refine_timeout, 1);
    }

    if (j.contains("store") && j["store"].is_object()) {
        auto& st = j["store"];
        read_string(st, "backend", cfg.store.backend);
        read_string(st, "path", cfg.store.path);
    }

    return cfg;
}

Config Config::load() {
    return load_from(expand_home("~/.docrelay/config.json"));
}

Config Config::load_from(const std::string& config_path) {
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                if (atomic_write_file(config_path, j.dump(4) + "\n"))
                    std::cerr << "[config] Migrated config with new defaults: "
                              << config_path << "\n";
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Malformed " << config_path << " (" << e.what()
                      << "), using defaults\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n"))
            std::cerr << "[config] Created default config: " << config_path << "\n";
    }

    Config cfg = from_json(j);

    // Environment variables always override config file
    if (const char* v = std::getenv("AGENT_URL"))
        cfg.upstream.agent_url = v;
    if (const char* v = std::getenv("DOCRELAY_LISTEN"))
        cfg.server.listen = v;
    if (const char* v = std::getenv("DOCRELAY_PROXY_SECRET"))
        cfg.server.proxy_secret = v;
    if (const char* v = std::getenv("DOCRELAY_STORE_BACKEND"))
        cfg.store.backend = v;
    if (const char* v = std::getenv("DOCRELAY_STORE_PATH"))
        cfg.store.path = v;

    return cfg;
}

} // namespace docrelay
