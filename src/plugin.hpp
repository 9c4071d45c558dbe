#pragma once
#include "config.hpp"
#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <unordered_map>
#include <mutex>

namespace docrelay {

class ArtifactStore; // forward declaration

// Factory function types
using StoreFactory = std::function<std::unique_ptr<ArtifactStore>(const Config& config)>;

// Central registry for self-registering store backends.
// All methods are thread-safe.
class PluginRegistry {
public:
    static PluginRegistry& instance();

    // Registration
    void register_store(const std::string& name, StoreFactory factory);

    // Creation. Throws std::invalid_argument for an unknown backend name.
    std::unique_ptr<ArtifactStore> create_store(const std::string& name,
                                                const Config& config) const;

    // Query
    std::vector<std::string> store_names() const;
    bool has_store(const std::string& name) const;

private:
    PluginRegistry() = default;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, StoreFactory> stores_;
};

// ── Self-registrar helper (used at file scope in each backend .cpp) ──

struct StoreRegistrar {
    StoreRegistrar(const std::string& name, StoreFactory factory) {
        PluginRegistry::instance().register_store(name, std::move(factory));
    }
};

} // namespace docrelay
