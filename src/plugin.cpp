#include "plugin.hpp"
#include "artifact_store.hpp"
#include <stdexcept>
#include <algorithm>

namespace docrelay {

PluginRegistry& PluginRegistry::instance() {
    static PluginRegistry registry;
    return registry;
}

void PluginRegistry::register_store(const std::string& name, StoreFactory factory) {
    std::lock_guard<std::mutex> lock(mutex_);
    stores_[name] = std::move(factory);
}

std::unique_ptr<ArtifactStore> PluginRegistry::create_store(const std::string& name,
                                                            const Config& config) const {
    StoreFactory factory;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = stores_.find(name);
        if (it == stores_.end()) {
            throw std::invalid_argument("Unknown store backend: " + name);
        }
        factory = it->second;
    }
    // Backends may open files in their constructors; don't hold the lock.
    return factory(config);
}

std::vector<std::string> PluginRegistry::store_names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(stores_.size());
    for (const auto& [name, _] : stores_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

bool PluginRegistry::has_store(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stores_.count(name) > 0;
}

} // namespace docrelay
