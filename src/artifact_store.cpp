#include "artifact_store.hpp"
#include "config.hpp"
#include "plugin.hpp"

#include <cctype>

namespace docrelay {

std::string slugify(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    bool pending_dash = false;
    for (char ch : name) {
        auto c = static_cast<unsigned char>(ch);
        if (std::isalnum(c) && c < 0x80) {
            if (pending_dash && !out.empty()) out += '-';
            pending_dash = false;
            out += static_cast<char>(std::tolower(c));
        } else {
            pending_dash = true;
        }
    }
    return out;
}

std::string make_slug(const std::string& repo_name, const std::string& owner) {
    return slugify(repo_name) + "-" + owner.substr(0, 8);
}

std::string doc_type_of(const nlohmann::json& docs) {
    if (docs.is_object() && docs.contains("doc_type") && docs["doc_type"].is_string()) {
        auto t = docs["doc_type"].get<std::string>();
        if (!t.empty()) return t;
    }
    return "auto";
}

std::unique_ptr<ArtifactStore> create_artifact_store(const Config& config) {
    return PluginRegistry::instance().create_store(config.store.backend, config);
}

} // namespace docrelay
