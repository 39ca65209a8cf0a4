#include "kernel/provider_manifest.hpp"

#include <yaml-cpp/yaml.h>

namespace tk {

static std::string as_str(const YAML::Node& n, const std::string& key) {
    if (!n || !n[key] || !n[key].IsScalar()) return {};
    return n[key].as<std::string>();
}

ProviderManifest read_provider_manifest(const fs::path& manifest_path) {
    if (!fs::exists(manifest_path))
        throw ThumbError(ThumbErrc::NotFound, "Manifest not found: " + manifest_path.string());

    YAML::Node root;
    try {
        root = YAML::LoadFile(manifest_path.string());
    } catch (const YAML::Exception& e) {
        throw ThumbError(ThumbErrc::InvalidYaml, "Failed to parse manifest '" + manifest_path.string() + "': " + e.what());
    }
    if (!root["providers"] || !root["providers"].IsSequence())
        throw ThumbError(ThumbErrc::InvalidYaml, "Manifest '" + manifest_path.string() + "' has no 'providers' sequence");

    ProviderManifest manifest;
    manifest.path = fs::absolute(manifest_path);
    const fs::path base_dir = manifest.path.parent_path();

    for (const auto& item : root["providers"]) {
        ManifestEntry entry;
        entry.capability = as_str(item, "capability");
        entry.name = as_str(item, "name");
        entry.factory = as_str(item, "factory");
        const std::string lib = as_str(item, "library");
        if (!lib.empty()) {
            fs::path lib_path(lib);
            entry.library = lib_path.is_absolute() ? lib_path : base_dir / lib_path;
        }
        entry.line = item.Mark().line >= 0 ? item.Mark().line + 1 : -1;
        manifest.entries.push_back(std::move(entry));
    }
    return manifest;
}

} // namespace tk
