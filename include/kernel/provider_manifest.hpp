// Thumbkit kernel: YAML provider manifests
#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "kernel/plugin_result.hpp"
#include "kernel/provider_registry.hpp"
#include "kernel/shared_library.hpp"

namespace tk {

// One item of a manifest:
//
//   providers:
//     - capability: thumbnail_renderer
//       name: heif
//       library: plugins/libheif_renderer.so   # relative to the manifest
//       factory: create_heif_renderer          # extern "C" Capability* ()
struct ManifestEntry {
    std::string capability;
    std::string name;
    fs::path library;
    std::string factory;
    int line = -1;  // 1-based line of the item in the manifest, -1 if unknown
};

struct ProviderManifest {
    fs::path path;
    std::vector<ManifestEntry> entries;
};

// Throws ThumbError(NotFound) if the file is missing, ThumbError(InvalidYaml) if it
// does not parse or has no `providers` sequence. Missing fields inside an item
// are not checked here; they surface when the entry is realized.
THUMBKIT_API ProviderManifest read_provider_manifest(const fs::path& manifest_path);

/**
 * @brief Registers every manifest item of Capability as a lazy entry.
 *
 * Nothing is opened here. The library is loaded and the factory symbol
 * resolved when a ProviderSequence realizes the entry, so a missing library or
 * symbol fails that entry alone. The provider keeps its library loaded.
 */
template <typename Capability>
PluginLoadResult register_manifest(ProviderRegistry& registry, const fs::path& manifest_path) {
    PluginLoadResult result;
    const std::string source = fs::absolute(manifest_path).string();
    ++result.attempted;

    ProviderManifest manifest;
    try {
        manifest = read_provider_manifest(manifest_path);
    } catch (const ThumbError& e) {
        result.errors.push_back({source, e.code(), e.what()});
        return result;
    }

    const std::string capability = CapabilityTraits<Capability>::name();
    for (std::size_t i = 0; i < manifest.entries.size(); ++i) {
        const ManifestEntry& item = manifest.entries[i];
        if (item.capability.empty()) {
            result.errors.push_back({source, ThumbErrc::InvalidParameter,
                                     "providers[" + std::to_string(i) + "] has no capability"});
            continue;
        }
        if (item.capability != capability) continue;

        const std::string name = item.name.empty() ? "providers[" + std::to_string(i) + "]" : item.name;
        ErasedFactory factory = [item]() -> std::shared_ptr<void> {
            if (item.library.empty()) throw ThumbError(ThumbErrc::InvalidParameter, "manifest item has no library");
            if (item.factory.empty()) throw ThumbError(ThumbErrc::InvalidParameter, "manifest item has no factory");
            using CreateFunc = Capability* (*)();
            std::shared_ptr<SharedLibrary> library = SharedLibrary::open(item.library);
            CreateFunc create = library->function<CreateFunc>(item.factory);
            Capability* raw = create();
            if (!raw) return nullptr;
            // The deleter runs plugin code, so it keeps the library loaded until after delete.
            return std::shared_ptr<Capability>(raw, [library](Capability* p) { delete p; });
        };
        result.new_provider_keys.push_back(make_key(capability, name));
        registry.register_erased({capability, name, source}, std::move(factory));
    }
    ++result.loaded;
    return result;
}

} // namespace tk
