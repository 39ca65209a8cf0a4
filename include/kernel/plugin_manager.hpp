// Thumbkit kernel: PluginManager interface
#pragma once

#include <map>
#include <string>
#include <vector>

#include "kernel/plugin_result.hpp"
#include "kernel/provider_manifest.hpp"
#include "kernel/provider_registry.hpp"

namespace tk {

// Manages dynamic plugins and the providers they register.
// - Loads shared libraries with load_plugins() and manifests with register_manifest().
// - Tracks which providers came from which plugin path for safe unload.
class THUMBKIT_API PluginManager {
public:
    explicit PluginManager(ProviderRegistry& registry) : registry_(registry) {}

    // Load plugins from the given directory patterns.
    void load_from_dirs(const std::vector<std::string>& dir_patterns);
    PluginLoadResult load_from_dirs_report(const std::vector<std::string>& dir_patterns);

    // Register the Capability items of a manifest as lazy entries.
    template <typename Capability>
    PluginLoadResult load_manifest(const fs::path& manifest_path) {
        return register_manifest<Capability>(registry_, manifest_path);
    }

    // Unregister every provider that came from a specific plugin or manifest path.
    // Returns number of providers unregistered. Instances already handed out keep
    // their library loaded until they are released.
    int unload_by_plugin_path(const std::string& absolute_plugin_path);

    // Unregister all providers from any plugin (does not touch built-ins).
    int unload_all_plugins();

    // capability:name -> source ("built-in" or absolute .so/.dylib/.dll/manifest path).
    // A name registered twice keeps its first source.
    std::map<std::string, std::string> provider_sources() const;

    ProviderRegistry& registry() { return registry_; }

private:
    ProviderRegistry& registry_;
};

} // namespace tk
