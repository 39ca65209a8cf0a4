// Thumbkit kernel: PluginManager implementation
#include "kernel/plugin_manager.hpp"

#include <set>

#include "plugin_loader.hpp"  // load_plugins(dir_patterns, registry)

namespace tk {

void PluginManager::load_from_dirs(const std::vector<std::string>& dir_patterns) {
    (void)load_from_dirs_report(dir_patterns);
}

PluginLoadResult PluginManager::load_from_dirs_report(const std::vector<std::string>& dir_patterns) {
    return load_plugins(dir_patterns, registry_);
}

int PluginManager::unload_by_plugin_path(const std::string& absolute_plugin_path) {
    if (absolute_plugin_path == kBuiltinSource) return 0;
    return registry_.unregister_source(absolute_plugin_path);
}

int PluginManager::unload_all_plugins() {
    std::set<std::string> plugin_sources;
    for (const auto& info : registry_.list())
        if (info.source != kBuiltinSource) plugin_sources.insert(info.source);
    int removed = 0;
    for (const auto& src : plugin_sources) removed += registry_.unregister_source(src);
    return removed;
}

std::map<std::string, std::string> PluginManager::provider_sources() const {
    std::map<std::string, std::string> out;
    for (const auto& info : registry_.list())
        out.emplace(make_key(info.capability, info.name), info.source);
    return out;
}

}  // namespace tk
