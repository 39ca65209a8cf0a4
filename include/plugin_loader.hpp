// Plugin loading utilities for Thumbkit
#pragma once

#include <string>
#include <vector>

// Scans directories for plugins and loads them, registering providers.
// - plugin_dir_paths: list of directories or simple wildcard patterns to scan for shared libraries.
//   Suffix semantics:
//     - "path" or "path/*"  => shallow scan (only the directory itself)
//     - "path/**"            => recursive scan of all subdirectories
//   Libraries inside one directory are loaded in path order.
// - registry: receives the providers, each tagged with the absolute plugin path as source.
#include "kernel/plugin_result.hpp"
#include "kernel/provider_registry.hpp"

namespace tk {

// Load plugins and report result (no console I/O in kernel).
THUMBKIT_API PluginLoadResult load_plugins(const std::vector<std::string>& plugin_dir_paths,
                                           ProviderRegistry& registry);

// Load a single plugin library.
THUMBKIT_API PluginLoadResult load_plugin_file(const fs::path& path, ProviderRegistry& registry);

} // namespace tk
