// FILE: include/plugin_api.hpp
#pragma once

#include "kernel/provider_registry.hpp"
#include "tk_types.hpp"

/**
 * @brief The function signature that every Thumbkit plugin must implement
 * and export.
 *
 * When the application loads a plugin (a .so, .dylib or .dll file), it looks
 * for a function named "register_thumbkit_providers" and calls it with a
 * registry. The plugin registers provider factories there; the loader then
 * tags them with the plugin's path. Register factories, not instances:
 * construction happens later, when a provider is realized during discovery.
 *
 * Use extern "C" to prevent C++ name mangling, which ensures that the
 * application can find the function by its exact name.
 */
#ifdef _WIN32
#define PLUGIN_API __declspec(dllexport)
#else
#define PLUGIN_API __attribute__((visibility("default")))
#endif

#define THUMBKIT_REGISTER_SYMBOL "register_thumbkit_providers"

extern "C" PLUGIN_API void register_thumbkit_providers(tk::ProviderRegistry& registry);
