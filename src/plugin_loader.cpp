// Implementation of plugin loading
#include "plugin_loader.hpp"

#include <algorithm>
#include <memory>
#include <utility>
#include <vector>

#include "kernel/shared_library.hpp"
#include "plugin_api.hpp"

namespace tk {

namespace {

using RegisterFunc = void (*)(ProviderRegistry&);

// Wraps a plugin-made factory so every provider it builds pins the library.
// Member order matters: `library` is declared first so it is destroyed last,
// after the plugin-owned `inner` target.
struct LibraryBoundFactory {
    std::shared_ptr<SharedLibrary> library;
    ErasedFactory inner;

    std::shared_ptr<void> operator()() const {
        std::shared_ptr<void> obj = inner();
        if (!obj) return obj;
        struct Holder {
            std::shared_ptr<SharedLibrary> library;
            std::shared_ptr<void> obj;
        };
        auto holder = std::make_shared<Holder>(Holder{library, obj});
        return std::shared_ptr<void>(holder, obj.get());
    }
};

std::vector<fs::path> collect_libraries(const fs::path& base_dir, bool recursive) {
    std::vector<fs::path> found;
    std::error_code ec;
    if (!fs::exists(base_dir, ec) || !fs::is_directory(base_dir, ec)) return found;

    const std::string extension = SharedLibrary::platform_extension();
    auto consider = [&](const fs::directory_entry& entry) {
        if (entry.is_regular_file() && entry.path().extension() == extension) found.push_back(entry.path());
    };
    if (recursive) {
        for (const auto& entry : fs::recursive_directory_iterator(base_dir)) consider(entry);
    } else {
        for (const auto& entry : fs::directory_iterator(base_dir)) consider(entry);
    }
    // directory_iterator order is filesystem-defined; sort for a stable registry order
    std::sort(found.begin(), found.end());
    return found;
}

} // namespace

PluginLoadResult load_plugin_file(const fs::path& path, ProviderRegistry& registry) {
    PluginLoadResult result;
    const std::string abs_path = fs::absolute(path).string();
    ++result.attempted;

    std::shared_ptr<SharedLibrary> library;
    RegisterFunc register_func = nullptr;
    try {
        library = SharedLibrary::open(path);
        register_func = library->function<RegisterFunc>(THUMBKIT_REGISTER_SYMBOL);
    } catch (const ThumbError& e) {
        result.errors.push_back({abs_path, e.code(), e.what()});
        return result;
    }

    // Plugins register into a staging area first so a plugin that throws halfway
    // leaves nothing behind in the live registry.
    ProviderRegistry staging;
    try {
        register_func(staging);
    } catch (const std::exception& e) {
        result.errors.push_back({abs_path, ThumbErrc::Unknown, e.what()});
        return result;
    } catch (...) {
        result.errors.push_back({abs_path, ThumbErrc::Unknown, "non-standard exception during registration"});
        return result;
    }

    for (auto& entry : staging.snapshot_all()) {
        ProviderEntryInfo info = entry.info;
        info.source = abs_path;
        result.new_provider_keys.push_back(make_key(info.capability, info.name));
        registry.register_erased(std::move(info), LibraryBoundFactory{library, std::move(entry.factory)});
    }
    ++result.loaded;
    return result;
}

PluginLoadResult load_plugins(const std::vector<std::string>& plugin_dir_paths,
                              ProviderRegistry& registry) {
    PluginLoadResult result;

    for (const auto& raw_path : plugin_dir_paths) {
        if (raw_path.empty()) continue;
        // Interpret simple wildcard suffixes:
        //   path/**  => recursive
        //   path/*   => shallow (explicit)
        //   path     => shallow
        bool recursive = false;
        std::string path_str = raw_path;
        if (path_str.size() >= 3 && path_str.substr(path_str.size() - 3) == "/**") {
            recursive = true;
            path_str = path_str.substr(0, path_str.size() - 3);
        } else if (path_str.size() >= 2 && path_str.substr(path_str.size() - 2) == "/*") {
            recursive = false;
            path_str = path_str.substr(0, path_str.size() - 2);
        }
        try {
            for (const auto& lib_path : collect_libraries(path_str, recursive))
                result.merge(load_plugin_file(lib_path, registry));
        } catch (const fs::filesystem_error& e) {
            result.errors.push_back({path_str, ThumbErrc::Io, e.what()});
        }
    }
    return result;
}

} // namespace tk
