// Thumbkit kernel: RAII wrapper around a dynamically loaded library
#pragma once

#include <memory>
#include <string>
#include <utility>

#include "tk_types.hpp"

namespace tk {

class THUMBKIT_API SharedLibrary {
public:
    // Throws ThumbError(Io) when the library cannot be opened.
    static std::shared_ptr<SharedLibrary> open(const fs::path& path);

    ~SharedLibrary();
    SharedLibrary(const SharedLibrary&) = delete;
    SharedLibrary& operator=(const SharedLibrary&) = delete;

    // Throws ThumbError(MissingSymbol) when the export is absent.
    void* raw_symbol(const std::string& name) const;

    template <typename Fn>
    Fn function(const std::string& name) const {
        return reinterpret_cast<Fn>(raw_symbol(name));
    }

    // ".so", ".dylib" or ".dll"
    static const char* platform_extension();

private:
    SharedLibrary(fs::path path, void* handle) : path_(std::move(path)), handle_(handle) {}

    fs::path path_;
    void* handle_ = nullptr;
};

} // namespace tk
