#include "kernel/shared_library.hpp"

#ifdef _WIN32
  #include <windows.h>
#else
  #include <dlfcn.h>
#endif

namespace tk {

const char* SharedLibrary::platform_extension() {
#if defined(_WIN32)
    return ".dll";
#elif defined(__APPLE__)
    return ".dylib";
#else
    return ".so";
#endif
}

std::shared_ptr<SharedLibrary> SharedLibrary::open(const fs::path& path) {
#ifdef _WIN32
    HMODULE handle = LoadLibraryW(path.wstring().c_str());
    if (!handle) {
        throw ThumbError(ThumbErrc::Io, "LoadLibrary failed for '" + path.string() +
                                            "'. Code: " + std::to_string(GetLastError()));
    }
    return std::shared_ptr<SharedLibrary>(new SharedLibrary(path, reinterpret_cast<void*>(handle)));
#else
    void* handle = dlopen(path.c_str(), RTLD_LAZY);
    if (!handle) {
        const char* e = dlerror();
        throw ThumbError(ThumbErrc::Io, e ? e : ("dlopen failed for '" + path.string() + "'"));
    }
    return std::shared_ptr<SharedLibrary>(new SharedLibrary(path, handle));
#endif
}

SharedLibrary::~SharedLibrary() {
    if (!handle_) return;
#ifdef _WIN32
    FreeLibrary(reinterpret_cast<HMODULE>(handle_));
#else
    dlclose(handle_);
#endif
}

void* SharedLibrary::raw_symbol(const std::string& name) const {
#ifdef _WIN32
    FARPROC sym = GetProcAddress(reinterpret_cast<HMODULE>(handle_), name.c_str());
    if (!sym) {
        throw ThumbError(ThumbErrc::MissingSymbol,
                         "Cannot find '" + name + "' export in " + path_.filename().string());
    }
    return reinterpret_cast<void*>(sym);
#else
    dlerror();  // clear stale state
    void* sym = dlsym(handle_, name.c_str());
    const char* dlsym_error = dlerror();
    if (dlsym_error || !sym) {
        throw ThumbError(ThumbErrc::MissingSymbol,
                         "Cannot find '" + name + "' export in " + path_.filename().string() +
                             (dlsym_error ? std::string(": ") + dlsym_error : std::string()));
    }
    return sym;
#endif
}

} // namespace tk
