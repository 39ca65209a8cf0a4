#pragma once
#include <cstddef>
#include <filesystem>
#include <stdexcept>
#include <string>

namespace tk {
namespace fs = std::filesystem;

#if defined(_WIN32)
    #if defined(THUMBKIT_LIB_BUILD)
        #define THUMBKIT_API __declspec(dllexport)
    #else
        #define THUMBKIT_API __declspec(dllimport)
    #endif
#else // Non-Windows platforms
    #if defined(THUMBKIT_LIB_BUILD)
        #define THUMBKIT_API __attribute__((visibility("default")))
    #else
        #define THUMBKIT_API
    #endif
#endif

enum class ThumbErrc {
    Unknown = 1, NotFound, Io, InvalidYaml, MissingSymbol,
    InvalidParameter, ProviderConfiguration, ProcessingFailed, Unsupported,
};

// Stable lowercase name used in reports ("processing_failed", ...).
THUMBKIT_API const char* errc_name(ThumbErrc code) noexcept;

struct THUMBKIT_API ThumbError : public std::runtime_error {
    ThumbError(ThumbErrc code, const std::string& what)
        : std::runtime_error(what), code_(code) {}
    ThumbErrc code() const noexcept { return code_; }
private:
    ThumbErrc code_;
};

struct ProviderEntryInfo {
    std::string capability;
    std::string name;
    std::string source;  // "built-in", absolute plugin path or manifest path
};

// A provider entry could not be realized. Discovery skips the entry and moves on.
class THUMBKIT_API ProviderConfigurationError : public ThumbError {
public:
    ProviderConfigurationError(std::size_t index, ProviderEntryInfo info, const std::string& cause);

    std::size_t index() const noexcept { return index_; }
    const ProviderEntryInfo& info() const noexcept { return info_; }
    const std::string& cause() const noexcept { return cause_; }

private:
    std::size_t index_;
    ProviderEntryInfo info_;
    std::string cause_;
};

// Raised by a selected provider while processing its input.
struct THUMBKIT_API ProviderProcessingError : public ThumbError {
    explicit ProviderProcessingError(const std::string& what)
        : ThumbError(ThumbErrc::ProcessingFailed, what) {}
    ProviderProcessingError(ThumbErrc code, const std::string& what)
        : ThumbError(code, what) {}
};

inline std::string make_key(const std::string& capability, const std::string& name) {
    return capability + ":" + name;
}

} // namespace tk
