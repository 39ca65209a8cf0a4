#include "tk_types.hpp"

#include <utility>

namespace tk {

const char* errc_name(ThumbErrc code) noexcept {
    switch (code) {
        case ThumbErrc::Unknown:               return "unknown";
        case ThumbErrc::NotFound:              return "not_found";
        case ThumbErrc::Io:                    return "io";
        case ThumbErrc::InvalidYaml:           return "invalid_yaml";
        case ThumbErrc::MissingSymbol:         return "missing_symbol";
        case ThumbErrc::InvalidParameter:      return "invalid_parameter";
        case ThumbErrc::ProviderConfiguration: return "provider_configuration";
        case ThumbErrc::ProcessingFailed:      return "processing_failed";
        case ThumbErrc::Unsupported:           return "unsupported";
    }
    return "unknown";
}

static std::string describe_failure(std::size_t index, const ProviderEntryInfo& info, const std::string& cause) {
    return "Provider '" + info.name + "' (entry #" + std::to_string(index) + " of capability '" +
           info.capability + "', source '" + info.source + "') failed to initialize: " + cause;
}

ProviderConfigurationError::ProviderConfigurationError(std::size_t index, ProviderEntryInfo info,
                                                       const std::string& cause)
    : ThumbError(ThumbErrc::ProviderConfiguration, describe_failure(index, info, cause)),
      index_(index), info_(std::move(info)), cause_(cause) {}

} // namespace tk
