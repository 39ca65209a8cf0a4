// Kernel plugin loader result and error reporting structures
#pragma once

#include <string>
#include <vector>

#include "tk_types.hpp"

namespace tk {

struct PluginLoadError {
  std::string path;  // attempted plugin or manifest path
  ThumbErrc code = ThumbErrc::Unknown;
  std::string message;  // optional descriptive message
};

struct PluginLoadResult {
  int attempted = 0;
  int loaded = 0;
  std::vector<PluginLoadError> errors;
  std::vector<std::string> new_provider_keys;  // capability:name, registration order

  void merge(const PluginLoadResult& other) {
    attempted += other.attempted;
    loaded += other.loaded;
    errors.insert(errors.end(), other.errors.begin(), other.errors.end());
    new_provider_keys.insert(new_provider_keys.end(), other.new_provider_keys.begin(),
                             other.new_provider_keys.end());
  }
};

}  // namespace tk
