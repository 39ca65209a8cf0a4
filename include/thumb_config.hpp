// Thumbkit configuration definition and YAML I/O declarations
#pragma once

#include <string>
#include <vector>

#include "tk_types.hpp"

namespace tk {

struct ThumbConfig {
    std::string loaded_config_path;
    std::vector<std::string> plugin_dirs = {"build/plugins"};
    std::vector<std::string> provider_manifests;
    int max_width = 128;
    int max_height = 128;
    std::string output_dir = "thumbnails";
    std::string output_format = "png";
    int jpeg_quality = 90;
    // Evaluate accepts() concurrently; selection is still first-match.
    bool parallel_probe = false;
    // Print providers that failed to initialize during discovery.
    bool report_skipped_providers = true;
};

// Persist the configuration to a YAML file at `path`.
// Returns true on success.
THUMBKIT_API bool write_config_to_file(const ThumbConfig& config, const std::string& path);

// Load an existing config from `config_path` if it exists.
// If `config_path` is the default "thumbkit.yaml" and does not exist, create it with defaults.
// Returns false when the file existed but could not be parsed (defaults are kept).
THUMBKIT_API bool load_or_create_config(const std::string& config_path, ThumbConfig& config,
                                        std::string* warning = nullptr);

// Parses a --size argument: "N" (square) or "WxH". Both sides must be positive
// integers and the whole text must be consumed.
THUMBKIT_API bool parse_thumbnail_size(const std::string& text, int& width, int& height);

} // namespace tk
