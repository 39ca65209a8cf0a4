// Thumbkit configuration YAML read/write implementation
#include "thumb_config.hpp"

#include <cctype>
#include <fstream>
#include <yaml-cpp/yaml.h>

namespace tk {

bool write_config_to_file(const ThumbConfig& config, const std::string& path) {
    YAML::Node root;
    root["_comment1"] = "Thumbkit configuration.";
    root["plugin_dirs"] = config.plugin_dirs;
    root["provider_manifests"] = config.provider_manifests;
    root["max_width"] = config.max_width;
    root["max_height"] = config.max_height;
    root["output_dir"] = config.output_dir;
    root["output_format"] = config.output_format;
    root["jpeg_quality"] = config.jpeg_quality;
    root["parallel_probe"] = config.parallel_probe;
    root["report_skipped_providers"] = config.report_skipped_providers;

    std::ofstream fout(path);
    if (!fout) return false;
    fout << root;
    return static_cast<bool>(fout);
}

static bool parse_positive_int(const std::string& text, int& value) {
    if (text.empty() || !std::isdigit(static_cast<unsigned char>(text[0]))) return false;
    std::size_t consumed = 0;
    try {
        value = std::stoi(text, &consumed);
    } catch (const std::exception&) {
        return false;
    }
    return consumed == text.size() && value > 0;
}

bool parse_thumbnail_size(const std::string& text, int& width, int& height) {
    int w = 0, h = 0;
    const std::size_t x = text.find_first_of("xX");
    if (x == std::string::npos) {
        if (!parse_positive_int(text, w)) return false;
        h = w;
    } else if (!parse_positive_int(text.substr(0, x), w) || !parse_positive_int(text.substr(x + 1), h)) {
        return false;
    }
    width = w;
    height = h;
    return true;
}

bool load_or_create_config(const std::string& config_path, ThumbConfig& config, std::string* warning) {
    if (fs::exists(config_path)) {
        // Parse into a copy so a half-read file leaves the defaults untouched.
        ThumbConfig parsed = config;
        parsed.loaded_config_path = fs::absolute(config_path).string();
        try {
            YAML::Node root = YAML::LoadFile(config_path);
            if (root["plugin_dirs"] && root["plugin_dirs"].IsSequence()) {
                parsed.plugin_dirs = root["plugin_dirs"].as<std::vector<std::string>>();
            } else if (root["plugin_dir"] && root["plugin_dir"].IsScalar()) {
                parsed.plugin_dirs.clear();
                parsed.plugin_dirs.push_back(root["plugin_dir"].as<std::string>());
            }
            if (root["provider_manifests"] && root["provider_manifests"].IsSequence())
                parsed.provider_manifests = root["provider_manifests"].as<std::vector<std::string>>();

            if (root["max_width"]) parsed.max_width = root["max_width"].as<int>();
            if (root["max_height"]) parsed.max_height = root["max_height"].as<int>();
            if (root["output_dir"]) parsed.output_dir = root["output_dir"].as<std::string>();
            if (root["output_format"]) parsed.output_format = root["output_format"].as<std::string>();
            if (root["jpeg_quality"]) parsed.jpeg_quality = root["jpeg_quality"].as<int>();
            if (root["parallel_probe"]) parsed.parallel_probe = root["parallel_probe"].as<bool>();
            if (root["report_skipped_providers"]) parsed.report_skipped_providers = root["report_skipped_providers"].as<bool>();

            if (parsed.max_width <= 0 || parsed.max_height <= 0)
                throw ThumbError(ThumbErrc::InvalidParameter, "max_width and max_height must be positive");
        } catch (const std::exception& e) {
            if (warning) *warning = "Could not parse config file '" + config_path +
                                    "'. Using default settings. Error: " + e.what();
            return false;
        }
        config = parsed;
    } else if (config_path == "thumbkit.yaml") {
        if (write_config_to_file(config, "thumbkit.yaml")) {
            config.loaded_config_path = fs::absolute("thumbkit.yaml").string();
        }
    }
    return true;
}

} // namespace tk
