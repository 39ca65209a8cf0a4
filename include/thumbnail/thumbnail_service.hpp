// Thumbkit: facade between front ends and the provider kernel
#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "kernel/dispatcher.hpp"
#include "kernel/plugin_manager.hpp"
#include "thumb_config.hpp"
#include "thumbnail/thumbnail_renderer.hpp"

namespace tk {

struct RenderOutcome {
    enum class Status { Rendered, Unsupported, Failed };

    fs::path input;
    Status status = Status::Unsupported;
    std::optional<fs::path> output;
    std::string renderer;
    ThumbErrc code = ThumbErrc::Unsupported;  // meaningful when status != Rendered
    std::string message;
    DiscoveryReport discovery;
};

THUMBKIT_API const char* status_name(RenderOutcome::Status status) noexcept;

// Writes an 8-bit thumbnail with cv::imwrite. Throws ThumbError(Io) on failure.
THUMBKIT_API void write_thumbnail(const Thumbnail& thumbnail, const fs::path& path, const ThumbConfig& config);

class THUMBKIT_API ThumbnailService {
public:
    explicit ThumbnailService(ProviderRegistry& registry = ProviderRegistry::instance())
        : registry_(registry), plugins_(registry) {}

    void set_config(const ThumbConfig& config) { config_ = config; }
    const ThumbConfig& config() const { return config_; }

    // Registers the built-in renderers unless they are already present.
    void seed_builtin_renderers();
    // Loads config.plugin_dirs and config.provider_manifests.
    PluginLoadResult load_configured_plugins();

    // Discovery + dispatch. std::nullopt when no renderer accepts the request;
    // renderer errors propagate.
    std::optional<Thumbnail> render(const RenderRequest& request, DiscoveryReport* report = nullptr) const;

    // Renders one file into output_dir as <stem>.thumb.<format>. Never throws
    // for per-file problems; they are reported in the outcome.
    RenderOutcome render_file(const fs::path& input, const fs::path& output_dir) const;

    // Renderer entries in discovery order.
    std::vector<ProviderEntryInfo> list_renderers() const;
    // Realizes each renderer to read its description; failures yield the error text.
    std::vector<std::pair<ProviderEntryInfo, std::string>> describe_renderers() const;

    PluginManager& plugins() { return plugins_; }
    ProviderRegistry& registry() { return registry_; }

private:
    ProviderRegistry& registry_;
    PluginManager plugins_;
    ThumbConfig config_;
};

} // namespace tk
