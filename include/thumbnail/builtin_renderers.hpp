// Thumbkit: renderers compiled into the core library
#pragma once

#include <string>
#include <vector>

#include "kernel/provider_registry.hpp"
#include "thumbnail/thumbnail_renderer.hpp"

namespace tk {

// Still images through cv::imread. 16-bit input is reduced to 8-bit.
class THUMBKIT_API RasterImageRenderer : public ThumbnailRenderer {
public:
    std::string description() const override;
    bool accepts(const RenderRequest& request) const override;
    Thumbnail process(const RenderRequest& request) override;

    static const std::vector<std::string>& extensions();
};

// First representative frame of a video clip (10% into the stream).
class THUMBKIT_API VideoFrameRenderer : public ThumbnailRenderer {
public:
    std::string description() const override;
    bool accepts(const RenderRequest& request) const override;
    Thumbnail process(const RenderRequest& request) override;

    static const std::vector<std::string>& extensions();
};

namespace renderers {

// Registers "raster" then "video_frame" as built-in entries.
THUMBKIT_API void register_builtin(ProviderRegistry& registry);

} // namespace renderers

} // namespace tk
