// Thumbkit: the thumbnail renderer capability
#pragma once

#include <string>

#include <opencv2/core.hpp>

#include "image_buffer.hpp"
#include "tk_types.hpp"

namespace tk {

struct RenderRequest {
    fs::path path;
    std::string extension;  // lowercase, with leading dot (".png"); empty if none
    int max_width = 128;
    int max_height = 128;

    static RenderRequest for_file(const fs::path& path, int max_width, int max_height);
};

struct Thumbnail {
    ImageBuffer image;
    int source_width = 0;
    int source_height = 0;
    std::string renderer;
};

// Providers of this capability turn one input file into a thumbnail.
// accepts() must be cheap and side-effect free; it is called on every
// candidate until one says yes.
class THUMBKIT_API ThumbnailRenderer {
public:
    virtual ~ThumbnailRenderer() = default;

    static const char* capability_name() { return "thumbnail_renderer"; }

    virtual std::string description() const = 0;
    virtual bool accepts(const RenderRequest& request) const = 0;
    // Throws ProviderProcessingError when the input cannot be rendered.
    virtual Thumbnail process(const RenderRequest& request) = 0;
};

// Largest size with the source aspect ratio that fits in max_width x max_height.
// Never upscales; each side is at least 1.
THUMBKIT_API cv::Size fit_within(cv::Size source, int max_width, int max_height);

// Downscales `image` to fit the request (cv::INTER_AREA). Returns `image` as-is
// when it already fits.
THUMBKIT_API cv::Mat scale_to_fit(const cv::Mat& image, const RenderRequest& request);

// Packs a rendered Mat into a Thumbnail.
THUMBKIT_API Thumbnail make_thumbnail(const cv::Mat& scaled, cv::Size source, const std::string& renderer);

} // namespace tk
