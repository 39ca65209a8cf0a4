#include "thumbnail/thumbnail_renderer.hpp"

#include <algorithm>
#include <cctype>

#include <opencv2/imgproc.hpp>

#include "adapter/buffer_adapter_opencv.hpp"

namespace tk {

RenderRequest RenderRequest::for_file(const fs::path& path, int max_width, int max_height) {
    if (max_width <= 0 || max_height <= 0)
        throw ThumbError(ThumbErrc::InvalidParameter, "Thumbnail size must be positive.");
    RenderRequest request;
    request.path = path;
    request.extension = path.extension().string();
    std::transform(request.extension.begin(), request.extension.end(), request.extension.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    request.max_width = max_width;
    request.max_height = max_height;
    return request;
}

cv::Size fit_within(cv::Size source, int max_width, int max_height) {
    if (source.width <= 0 || source.height <= 0) return {0, 0};
    if (source.width <= max_width && source.height <= max_height) return source;
    const double scale = std::min(static_cast<double>(max_width) / source.width,
                                  static_cast<double>(max_height) / source.height);
    int w = std::max(1, static_cast<int>(source.width * scale + 0.5));
    int h = std::max(1, static_cast<int>(source.height * scale + 0.5));
    return {std::min(w, max_width), std::min(h, max_height)};
}

cv::Mat scale_to_fit(const cv::Mat& image, const RenderRequest& request) {
    if (image.empty()) throw ProviderProcessingError("Cannot scale an empty image.");
    cv::Size target = fit_within(image.size(), request.max_width, request.max_height);
    if (target == image.size()) return image;
    cv::Mat out;
    cv::resize(image, out, target, 0, 0, cv::INTER_AREA);
    return out;
}

Thumbnail make_thumbnail(const cv::Mat& scaled, cv::Size source, const std::string& renderer) {
    Thumbnail t;
    t.image = fromCvMat(scaled);
    t.source_width = source.width;
    t.source_height = source.height;
    t.renderer = renderer;
    return t;
}

} // namespace tk
