#include "thumbnail/builtin_renderers.hpp"

#include <algorithm>

#include <opencv2/imgcodecs.hpp>
#include <opencv2/videoio.hpp>

namespace tk {

static bool has_extension(const std::vector<std::string>& list, const std::string& ext) {
    return std::find(list.begin(), list.end(), ext) != list.end();
}

// 16-bit and float images become 8-bit so every output format can store them.
static cv::Mat to_8bit(const cv::Mat& img) {
    if (img.depth() == CV_8U) return img;
    cv::Mat out;
    double scale = (img.depth() == CV_16U) ? 255.0 / 65535.0
                 : (img.depth() == CV_32F || img.depth() == CV_64F) ? 255.0 : 1.0;
    img.convertTo(out, CV_8U, scale);
    return out;
}

// --- RasterImageRenderer ---

const std::vector<std::string>& RasterImageRenderer::extensions() {
    static const std::vector<std::string> exts = {
        ".png", ".jpg", ".jpeg", ".bmp", ".tif", ".tiff", ".webp", ".pbm", ".pgm", ".ppm", ".pnm",
    };
    return exts;
}

std::string RasterImageRenderer::description() const {
    return "Still images decoded with OpenCV (png, jpeg, bmp, tiff, webp, netpbm)";
}

bool RasterImageRenderer::accepts(const RenderRequest& request) const {
    return has_extension(extensions(), request.extension);
}

Thumbnail RasterImageRenderer::process(const RenderRequest& request) {
    cv::Mat img = cv::imread(request.path.string(), cv::IMREAD_UNCHANGED);
    if (img.empty()) throw ProviderProcessingError("Failed to read image: " + request.path.string());
    cv::Mat scaled = scale_to_fit(to_8bit(img), request);
    return make_thumbnail(scaled, img.size(), "raster");
}

// --- VideoFrameRenderer ---

const std::vector<std::string>& VideoFrameRenderer::extensions() {
    static const std::vector<std::string> exts = {".mp4", ".m4v", ".avi", ".mov", ".mkv", ".webm"};
    return exts;
}

std::string VideoFrameRenderer::description() const {
    return "Video clips: a frame 10% into the stream, via OpenCV VideoCapture";
}

bool VideoFrameRenderer::accepts(const RenderRequest& request) const {
    return has_extension(extensions(), request.extension);
}

Thumbnail VideoFrameRenderer::process(const RenderRequest& request) {
    cv::VideoCapture capture(request.path.string());
    if (!capture.isOpened()) throw ProviderProcessingError("Failed to open video: " + request.path.string());

    const double frame_count = capture.get(cv::CAP_PROP_FRAME_COUNT);
    if (frame_count > 10) capture.set(cv::CAP_PROP_POS_FRAMES, static_cast<int>(frame_count / 10));

    cv::Mat frame;
    if (!capture.read(frame) || frame.empty()) {
        // Some containers do not support seeking; retry from the start.
        capture.set(cv::CAP_PROP_POS_FRAMES, 0);
        if (!capture.read(frame) || frame.empty())
            throw ProviderProcessingError("Failed to decode a frame from: " + request.path.string());
    }
    cv::Mat scaled = scale_to_fit(to_8bit(frame), request);
    return make_thumbnail(scaled, frame.size(), "video_frame");
}

namespace renderers {

void register_builtin(ProviderRegistry& registry) {
    registry.register_type<ThumbnailRenderer, RasterImageRenderer>("raster");
    registry.register_type<ThumbnailRenderer, VideoFrameRenderer>("video_frame");
}

} // namespace renderers

} // namespace tk
