#include "plugin_api.hpp"
#include "thumbnail/thumbnail_renderer.hpp"

#include <algorithm>
#include <fstream>
#include <string>
#include <vector>

#include <opencv2/imgproc.hpp>

namespace {

constexpr int kCanvasSize = 512;
constexpr int kMaxLines = 24;
constexpr size_t kMaxColumns = 48;

// Draws the head of a text file on a white page.
class TextPreviewRenderer : public tk::ThumbnailRenderer {
public:
    std::string description() const override {
        return "Plain text files: first lines drawn on a page (txt, md, log, csv)";
    }

    bool accepts(const tk::RenderRequest& request) const override {
        static const std::vector<std::string> exts = {".txt", ".md", ".log", ".csv"};
        return std::find(exts.begin(), exts.end(), request.extension) != exts.end();
    }

    tk::Thumbnail process(const tk::RenderRequest& request) override {
        std::ifstream in(request.path);
        if (!in) throw tk::ProviderProcessingError(tk::ThumbErrc::Io, "Failed to open text file: " + request.path.string());

        cv::Mat page(kCanvasSize, kCanvasSize, CV_8UC3, cv::Scalar(255, 255, 255));
        const double font_scale = 0.45;
        const int line_height = kCanvasSize / kMaxLines;
        std::string line;
        for (int row = 0; row < kMaxLines && std::getline(in, line); ++row) {
            if (line.size() > kMaxColumns) line.resize(kMaxColumns);
            std::replace(line.begin(), line.end(), '\t', ' ');
            cv::putText(page, line, cv::Point(8, (row + 1) * line_height - 4), cv::FONT_HERSHEY_SIMPLEX,
                        font_scale, cv::Scalar(32, 32, 32), 1, cv::LINE_AA);
        }
        cv::Mat scaled = tk::scale_to_fit(page, request);
        return tk::make_thumbnail(scaled, page.size(), "text_preview");
    }
};

} // namespace

extern "C" PLUGIN_API void register_thumbkit_providers(tk::ProviderRegistry& registry) {
    registry.register_type<tk::ThumbnailRenderer, TextPreviewRenderer>("text_preview");
}
