#include "thumbnail/thumbnail_service.hpp"

#include <opencv2/imgcodecs.hpp>

#include "adapter/buffer_adapter_opencv.hpp"
#include "thumbnail/builtin_renderers.hpp"

namespace tk {

const char* status_name(RenderOutcome::Status status) noexcept {
    switch (status) {
        case RenderOutcome::Status::Rendered:    return "rendered";
        case RenderOutcome::Status::Unsupported: return "unsupported";
        case RenderOutcome::Status::Failed:      return "failed";
    }
    return "unknown";
}

void write_thumbnail(const Thumbnail& thumbnail, const fs::path& path, const ThumbConfig& config) {
    if (thumbnail.image.empty()) throw ThumbError(ThumbErrc::InvalidParameter, "Cannot save an empty thumbnail.");
    cv::Mat mat = toCvMat(thumbnail.image);

    std::vector<int> params;
    const std::string ext = path.extension().string();
    if (ext == ".jpg" || ext == ".jpeg") params = {cv::IMWRITE_JPEG_QUALITY, config.jpeg_quality};

    std::error_code ec;
    if (path.has_parent_path()) fs::create_directories(path.parent_path(), ec);
    if (ec) throw ThumbError(ThumbErrc::Io, "Cannot create '" + path.parent_path().string() + "': " + ec.message());

    bool ok = false;
    try {
        ok = cv::imwrite(path.string(), mat, params);
    } catch (const cv::Exception& e) {
        throw ThumbError(ThumbErrc::Io, "Failed to write '" + path.string() + "': " + e.what());
    }
    if (!ok) throw ThumbError(ThumbErrc::Io, "Failed to write '" + path.string() + "'.");
}

void ThumbnailService::seed_builtin_renderers() {
    // "raster" is always registered first; its presence means the set is seeded.
    for (const auto& info : registry_.list(ThumbnailRenderer::capability_name()))
        if (info.name == "raster" && info.source == kBuiltinSource) return;
    renderers::register_builtin(registry_);
}

PluginLoadResult ThumbnailService::load_configured_plugins() {
    PluginLoadResult result = plugins_.load_from_dirs_report(config_.plugin_dirs);
    for (const auto& manifest : config_.provider_manifests)
        result.merge(plugins_.load_manifest<ThumbnailRenderer>(manifest));
    return result;
}

std::optional<Thumbnail> ThumbnailService::render(const RenderRequest& request, DiscoveryReport* report) const {
    DiscoveryReport local;
    DiscoveryReport& rep = report ? *report : local;
    Dispatcher<ThumbnailRenderer> dispatcher(registry_);
    auto thumbnail = dispatcher.handle(request, &rep, config_.parallel_probe);
    if (thumbnail && thumbnail->renderer.empty()) thumbnail->renderer = rep.selected;
    return thumbnail;
}

RenderOutcome ThumbnailService::render_file(const fs::path& input, const fs::path& output_dir) const {
    RenderOutcome outcome;
    outcome.input = input;
    try {
        RenderRequest request = RenderRequest::for_file(input, config_.max_width, config_.max_height);
        std::optional<Thumbnail> thumbnail = render(request, &outcome.discovery);
        if (!thumbnail) {
            outcome.status = RenderOutcome::Status::Unsupported;
            outcome.code = ThumbErrc::Unsupported;
            outcome.message = "No renderer accepts '" + input.filename().string() + "'";
            return outcome;
        }
        outcome.renderer = outcome.discovery.selected;
        fs::path out = output_dir / (input.stem().string() + ".thumb." + config_.output_format);
        write_thumbnail(*thumbnail, out, config_);
        outcome.output = out;
        outcome.status = RenderOutcome::Status::Rendered;
    } catch (const ThumbError& e) {
        outcome.renderer = outcome.discovery.selected;
        outcome.status = RenderOutcome::Status::Failed;
        outcome.code = e.code();
        outcome.message = e.what();
    } catch (const cv::Exception& e) {
        outcome.renderer = outcome.discovery.selected;
        outcome.status = RenderOutcome::Status::Failed;
        outcome.code = ThumbErrc::ProcessingFailed;
        outcome.message = e.what();
    } catch (const std::exception& e) {
        // plugin renderers are not required to throw ThumbError
        outcome.renderer = outcome.discovery.selected;
        outcome.status = RenderOutcome::Status::Failed;
        outcome.code = ThumbErrc::Unknown;
        outcome.message = e.what();
    } catch (...) {
        outcome.renderer = outcome.discovery.selected;
        outcome.status = RenderOutcome::Status::Failed;
        outcome.code = ThumbErrc::Unknown;
        outcome.message = "non-standard exception while rendering";
    }
    return outcome;
}

std::vector<ProviderEntryInfo> ThumbnailService::list_renderers() const {
    return registry_.list(ThumbnailRenderer::capability_name());
}

std::vector<std::pair<ProviderEntryInfo, std::string>> ThumbnailService::describe_renderers() const {
    std::vector<std::pair<ProviderEntryInfo, std::string>> out;
    auto sequence = registry_.load<ThumbnailRenderer>();
    while (sequence.has_next()) {
        ProviderEntryInfo info = sequence.peek_info();
        try {
            auto renderer = sequence.next();
            out.emplace_back(std::move(info), renderer->description());
        } catch (const ProviderConfigurationError& e) {
            out.emplace_back(std::move(info), std::string("unavailable: ") + e.cause());
        }
    }
    return out;
}

} // namespace tk
