#pragma once

#include <cstddef>
#include <memory>

namespace tk {

// Pixel element type, kept independent of any imaging library.
enum class DataType {
    UINT8, INT8, UINT16, INT16, FLOAT32, FLOAT64
};

// Library-agnostic image descriptor. Renderers hand thumbnails back in this
// form so plugins and the core do not have to agree on an OpenCV ABI.
struct ImageBuffer {
    int width = 0;
    int height = 0;
    int channels = 0;
    DataType type = DataType::UINT8;
    std::size_t step = 0; // bytes per row (stride)

    // Shared ownership with a custom deleter, so memory from any source
    // (our own allocation or a cv::Mat) is released correctly.
    std::shared_ptr<void> data = nullptr;

    bool empty() const { return !data || width == 0 || height == 0; }
};

} // namespace tk
