#include "adapter/buffer_adapter_opencv.hpp"

namespace tk {

static int toCvType(DataType type, int channels) {
    switch (type) {
        case DataType::UINT8:   return CV_8UC(channels);
        case DataType::INT8:    return CV_8SC(channels);
        case DataType::UINT16:  return CV_16UC(channels);
        case DataType::INT16:   return CV_16SC(channels);
        case DataType::FLOAT32: return CV_32FC(channels);
        case DataType::FLOAT64: return CV_64FC(channels);
    }
    throw ThumbError(ThumbErrc::InvalidParameter, "Unsupported data type for OpenCV conversion");
}

static DataType fromCvType(int cv_type) {
    switch (CV_MAT_DEPTH(cv_type)) {
        case CV_8U:  return DataType::UINT8;
        case CV_8S:  return DataType::INT8;
        case CV_16U: return DataType::UINT16;
        case CV_16S: return DataType::INT16;
        case CV_32F: return DataType::FLOAT32;
        case CV_64F: return DataType::FLOAT64;
        default: throw ThumbError(ThumbErrc::InvalidParameter, "Unsupported cv::Mat depth for ImageBuffer conversion");
    }
}

cv::Mat toCvMat(const ImageBuffer& buffer) {
    if (buffer.empty()) throw ThumbError(ThumbErrc::InvalidParameter, "toCvMat: Buffer has no data.");
    int type = toCvType(buffer.type, buffer.channels);
    return cv::Mat(buffer.height, buffer.width, type, buffer.data.get(), buffer.step);
}

ImageBuffer fromCvMat(const cv::Mat& mat) {
    ImageBuffer buffer;
    if (mat.empty()) return buffer;
    buffer.width = mat.cols;
    buffer.height = mat.rows;
    buffer.channels = mat.channels();
    buffer.type = fromCvType(mat.type());
    buffer.step = mat.step;

    // The deleter captures a copy of the Mat header: as long as buffer.data is
    // alive the Mat's reference count cannot drop to zero.
    buffer.data = std::shared_ptr<void>(mat.data, [mat_ref = mat](void*) {});
    return buffer;
}

} // namespace tk
