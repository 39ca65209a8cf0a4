#pragma once

#include "image_buffer.hpp"
#include "tk_types.hpp"
#include <opencv2/core.hpp>

namespace tk {

/**
 * @brief Returns a zero-copy cv::Mat view over an ImageBuffer.
 * @note The view does not own the pixels; keep the buffer alive while using it.
 * @throws ThumbError when the buffer holds no data.
 */
THUMBKIT_API cv::Mat toCvMat(const ImageBuffer& buffer);

/**
 * @brief Wraps a cv::Mat as an ImageBuffer.
 * @note Zero-copy. The returned buffer shares the Mat's reference count
 *       through its shared_ptr deleter, so the pixels stay valid for as long
 *       as the buffer (or any copy of it) exists.
 */
THUMBKIT_API ImageBuffer fromCvMat(const cv::Mat& mat);

} // namespace tk
