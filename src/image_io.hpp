#pragma once
#include "include/crtmix.hpp"
#include <opencv2/core.hpp>
#include <string>

namespace crtmix {

// Dimension above which loads log an advisory; large images still load
constexpr int kLargeImageDimension = 8192;

// Decode a file into an RGB buffer. Throws Error(InvalidImage).
PixelBuffer load_image(const std::string& path);

// Encode a buffer to path; the format follows the extension. When the
// writer rejects the image, retries once as PNG beside the requested path.
// Returns the path actually written; throws Error(EncodeFailure) if both fail.
std::string save_image(const std::string& path, const PixelBuffer& img);

// OpenCV bridge: BGR CV_8UC3 <-> RGB buffer
cv::Mat to_mat(const PixelBuffer& img);
PixelBuffer from_mat(const cv::Mat& bgr);

// Aspect-preserving Lanczos downscale so neither side exceeds max_dim.
// Buffers already within bounds are returned unchanged.
PixelBuffer downscale_to_fit(const PixelBuffer& img, int max_dim);

} // namespace crtmix
