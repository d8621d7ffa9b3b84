#pragma once

#include <votergrid/core/frame.hpp>
#include <opencv2/core/mat.hpp>
#include <optional>

namespace votergrid::vision::detail {

/// Convert Frame to cv::Mat (non-owning view). Returns nullopt if format unsupported
/// or the buffer is smaller than the declared dimensions.
std::optional<cv::Mat> frame_to_mat(const votergrid::core::Frame& frame);

/// Convert cv::Mat to Frame (copy; non-continuous ROIs are packed).
votergrid::core::Frame mat_to_frame(const cv::Mat& mat,
                                    votergrid::core::PixelFormat format);

/// PIL-style contrast: blend with the mean gray level. factor 1 is identity.
cv::Mat adjust_contrast(const cv::Mat& gray_or_color, double factor);

/// PIL-style sharpness: blend with a 3x3 smoothed copy. factor 1 is identity.
cv::Mat adjust_sharpness(const cv::Mat& gray_or_color, double factor);

}  // namespace votergrid::vision::detail
