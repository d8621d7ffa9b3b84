#include "frame_cv_utils.hpp"
#include <votergrid/core/frame.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <cstddef>
#include <cstring>
#include <vector>

namespace votergrid::vision::detail {

namespace vc = votergrid::core;

std::optional<cv::Mat> frame_to_mat(const vc::Frame& frame) {
  if (frame.empty()) return std::nullopt;
  if (frame.size_bytes() < vc::Frame::min_bytes(frame.width(), frame.height(), frame.format())) {
    return std::nullopt;
  }

  const int w = static_cast<int>(frame.width());
  const int h = static_cast<int>(frame.height());
  const std::size_t step = frame.row_bytes();
  void* data = const_cast<std::byte*>(frame.data().data());

  switch (frame.format()) {
    case vc::PixelFormat::Grayscale8:
      return cv::Mat(h, w, CV_8UC1, data, step);
    case vc::PixelFormat::RGB8:
    case vc::PixelFormat::BGR8:
      return cv::Mat(h, w, CV_8UC3, data, step);
    case vc::PixelFormat::RGBA8:
    case vc::PixelFormat::BGRA8:
      return cv::Mat(h, w, CV_8UC4, data, step);
    case vc::PixelFormat::Unknown:
    default:
      return std::nullopt;
  }
}

vc::Frame mat_to_frame(const cv::Mat& mat, vc::PixelFormat format) {
  if (mat.empty()) return vc::Frame();

  const cv::Mat packed = mat.isContinuous() ? mat : mat.clone();
  const std::uint32_t w = static_cast<std::uint32_t>(packed.cols);
  const std::uint32_t h = static_cast<std::uint32_t>(packed.rows);
  const std::size_t len = packed.total() * packed.elemSize();
  std::vector<std::byte> buffer(len);
  std::memcpy(buffer.data(), packed.ptr(), len);
  return vc::Frame(w, h, format, std::move(buffer));
}

cv::Mat adjust_contrast(const cv::Mat& image, double factor) {
  cv::Mat gray;
  if (image.channels() == 1) {
    gray = image;
  } else {
    cv::cvtColor(image, gray, image.channels() == 4 ? cv::COLOR_BGRA2GRAY : cv::COLOR_BGR2GRAY);
  }
  const double mean = cv::mean(gray)[0];
  cv::Mat out;
  // out = factor * in + (1 - factor) * mean, saturated to 8 bits
  image.convertTo(out, -1, factor, (1.0 - factor) * mean);
  return out;
}

cv::Mat adjust_sharpness(const cv::Mat& image, double factor) {
  // Same smoothing kernel PIL uses for ImageEnhance.Sharpness.
  const cv::Mat kernel = (cv::Mat_<float>(3, 3) << 1, 1, 1, 1, 5, 1, 1, 1, 1) / 13.f;
  cv::Mat smooth;
  cv::filter2D(image, smooth, -1, kernel, cv::Point(-1, -1), 0, cv::BORDER_REPLICATE);
  cv::Mat out;
  cv::addWeighted(image, factor, smooth, 1.0 - factor, 0.0, out);
  return out;
}

}  // namespace votergrid::vision::detail
