#include <votergrid/vision/image_io.hpp>
#include "frame_cv_utils.hpp"
#include <votergrid/core/frame.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

namespace votergrid::vision {

namespace {

std::optional<votergrid::core::Frame> mat_to_loaded_frame(const cv::Mat& mat) {
  if (mat.empty()) return std::nullopt;

  votergrid::core::PixelFormat format = votergrid::core::PixelFormat::BGR8;
  if (mat.channels() == 1) format = votergrid::core::PixelFormat::Grayscale8;

  return detail::mat_to_frame(mat, format);
}

}  // namespace

std::optional<votergrid::core::Frame> load_frame_from_image(const std::string& path) {
  return mat_to_loaded_frame(cv::imread(path, cv::IMREAD_COLOR));
}

std::optional<votergrid::core::Frame> decode_frame(std::span<const std::uint8_t> bytes) {
  if (bytes.empty()) return std::nullopt;
  const cv::Mat raw(1, static_cast<int>(bytes.size()), CV_8UC1,
                    const_cast<std::uint8_t*>(bytes.data()));
  return mat_to_loaded_frame(cv::imdecode(raw, cv::IMREAD_COLOR));
}

std::optional<std::vector<std::uint8_t>> encode_png(const votergrid::core::Frame& frame) {
  auto mat = detail::frame_to_mat(frame);
  if (!mat) return std::nullopt;

  // imencode expects BGR channel order.
  cv::Mat bgr;
  switch (frame.format()) {
    case votergrid::core::PixelFormat::RGB8:
      cv::cvtColor(*mat, bgr, cv::COLOR_RGB2BGR);
      break;
    case votergrid::core::PixelFormat::RGBA8:
      cv::cvtColor(*mat, bgr, cv::COLOR_RGBA2BGRA);
      break;
    default:
      bgr = *mat;
      break;
  }

  std::vector<std::uint8_t> out;
  if (!cv::imencode(".png", bgr, out) || out.empty()) return std::nullopt;
  return out;
}

}  // namespace votergrid::vision
