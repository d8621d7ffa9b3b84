#include <votergrid/vision/color_convert_stage.hpp>
#include "frame_cv_utils.hpp"
#include <votergrid/core/error.hpp>
#include <votergrid/core/frame.hpp>
#include <opencv2/imgproc.hpp>
#include <vector>

namespace votergrid::vision {

namespace {

int conversion_code(votergrid::core::PixelFormat from, votergrid::core::PixelFormat to) {
  using votergrid::core::PixelFormat;
  switch (to) {
    case PixelFormat::Grayscale8:
      if (from == PixelFormat::BGR8) return cv::COLOR_BGR2GRAY;
      if (from == PixelFormat::RGB8) return cv::COLOR_RGB2GRAY;
      if (from == PixelFormat::BGRA8) return cv::COLOR_BGRA2GRAY;
      if (from == PixelFormat::RGBA8) return cv::COLOR_RGBA2GRAY;
      break;
    case PixelFormat::BGR8:
      if (from == PixelFormat::Grayscale8) return cv::COLOR_GRAY2BGR;
      if (from == PixelFormat::RGB8) return cv::COLOR_RGB2BGR;
      if (from == PixelFormat::BGRA8) return cv::COLOR_BGRA2BGR;
      if (from == PixelFormat::RGBA8) return cv::COLOR_RGBA2BGR;
      break;
    case PixelFormat::RGB8:
      if (from == PixelFormat::Grayscale8) return cv::COLOR_GRAY2RGB;
      if (from == PixelFormat::BGR8) return cv::COLOR_BGR2RGB;
      if (from == PixelFormat::BGRA8) return cv::COLOR_BGRA2RGB;
      if (from == PixelFormat::RGBA8) return cv::COLOR_RGBA2RGB;
      break;
    case PixelFormat::BGRA8:
      if (from == PixelFormat::RGBA8) return cv::COLOR_RGBA2BGRA;
      if (from == PixelFormat::BGR8) return cv::COLOR_BGR2BGRA;
      break;
    case PixelFormat::RGBA8:
      if (from == PixelFormat::BGRA8) return cv::COLOR_BGRA2RGBA;
      if (from == PixelFormat::RGB8) return cv::COLOR_RGB2RGBA;
      break;
    default:
      break;
  }
  return -1;
}

}  // namespace

ColorConvertStage::ColorConvertStage(
    votergrid::core::PixelFormat output_format)
    : output_format_(output_format) {}

std::expected<votergrid::core::StageOutput, votergrid::core::PipelineError>
ColorConvertStage::process(const votergrid::core::Frame& input) {
  if (input.empty()) {
    return std::unexpected(votergrid::core::PipelineError::InvalidFrame);
  }

  using namespace votergrid::core;

  auto mat_in = detail::frame_to_mat(input);
  if (!mat_in) {
    return std::unexpected(PipelineError::InvalidFrame);
  }

  if (input.format() == output_format_) {
    std::vector<std::byte> buf(input.data().begin(), input.data().end());
    return StageOutput{
        Frame(input.width(), input.height(), output_format_, std::move(buf))};
  }

  const int code = conversion_code(input.format(), output_format_);
  if (code < 0) {
    return std::unexpected(PipelineError::InvalidFrame);
  }

  cv::Mat mat_out;
  cv::cvtColor(*mat_in, mat_out, code);
  return StageOutput{detail::mat_to_frame(mat_out, output_format_)};
}

}  // namespace votergrid::vision
