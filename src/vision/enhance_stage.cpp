#include <votergrid/vision/enhance_stage.hpp>
#include "frame_cv_utils.hpp"
#include <votergrid/core/error.hpp>
#include <votergrid/core/frame.hpp>
#include <opencv2/core.hpp>

namespace votergrid::vision {

EnhanceStage::EnhanceStage(float contrast, float sharpness)
    : contrast_(contrast), sharpness_(sharpness) {}

std::expected<votergrid::core::StageOutput, votergrid::core::PipelineError>
EnhanceStage::process(const votergrid::core::Frame& input) {
  auto out = enhance_frame(input, contrast_, sharpness_);
  if (!out) {
    return std::unexpected(out.error());
  }
  return votergrid::core::StageOutput{std::move(*out)};
}

std::expected<votergrid::core::Frame, votergrid::core::PipelineError>
enhance_frame(const votergrid::core::Frame& input, float contrast, float sharpness) {
  if (input.empty()) {
    return std::unexpected(votergrid::core::PipelineError::InvalidFrame);
  }
  auto mat_in = detail::frame_to_mat(input);
  if (!mat_in) {
    return std::unexpected(votergrid::core::PipelineError::InvalidFrame);
  }

  cv::Mat mat = *mat_in;
  if (contrast != 1.f) mat = detail::adjust_contrast(mat, contrast);
  if (sharpness != 1.f) mat = detail::adjust_sharpness(mat, sharpness);
  return detail::mat_to_frame(mat, input.format());
}

}  // namespace votergrid::vision
