#include <votergrid/vision/upscale_stage.hpp>
#include "frame_cv_utils.hpp"
#include <votergrid/core/error.hpp>
#include <votergrid/core/frame.hpp>
#include <opencv2/imgproc.hpp>
#include <vector>

namespace votergrid::vision {

UpscaleStage::UpscaleStage(std::uint32_t min_width, std::uint32_t factor)
    : min_width_(min_width), factor_(factor) {}

std::expected<votergrid::core::StageOutput, votergrid::core::PipelineError>
UpscaleStage::process(const votergrid::core::Frame& input) {
  if (input.empty()) {
    return std::unexpected(votergrid::core::PipelineError::InvalidFrame);
  }

  using namespace votergrid::core;

  auto mat_in = detail::frame_to_mat(input);
  if (!mat_in) {
    return std::unexpected(PipelineError::InvalidFrame);
  }

  if (factor_ <= 1 || input.width() >= min_width_) {
    std::vector<std::byte> buf(input.data().begin(), input.data().end());
    return StageOutput{
        Frame(input.width(), input.height(), input.format(), std::move(buf))};
  }

  cv::Mat mat_out;
  cv::resize(*mat_in, mat_out,
             cv::Size(static_cast<int>(input.width() * factor_),
                      static_cast<int>(input.height() * factor_)),
             0, 0, cv::INTER_LANCZOS4);

  return StageOutput{detail::mat_to_frame(mat_out, input.format())};
}

}  // namespace votergrid::vision
