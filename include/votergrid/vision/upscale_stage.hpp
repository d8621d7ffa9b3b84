#pragma once

#include <votergrid/core/error.hpp>
#include <votergrid/core/frame.hpp>
#include <votergrid/core/pipeline_stage.hpp>
#include <cstdint>
#include <expected>

namespace votergrid::vision {

/// Enlarges narrow card images by an integer factor (Lanczos) so that small
/// glyphs reach a size the OCR engine reads reliably. Frames at least
/// min_width wide pass through unchanged.
class UpscaleStage : public votergrid::core::IPipelineStage {
 public:
  UpscaleStage(std::uint32_t min_width, std::uint32_t factor);

  [[nodiscard]] std::expected<votergrid::core::StageOutput,
                              votergrid::core::PipelineError>
  process(const votergrid::core::Frame& input) override;

 private:
  std::uint32_t min_width_;
  std::uint32_t factor_;
};

}  // namespace votergrid::vision
