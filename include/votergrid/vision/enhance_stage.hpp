#pragma once

#include <votergrid/core/error.hpp>
#include <votergrid/core/frame.hpp>
#include <votergrid/core/pipeline_stage.hpp>
#include <expected>

namespace votergrid::vision {

/// Contrast then sharpness enhancement with PIL ImageEnhance semantics
/// (factor 1.0 leaves the image unchanged).
class EnhanceStage : public votergrid::core::IPipelineStage {
 public:
  EnhanceStage(float contrast, float sharpness);

  [[nodiscard]] std::expected<votergrid::core::StageOutput,
                              votergrid::core::PipelineError>
  process(const votergrid::core::Frame& input) override;

 private:
  float contrast_;
  float sharpness_;
};

/// Same transform applied directly to a frame (used on face thumbnails).
[[nodiscard]] std::expected<votergrid::core::Frame, votergrid::core::PipelineError>
enhance_frame(const votergrid::core::Frame& input, float contrast, float sharpness);

}  // namespace votergrid::vision
