#pragma once

#include <votergrid/core/error.hpp>
#include <votergrid/core/frame.hpp>
#include <votergrid/core/pipeline_stage.hpp>
#include <expected>

namespace votergrid::vision {

/// Converts between pixel formats (e.g. BGR -> Grayscale before OCR).
class ColorConvertStage : public votergrid::core::IPipelineStage {
 public:
  explicit ColorConvertStage(votergrid::core::PixelFormat output_format);

  [[nodiscard]] std::expected<votergrid::core::StageOutput,
                              votergrid::core::PipelineError>
  process(const votergrid::core::Frame& input) override;

 private:
  votergrid::core::PixelFormat output_format_;
};

}  // namespace votergrid::vision
