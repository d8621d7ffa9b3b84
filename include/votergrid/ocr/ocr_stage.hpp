#pragma once

#include <votergrid/core/error.hpp>
#include <votergrid/core/frame.hpp>
#include <votergrid/core/pipeline_stage.hpp>
#include <votergrid/ocr/ocr_engine.hpp>
#include <expected>
#include <memory>

namespace votergrid::ocr {

/// Terminal pipeline stage: run the OCR engine -> RecognizedText.
class OcrStage : public votergrid::core::IPipelineStage {
 public:
  explicit OcrStage(std::shared_ptr<IOcrEngine> engine);

  [[nodiscard]] std::expected<votergrid::core::StageOutput,
                              votergrid::core::PipelineError>
  process(const votergrid::core::Frame& input) override;

 private:
  std::shared_ptr<IOcrEngine> engine_;
};

}  // namespace votergrid::ocr
