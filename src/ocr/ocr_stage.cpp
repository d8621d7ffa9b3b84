#include <votergrid/ocr/ocr_stage.hpp>
#include <votergrid/core/recognized_text.hpp>

namespace votergrid::ocr {

OcrStage::OcrStage(std::shared_ptr<IOcrEngine> engine)
    : engine_(std::move(engine)) {}

std::expected<votergrid::core::StageOutput, votergrid::core::PipelineError>
OcrStage::process(const votergrid::core::Frame& input) {
  if (!engine_) {
    return std::unexpected(votergrid::core::PipelineError::OcrEngineFailed);
  }
  auto valid = engine_->validate_input(input);
  if (!valid) {
    return std::unexpected(valid.error());
  }
  auto result = engine_->recognize(input);
  if (!result) {
    return std::unexpected(result.error());
  }
  return votergrid::core::StageOutput{std::move(*result)};
}

}  // namespace votergrid::ocr
