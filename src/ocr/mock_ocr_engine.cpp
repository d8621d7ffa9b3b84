#include <votergrid/ocr/mock_ocr_engine.hpp>
#include <votergrid/core/error.hpp>

namespace votergrid::ocr {

void MockOcrEngine::set_text(std::string text) { text_ = std::move(text); }

void MockOcrEngine::set_script(OcrScript script) { script_ = std::move(script); }

std::expected<votergrid::core::RecognizedText, votergrid::core::PipelineError>
MockOcrEngine::recognize(const votergrid::core::Frame& input) {
  ++calls_;
  auto valid = validate_input(input);
  if (!valid) {
    return std::unexpected(valid.error());
  }
  if (script_) {
    return script_(input);
  }
  return votergrid::core::RecognizedText{text_, 90.f, "mock"};
}

std::expected<void, votergrid::core::PipelineError>
MockOcrEngine::validate_input(const votergrid::core::Frame& input) const {
  if (input.empty()) {
    return std::unexpected(votergrid::core::PipelineError::InvalidFrame);
  }
  return {};
}

}  // namespace votergrid::ocr
