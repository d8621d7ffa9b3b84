#pragma once

#include <votergrid/core/error.hpp>
#include <votergrid/core/frame.hpp>
#include <votergrid/core/recognized_text.hpp>
#include <expected>

namespace votergrid::ocr {

/// Abstract text-recognition engine: Frame -> RecognizedText.
/// Implement recognize(); optionally override validate_input and warmup.
///
/// Concurrency: one engine instance is shared by every card task, so
/// recognize() must be safe to call from several threads at once.
class IOcrEngine {
 public:
  virtual ~IOcrEngine() = default;

  /// Single-image recognition. Failure to run the engine at all (not
  /// initialised, image rejected) is OcrEngineFailed; poor recognition is not
  /// an error and simply yields poor text.
  [[nodiscard]] virtual std::expected<votergrid::core::RecognizedText,
                                      votergrid::core::PipelineError>
  recognize(const votergrid::core::Frame& input) = 0;

  /// Optional: validate frame format/dimensions before recognize. Default: accept.
  [[nodiscard]] virtual std::expected<void, votergrid::core::PipelineError>
  validate_input(const votergrid::core::Frame& /*input*/) const {
    return {};
  }

  /// Optional: load models ahead of the first card. Default: no-op.
  [[nodiscard]] virtual std::expected<void, votergrid::core::PipelineError> warmup() {
    return {};
  }
};

}  // namespace votergrid::ocr
