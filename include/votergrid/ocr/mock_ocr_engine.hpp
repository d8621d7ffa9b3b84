#pragma once

#include <votergrid/ocr/ocr_engine.hpp>
#include <atomic>
#include <cstddef>
#include <functional>
#include <string>

namespace votergrid::ocr {

/// Decides the engine's answer for one frame (tests key it on pixel content).
using OcrScript = std::function<std::expected<votergrid::core::RecognizedText,
                                              votergrid::core::PipelineError>(
    const votergrid::core::Frame&)>;

/// Engine that returns configured text instead of running OCR (for tests/demo).
/// Configure before sharing across threads; recognize() itself is thread-safe.
class MockOcrEngine : public IOcrEngine {
 public:
  /// Return \p text for every frame.
  void set_text(std::string text);

  /// Let \p script answer each frame; overrides set_text().
  void set_script(OcrScript script);

  [[nodiscard]] std::expected<votergrid::core::RecognizedText,
                              votergrid::core::PipelineError>
  recognize(const votergrid::core::Frame& input) override;

  [[nodiscard]] std::expected<void, votergrid::core::PipelineError>
  validate_input(const votergrid::core::Frame& input) const override;

  [[nodiscard]] std::size_t call_count() const noexcept { return calls_.load(); }

 private:
  std::string text_;
  OcrScript script_;
  std::atomic<std::size_t> calls_{0};
};

}  // namespace votergrid::ocr
