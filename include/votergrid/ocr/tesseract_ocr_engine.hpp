#pragma once

#include <votergrid/core/error.hpp>
#include <votergrid/core/frame.hpp>
#include <votergrid/ocr/ocr_engine.hpp>
#include <memory>
#include <string>

namespace votergrid::ocr {

struct TesseractOptions {
  /// Directory holding *.traineddata; empty = TESSDATA_PREFIX / library default.
  std::string tessdata_path;
  /// Marathi + English, the two scripts printed on the cards.
  std::string language{"mar+eng"};
  /// Tesseract page segmentation mode; 6 = one uniform block of text.
  int page_seg_mode{6};
};

/// Tesseract-backed engine implementing IOcrEngine.
///
/// TessBaseAPI is not reentrant, so the engine keeps a small pool of
/// initialised instances: each recognize() leases one (creating it on first
/// need) and hands it back when done. The pool grows to the number of
/// concurrent callers and no further.
///
/// Accepts Grayscale8, RGB8 and RGBA8 frames. Initialisation failure (missing
/// traineddata) is reported as OcrEngineFailed from recognize() and warmup().
class TesseractOcrEngine : public IOcrEngine {
 public:
  explicit TesseractOcrEngine(TesseractOptions options = {});

  ~TesseractOcrEngine() override;

  TesseractOcrEngine(const TesseractOcrEngine&) = delete;
  TesseractOcrEngine& operator=(const TesseractOcrEngine&) = delete;

  [[nodiscard]] std::expected<votergrid::core::RecognizedText,
                              votergrid::core::PipelineError>
  recognize(const votergrid::core::Frame& input) override;

  [[nodiscard]] std::expected<void, votergrid::core::PipelineError>
  validate_input(const votergrid::core::Frame& input) const override;

  /// Initialises one instance up front so a missing language pack is reported
  /// before any card is processed.
  [[nodiscard]] std::expected<void, votergrid::core::PipelineError> warmup() override;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace votergrid::ocr
