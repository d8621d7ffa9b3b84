#pragma once

#include <votergrid/core/card_image.hpp>
#include <votergrid/core/error.hpp>
#include <votergrid/core/pipeline.hpp>
#include <votergrid/core/recognized_text.hpp>
#include <votergrid/core/voter_record.hpp>
#include <votergrid/ocr/field_parser.hpp>
#include <votergrid/ocr/ocr_engine.hpp>
#include <cstdint>
#include <expected>
#include <memory>

namespace votergrid::ocr {

/// Image clean-up applied to each card before OCR.
struct PreprocessOptions {
  bool enabled{true};  // false: grayscale conversion only
  std::uint32_t upscale_min_width{350};  // cards narrower than this are enlarged
  std::uint32_t upscale_factor{2};
  float contrast{1.5f};
  float sharpness{1.2f};
};

/// Result of reading one card.
struct Extraction {
  votergrid::core::RecognizedText raw;
  votergrid::core::VoterFields fields;
  /// False when the engine returned no non-blank text; fields are then all absent.
  bool text_found{false};
};

/// Runs preprocessing + OCR on a card and parses the text into fields.
///
/// Pipeline: Grayscale -> Upscale -> Enhance -> OCR (see PreprocessOptions).
/// With preprocessing disabled the grayscale conversion still runs.
/// Only a failure to run the engine is an error (OcrEngineFailed or
/// InvalidFrame); unreadable text is a successful Extraction with absent fields.
/// Thread-safe if the engine is (IOcrEngine requires it).
class FieldExtractor {
 public:
  explicit FieldExtractor(std::shared_ptr<IOcrEngine> engine,
                          PreprocessOptions options = {},
                          FieldParser parser = FieldParser{});

  [[nodiscard]] std::expected<Extraction, votergrid::core::PipelineError> extract(
      const votergrid::core::CardImage& card,
      const votergrid::core::StageTimingCallback* timing_cb = nullptr);

  [[nodiscard]] const FieldParser& parser() const noexcept { return parser_; }

 private:
  votergrid::core::Pipeline pipeline_;
  FieldParser parser_;
};

}  // namespace votergrid::ocr
