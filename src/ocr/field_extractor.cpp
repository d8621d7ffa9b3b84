#include <votergrid/ocr/field_extractor.hpp>
#include <votergrid/ocr/ocr_stage.hpp>
#include <votergrid/vision/color_convert_stage.hpp>
#include <votergrid/vision/enhance_stage.hpp>
#include <votergrid/vision/upscale_stage.hpp>
#include <algorithm>
#include <cctype>

namespace votergrid::ocr {

namespace vc = votergrid::core;

FieldExtractor::FieldExtractor(std::shared_ptr<IOcrEngine> engine,
                               PreprocessOptions options,
                               FieldParser parser)
    : parser_(std::move(parser)) {
  // Grayscale always: decoded sheets are BGR8, which the engines do not take.
  pipeline_.add_stage(
      std::make_unique<votergrid::vision::ColorConvertStage>(vc::PixelFormat::Grayscale8));
  if (options.enabled) {
    pipeline_.add_stage(std::make_unique<votergrid::vision::UpscaleStage>(
        options.upscale_min_width, options.upscale_factor));
    pipeline_.add_stage(
        std::make_unique<votergrid::vision::EnhanceStage>(options.contrast, options.sharpness));
  }
  pipeline_.add_stage(std::make_unique<OcrStage>(std::move(engine)));
}

std::expected<Extraction, vc::PipelineError> FieldExtractor::extract(
    const vc::CardImage& card,
    const vc::StageTimingCallback* timing_cb) {
  auto text = pipeline_.run(card.image, timing_cb);
  if (!text) {
    return std::unexpected(text.error());
  }

  Extraction out;
  out.text_found = std::any_of(text->text.begin(), text->text.end(), [](char c) {
    return !std::isspace(static_cast<unsigned char>(c));
  });
  if (out.text_found) {
    out.fields = parser_.parse(text->text);
  }
  out.raw = std::move(*text);
  return out;
}

}  // namespace votergrid::ocr
