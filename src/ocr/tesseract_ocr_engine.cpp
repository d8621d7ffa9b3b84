#include <votergrid/ocr/tesseract_ocr_engine.hpp>
#include <votergrid/core/error.hpp>
#include <votergrid/core/frame.hpp>
#include <tesseract/baseapi.h>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace votergrid::ocr {

namespace vc = votergrid::core;

struct TesseractOcrEngine::Impl {
  TesseractOptions options;
  std::mutex mutex;
  std::vector<std::unique_ptr<tesseract::TessBaseAPI>> idle;

  explicit Impl(TesseractOptions opts) : options(std::move(opts)) {}

  /// New initialised instance, or nullptr if the language data cannot be loaded.
  std::unique_ptr<tesseract::TessBaseAPI> create() const {
    auto api = std::make_unique<tesseract::TessBaseAPI>();
    const char* datapath = options.tessdata_path.empty() ? nullptr : options.tessdata_path.c_str();
    if (api->Init(datapath, options.language.c_str()) != 0) {
      return nullptr;
    }
    api->SetPageSegMode(static_cast<tesseract::PageSegMode>(options.page_seg_mode));
    // Scanned voter rolls carry no DPI metadata once cut into cards.
    api->SetVariable("user_defined_dpi", "300");
    return api;
  }

  std::unique_ptr<tesseract::TessBaseAPI> acquire() {
    {
      std::lock_guard lock(mutex);
      if (!idle.empty()) {
        auto api = std::move(idle.back());
        idle.pop_back();
        return api;
      }
    }
    return create();
  }

  void release(std::unique_ptr<tesseract::TessBaseAPI> api) {
    if (!api) return;
    api->Clear();
    std::lock_guard lock(mutex);
    idle.push_back(std::move(api));
  }

  ~Impl() {
    for (auto& api : idle) {
      api->End();
    }
  }
};

TesseractOcrEngine::TesseractOcrEngine(TesseractOptions options)
    : impl_(std::make_unique<Impl>(std::move(options))) {}

TesseractOcrEngine::~TesseractOcrEngine() = default;

std::expected<void, vc::PipelineError>
TesseractOcrEngine::validate_input(const vc::Frame& input) const {
  if (input.empty()) {
    return std::unexpected(vc::PipelineError::InvalidFrame);
  }
  switch (input.format()) {
    case vc::PixelFormat::Grayscale8:
    case vc::PixelFormat::RGB8:
    case vc::PixelFormat::RGBA8:
      break;
    default:
      return std::unexpected(vc::PipelineError::InvalidFrame);
  }
  if (input.size_bytes() < vc::Frame::min_bytes(input.width(), input.height(), input.format())) {
    return std::unexpected(vc::PipelineError::InvalidFrame);
  }
  return {};
}

std::expected<void, vc::PipelineError> TesseractOcrEngine::warmup() {
  auto api = impl_->acquire();
  if (!api) {
    return std::unexpected(vc::PipelineError::OcrEngineFailed);
  }
  impl_->release(std::move(api));
  return {};
}

std::expected<vc::RecognizedText, vc::PipelineError>
TesseractOcrEngine::recognize(const vc::Frame& input) {
  auto valid = validate_input(input);
  if (!valid) {
    return std::unexpected(valid.error());
  }

  auto api = impl_->acquire();
  if (!api) {
    return std::unexpected(vc::PipelineError::OcrEngineFailed);
  }

  const auto bpp = static_cast<int>(vc::bytes_per_pixel(input.format()));
  api->SetImage(reinterpret_cast<const unsigned char*>(input.data().data()),
                static_cast<int>(input.width()), static_cast<int>(input.height()), bpp,
                static_cast<int>(input.row_bytes()));

  std::unique_ptr<char[]> raw(api->GetUTF8Text());
  if (!raw) {
    impl_->release(std::move(api));
    return std::unexpected(vc::PipelineError::OcrEngineFailed);
  }

  vc::RecognizedText out;
  out.text = raw.get();
  out.mean_confidence = static_cast<float>(api->MeanTextConf());
  out.language = impl_->options.language;
  impl_->release(std::move(api));
  return out;
}

}  // namespace votergrid::ocr
