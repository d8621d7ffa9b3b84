#pragma once

#include <votergrid/core/error.hpp>
#include <votergrid/core/geometry.hpp>
#include <votergrid/ocr/field_extractor.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace votergrid::app {

/// OCR engine type: tesseract (real) or mock (synthetic text, for demos).
enum class OcrEngineType {
  Tesseract,
  Mock,
};

/// Pipeline configuration: grid, crop geometry, OCR and report settings.
struct PipelineConfig {
  votergrid::core::GridSpec grid{};
  votergrid::core::SheetMargins margins{};
  votergrid::core::FaceRatios face{};

  OcrEngineType engine_type{OcrEngineType::Tesseract};
  std::string tessdata_path;
  std::string ocr_language{"mar+eng"};
  int page_seg_mode{6};
  votergrid::ocr::PreprocessOptions preprocess{};

  float face_contrast{1.2f};
  float face_sharpness{1.3f};
  std::uint32_t thumbnail_width{80};

  std::size_t num_workers{0};  // 0 = hardware concurrency
};

/// Load config from a simple key=value file (one per line) or use defaults.
/// Unknown keys and malformed values are ignored.
PipelineConfig load_config(const std::string& path);

/// Default config when no file is provided.
PipelineConfig default_config();

/// "tesseract" or "mock"; nullopt for anything else.
std::optional<OcrEngineType> parse_engine_type(std::string_view name);

/// Command-line settings that take precedence over the config file.
struct ConfigOverrides {
  std::optional<int> rows;
  std::optional<int> cols;
  std::optional<std::string> engine;
  std::optional<std::string> tessdata_path;
  std::optional<std::size_t> num_workers;
};

/// Applies every set field of \p overrides to \p cfg. Grid sizes are copied as
/// given (0 included) so that the coordinator rejects them as InvalidGrid.
/// InvalidConfig for an unknown engine name; \p cfg is then unchanged.
[[nodiscard]] std::expected<void, votergrid::core::PipelineError> apply_overrides(
    PipelineConfig& cfg, const ConfigOverrides& overrides);

}  // namespace votergrid::app
