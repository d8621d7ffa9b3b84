#include <votergrid/app/config.hpp>
#include <charconv>
#include <fstream>
#include <string_view>
#include <system_error>

namespace votergrid::app {

namespace {

void trim(std::string& s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    s.clear();
    return;
  }
  const auto end = s.find_last_not_of(" \t\r\n");
  s = s.substr(start, end == std::string::npos ? std::string::npos : end - start + 1);
}

bool parse_line(std::string_view line, std::string& key, std::string& value) {
  const auto pos = line.find('=');
  if (pos == std::string_view::npos) return false;
  key.assign(line.substr(0, pos));
  value.assign(line.substr(pos + 1));
  trim(key);
  trim(value);
  return !key.empty();
}

/// Parses the whole of \p value into \p out; leaves \p out untouched on failure.
template <typename T>
void assign_number(const std::string& value, T& out) {
  T parsed{};
  const char* first = value.data();
  const char* last = value.data() + value.size();
  const auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (ec == std::errc() && ptr == last) out = parsed;
}

}  // namespace

PipelineConfig default_config() {
  PipelineConfig c;
  c.grid = {10, 3};
  c.margins = {};
  c.face = {0.78f, 0.30f, 0.20f, 0.55f};
  c.engine_type = OcrEngineType::Tesseract;
  c.tessdata_path = "";
  c.ocr_language = "mar+eng";
  c.page_seg_mode = 6;
  c.preprocess = {};
  c.face_contrast = 1.2f;
  c.face_sharpness = 1.3f;
  c.thumbnail_width = 80;
  c.num_workers = 0;
  return c;
}

PipelineConfig load_config(const std::string& path) {
  PipelineConfig c = default_config();
  std::ifstream f(path);
  if (!f) return c;

  std::string line;
  std::string key;
  std::string value;
  while (std::getline(f, line)) {
    trim(line);
    if (line.empty() || line[0] == '#') continue;
    if (!parse_line(line, key, value)) continue;

    if (key == "grid_rows") assign_number(value, c.grid.rows);
    else if (key == "grid_cols") assign_number(value, c.grid.cols);
    else if (key == "margin_top") assign_number(value, c.margins.top);
    else if (key == "margin_left") assign_number(value, c.margins.left);
    else if (key == "margin_right") assign_number(value, c.margins.right);
    else if (key == "margin_bottom") assign_number(value, c.margins.bottom);
    else if (key == "face_left") assign_number(value, c.face.left);
    else if (key == "face_top") assign_number(value, c.face.top);
    else if (key == "face_width") assign_number(value, c.face.width);
    else if (key == "face_height") assign_number(value, c.face.height);
    else if (key == "engine") {
      if (auto type = parse_engine_type(value)) c.engine_type = *type;
    }
    else if (key == "tessdata_path") c.tessdata_path = value;
    else if (key == "ocr_language") c.ocr_language = value;
    else if (key == "page_seg_mode") assign_number(value, c.page_seg_mode);
    else if (key == "preprocess") c.preprocess.enabled = (value != "0" && value != "false");
    else if (key == "upscale_min_width") assign_number(value, c.preprocess.upscale_min_width);
    else if (key == "upscale_factor") assign_number(value, c.preprocess.upscale_factor);
    else if (key == "contrast") assign_number(value, c.preprocess.contrast);
    else if (key == "sharpness") assign_number(value, c.preprocess.sharpness);
    else if (key == "face_contrast") assign_number(value, c.face_contrast);
    else if (key == "face_sharpness") assign_number(value, c.face_sharpness);
    else if (key == "thumbnail_width") assign_number(value, c.thumbnail_width);
    else if (key == "num_workers") assign_number(value, c.num_workers);
  }
  return c;
}

std::optional<OcrEngineType> parse_engine_type(std::string_view name) {
  if (name == "tesseract") return OcrEngineType::Tesseract;
  if (name == "mock") return OcrEngineType::Mock;
  return std::nullopt;
}

std::expected<void, votergrid::core::PipelineError> apply_overrides(
    PipelineConfig& cfg, const ConfigOverrides& overrides) {
  std::optional<OcrEngineType> engine;
  if (overrides.engine) {
    engine = parse_engine_type(*overrides.engine);
    if (!engine) return std::unexpected(votergrid::core::PipelineError::InvalidConfig);
  }

  if (engine) cfg.engine_type = *engine;
  if (overrides.rows) cfg.grid.rows = *overrides.rows;
  if (overrides.cols) cfg.grid.cols = *overrides.cols;
  if (overrides.tessdata_path) cfg.tessdata_path = *overrides.tessdata_path;
  if (overrides.num_workers) cfg.num_workers = *overrides.num_workers;
  return {};
}

}  // namespace votergrid::app
