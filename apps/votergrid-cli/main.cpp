/**
 * votergrid-cli — Read voter-roll sheet image(s), extract one record per card, write .xlsx.
 * Build: cmake -B build && cmake --build build
 * Run:   ./build/votergrid_cli --input sheet.png [--input sheet2.png] [--output voters.xlsx]
 */

#include <votergrid/app/config.hpp>
#include <votergrid/app/coordinator.hpp>
#include <votergrid/app/worker_pool.hpp>
#include <votergrid/core/error.hpp>
#include <votergrid/core/frame.hpp>
#include <votergrid/core/voter_record.hpp>
#include <votergrid/ocr/field_extractor.hpp>
#include <votergrid/ocr/mock_ocr_engine.hpp>
#include <votergrid/ocr/ocr_engine.hpp>
#include <votergrid/ocr/tesseract_ocr_engine.hpp>
#include <votergrid/report/report.hpp>
#include <votergrid/report/xlsx_writer.hpp>
#include <votergrid/vision/image_io.hpp>

#include <charconv>
#include <cstdint>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>
#include <vector>

namespace {

namespace vc = votergrid::core;

constexpr const char* kDemoCardText =
    "ABC1234567 123/456/789\n"
    "मतदाराचे पूर्ण नाव : सुनील रामचंद्र पाटील\n"
    "वडिलांचे नाव : रामचंद्र पाटील\n"
    "घर क्रमांक : 12\n"
    "वय : 45 लिंग : पुरुष\n";

std::shared_ptr<votergrid::ocr::IOcrEngine> build_engine(const votergrid::app::PipelineConfig& cfg) {
  if (cfg.engine_type == votergrid::app::OcrEngineType::Mock) {
    auto mock = std::make_shared<votergrid::ocr::MockOcrEngine>();
    mock->set_text(kDemoCardText);
    return mock;
  }
  votergrid::ocr::TesseractOptions options;
  options.tessdata_path = cfg.tessdata_path;
  options.language = cfg.ocr_language;
  options.page_seg_mode = cfg.page_seg_mode;
  return std::make_shared<votergrid::ocr::TesseractOcrEngine>(std::move(options));
}

bool parse_int(const std::string& s, int& out) {
  const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
  return ec == std::errc() && ptr == s.data() + s.size();
}

bool parse_size(const std::string& s, std::size_t& out) {
  const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
  return ec == std::errc() && ptr == s.data() + s.size();
}

void print_usage() {
  std::cout << "Usage: votergrid_cli --input <image> [--input <image> ...] [options]\n"
            << "  --output <path>   Output workbook (default: voters.xlsx)\n"
            << "  --config <path>   Pipeline config (key=value file); default: built-in\n"
            << "  --rows <n>        Card rows per sheet (default 10)\n"
            << "  --cols <n>        Card columns per sheet (default 3)\n"
            << "  --engine <type>   tesseract | mock (default from config)\n"
            << "  --tessdata <dir>  Directory with mar.traineddata and eng.traineddata\n"
            << "  --workers <n>     Worker threads; 0 = hardware concurrency\n"
            << "  --timings         Print mean time per OCR pipeline stage to stderr\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  std::string config_path;
  std::string output_path = "voters.xlsx";
  std::vector<std::string> input_paths;
  votergrid::app::ConfigOverrides overrides;
  bool print_timings = false;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--input" && i + 1 < argc) {
      input_paths.emplace_back(argv[++i]);
    } else if (arg == "--output" && i + 1 < argc) {
      output_path = argv[++i];
    } else if (arg == "--engine" && i + 1 < argc) {
      overrides.engine = argv[++i];
    } else if (arg == "--tessdata" && i + 1 < argc) {
      overrides.tessdata_path = argv[++i];
    } else if ((arg == "--rows" || arg == "--cols") && i + 1 < argc) {
      int value = 0;
      if (!parse_int(argv[++i], value)) {
        std::cerr << "Invalid " << arg << " value: " << argv[i] << "\n";
        return 1;
      }
      (arg == "--rows" ? overrides.rows : overrides.cols) = value;
    } else if (arg == "--workers" && i + 1 < argc) {
      std::size_t workers = 0;
      if (!parse_size(argv[++i], workers)) {
        std::cerr << "Invalid --workers value: " << argv[i] << "\n";
        return 1;
      }
      overrides.num_workers = workers;
    } else if (arg == "--timings") {
      print_timings = true;
    } else if (arg == "--help" || arg == "-h") {
      print_usage();
      return 0;
    } else {
      std::cerr << "Unknown argument: " << arg << "\n";
      print_usage();
      return 1;
    }
  }

  if (input_paths.empty()) {
    std::cerr << "At least one --input image is required\n";
    print_usage();
    return 1;
  }

  votergrid::app::PipelineConfig cfg = config_path.empty() ? votergrid::app::default_config()
                                                           : votergrid::app::load_config(config_path);
  if (auto applied = votergrid::app::apply_overrides(cfg, overrides); !applied) {
    std::cerr << "Unknown --engine " << overrides.engine.value_or("")
              << " (use tesseract or mock)\n";
    return 1;
  }

  std::vector<vc::Frame> sheets;
  sheets.reserve(input_paths.size());
  for (const auto& path : input_paths) {
    auto loaded = votergrid::vision::load_frame_from_image(path);
    if (!loaded) {
      std::cerr << "Failed to load image: " << path << " ("
                << vc::to_string(vc::PipelineError::LoadFailed) << ")\n";
      return 1;
    }
    sheets.push_back(std::move(*loaded));
  }

  auto engine = build_engine(cfg);
  if (auto ready = engine->warmup(); !ready) {
    std::cerr << "OCR engine unavailable: " << vc::to_string(ready.error()) << "\n";
    return 1;
  }
  votergrid::ocr::FieldExtractor extractor(engine, cfg.preprocess);

  // Warnings arrive from worker threads.
  std::mutex log_mutex;
  votergrid::app::CoordinatorOptions options;
  options.margins = cfg.margins;
  options.face_contrast = cfg.face_contrast;
  options.face_sharpness = cfg.face_sharpness;
  options.on_issue = [&log_mutex](const vc::CardCell& cell, vc::PipelineError error) {
    std::lock_guard lock(log_mutex);
    std::cerr << "Warning: card (" << cell.row << "," << cell.col
              << "): " << vc::to_string(error) << "\n";
  };

  std::vector<double> stage_ms;
  std::vector<std::size_t> stage_runs;
  if (print_timings) {
    options.on_stage_timing = [&](std::size_t stage, double ms) {
      std::lock_guard lock(log_mutex);
      if (stage >= stage_ms.size()) {
        stage_ms.resize(stage + 1, 0.0);
        stage_runs.resize(stage + 1, 0);
      }
      stage_ms[stage] += ms;
      ++stage_runs[stage];
    };
  }

  votergrid::app::WorkerPool pool(cfg.num_workers);
  votergrid::app::Coordinator coordinator(extractor, pool, std::move(options));
  auto records = coordinator.run_sheets(sheets, cfg.grid, cfg.face);
  if (!records) {
    std::cerr << "Pipeline error: " << vc::to_string(records.error()) << "\n";
    return 1;
  }

  for (std::size_t s = 0; s < stage_ms.size(); ++s) {
    std::cerr << "Stage " << s << ": " << stage_ms[s] / static_cast<double>(stage_runs[s])
              << " ms mean over " << stage_runs[s] << " cards\n";
  }

  std::size_t with_name = 0;
  for (const auto& r : *records) {
    if (r.fields.name) ++with_name;
  }

  votergrid::report::ReportLayout layout;
  layout.thumbnail_width = cfg.thumbnail_width;
  const votergrid::report::Report report = votergrid::report::assemble(std::move(*records), layout);

  const votergrid::report::XlsxWriter writer(
      [](std::uint32_t serial, const std::string& reason) {
        std::cerr << "Warning: photo of row " << serial << " not embedded: " << reason << "\n";
      });
  if (auto written = writer.write_file(report, output_path); !written) {
    std::cerr << "Failed to write " << output_path << ": "
              << vc::to_string(written.error()) << "\n";
    return 1;
  }

  std::cout << "sheets=" << sheets.size() << " records=" << report.rows.size()
            << " named=" << with_name << " workers=" << pool.size()
            << " output=" << output_path << "\n";
  return 0;
}
