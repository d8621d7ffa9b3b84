#include <votergrid/app/coordinator.hpp>
#include <votergrid/vision/segmenter.hpp>
#include <future>
#include <utility>

namespace votergrid::app {

namespace vc = votergrid::core;
namespace vv = votergrid::vision;

namespace {

bool has_margins(const vc::SheetMargins& m) noexcept {
  return m.top != 0 || m.left != 0 || m.right != 0 || m.bottom != 0;
}

}  // namespace

std::expected<SheetPlan, vc::PipelineError> plan_sheet(const vc::Frame& sheet,
                                                       const vc::GridSpec& grid,
                                                       const vc::SheetMargins& margins) {
  // Grid shape first: a bad grid must fail before any pixel or engine work.
  if (auto ok = vv::validate_grid(grid); !ok) {
    return std::unexpected(ok.error());
  }

  SheetPlan plan;
  if (has_margins(margins)) {
    auto trimmed = vv::trim_margins(sheet, margins);
    if (!trimmed) return std::unexpected(trimmed.error());
    plan.trimmed = std::move(*trimmed);
    plan.uses_trimmed = true;
  }

  const vc::Frame& page = plan.page(sheet);
  auto cells = vv::layout_cards(page.width(), page.height(), grid);
  if (!cells) return std::unexpected(cells.error());
  if (cells->empty()) return std::unexpected(vc::PipelineError::NoCards);
  plan.cells = std::move(*cells);
  return plan;
}

void assign_serials(std::vector<vc::VoterRecord>& records, std::uint32_t first) {
  for (auto& r : records) {
    r.serial = first++;
  }
}

Coordinator::Coordinator(votergrid::ocr::FieldExtractor& extractor, WorkerPool& pool,
                         CoordinatorOptions options)
    : extractor_(&extractor), pool_(&pool), options_(std::move(options)) {}

std::expected<std::vector<vc::VoterRecord>, vc::PipelineError> Coordinator::run(
    const vc::Frame& sheet, const vc::GridSpec& grid, const vc::FaceRatios& ratios) {
  auto plan = plan_sheet(sheet, grid, options_.margins);
  if (!plan) return std::unexpected(plan.error());

  const vc::Frame& page = plan->page(sheet);
  const CardProcessor processor(*extractor_,
                                FaceOptions{ratios, options_.face_contrast, options_.face_sharpness},
                                options_.on_issue, options_.on_stage_timing);

  std::vector<std::future<vc::VoterRecord>> pending;
  pending.reserve(plan->cells.size());
  for (const auto& cell : plan->cells) {
    pending.push_back(pool_->submit([&page, &processor, cell]() {
      return processor.process(vv::crop_card(page, cell));
    }));
  }

  // Tasks borrow page and processor: let every one finish before any get() can throw.
  for (auto& f : pending) {
    f.wait();
  }

  std::vector<vc::VoterRecord> records;
  records.reserve(pending.size());
  for (auto& f : pending) {
    records.push_back(f.get());
  }
  assign_serials(records);
  return records;
}

std::expected<std::vector<vc::VoterRecord>, vc::PipelineError> Coordinator::run_sheets(
    std::span<const vc::Frame> sheets, const vc::GridSpec& grid, const vc::FaceRatios& ratios) {
  if (sheets.empty()) return std::unexpected(vc::PipelineError::NoCards);

  std::vector<vc::VoterRecord> all;
  for (const auto& sheet : sheets) {
    auto records = run(sheet, grid, ratios);
    if (!records) return std::unexpected(records.error());
    for (auto& r : *records) {
      all.push_back(std::move(r));
    }
  }
  assign_serials(all);
  return all;
}

}  // namespace votergrid::app
