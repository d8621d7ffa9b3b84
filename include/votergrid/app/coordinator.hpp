#pragma once

#include <votergrid/app/card_processor.hpp>
#include <votergrid/app/worker_pool.hpp>
#include <votergrid/core/card_image.hpp>
#include <votergrid/core/error.hpp>
#include <votergrid/core/frame.hpp>
#include <votergrid/core/geometry.hpp>
#include <votergrid/core/voter_record.hpp>
#include <votergrid/ocr/field_extractor.hpp>
#include <cstdint>
#include <expected>
#include <span>
#include <vector>

namespace votergrid::app {

/// Page geometry resolved once per sheet: the page the cells index into and
/// the cells in grid order. Cards are cropped from it lazily, one per task.
struct SheetPlan {
  votergrid::core::Frame trimmed;  // empty when no margins were cut
  bool uses_trimmed{false};
  std::vector<votergrid::core::CardCell> cells;

  [[nodiscard]] const votergrid::core::Frame& page(const votergrid::core::Frame& sheet) const noexcept {
    return uses_trimmed ? trimmed : sheet;
  }
};

/// Validates the grid, trims margins and lays out the cells. Errors: InvalidGrid,
/// SegmentationFailed, NoCards. Touches no OCR engine.
[[nodiscard]] std::expected<SheetPlan, votergrid::core::PipelineError>
plan_sheet(const votergrid::core::Frame& sheet, const votergrid::core::GridSpec& grid,
           const votergrid::core::SheetMargins& margins = {});

/// Sets serial = first, first + 1, ... in vector order.
void assign_serials(std::vector<votergrid::core::VoterRecord>& records, std::uint32_t first = 1);

/// Per-run settings shared by every card.
struct CoordinatorOptions {
  votergrid::core::SheetMargins margins{};
  float face_contrast{1.2f};
  float face_sharpness{1.3f};
  CardIssueCallback on_issue;  // may be invoked from worker threads
  votergrid::core::StageTimingCallback on_stage_timing;  // per OCR pipeline stage, worker threads too
};

/// Drives a whole sheet: one task per card on the pool, results joined in grid order.
///
/// Output is deterministic for a given sheet, grid and engine regardless of the
/// number of workers. Per-card failures degrade to a record with absent fields;
/// only sheet-level problems are errors.
class Coordinator {
 public:
  Coordinator(votergrid::ocr::FieldExtractor& extractor, WorkerPool& pool,
              CoordinatorOptions options = {});

  /// Records in row-major grid order with serials 1..rows*cols.
  [[nodiscard]] std::expected<std::vector<votergrid::core::VoterRecord>,
                              votergrid::core::PipelineError>
  run(const votergrid::core::Frame& sheet, const votergrid::core::GridSpec& grid,
      const votergrid::core::FaceRatios& ratios);

  /// Several sheets into one list: sheet order, then grid order; serials continue
  /// across sheets (1..total). Stops at the first sheet-level error.
  [[nodiscard]] std::expected<std::vector<votergrid::core::VoterRecord>,
                              votergrid::core::PipelineError>
  run_sheets(std::span<const votergrid::core::Frame> sheets,
             const votergrid::core::GridSpec& grid,
             const votergrid::core::FaceRatios& ratios);

 private:
  votergrid::ocr::FieldExtractor* extractor_;
  WorkerPool* pool_;
  CoordinatorOptions options_;
};

}  // namespace votergrid::app
