#include <votergrid/app/coordinator_tbb.hpp>
#include <votergrid/vision/segmenter.hpp>

#ifdef VOTERGRID_HAS_TBB

#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <cstddef>

namespace votergrid::app {

namespace vc = votergrid::core;

std::expected<std::vector<vc::VoterRecord>, vc::PipelineError> run_sheet_tbb(
    votergrid::ocr::FieldExtractor& extractor,
    const vc::Frame& sheet,
    const vc::GridSpec& grid,
    const vc::FaceRatios& ratios,
    const CoordinatorOptions& options) {
  auto plan = plan_sheet(sheet, grid, options.margins);
  if (!plan) return std::unexpected(plan.error());

  const vc::Frame& page = plan->page(sheet);
  const auto& cells = plan->cells;
  const CardProcessor processor(
      extractor, FaceOptions{ratios, options.face_contrast, options.face_sharpness},
      options.on_issue, options.on_stage_timing);

  std::vector<vc::VoterRecord> records(cells.size());
  tbb::parallel_for(
      tbb::blocked_range<std::size_t>(0, cells.size()),
      [&page, &cells, &processor, &records](const tbb::blocked_range<std::size_t>& range) {
        for (std::size_t i = range.begin(); i != range.end(); ++i) {
          records[i] = processor.process(votergrid::vision::crop_card(page, cells[i]));
        }
      });

  assign_serials(records);
  return records;
}

}  // namespace votergrid::app

#endif  // VOTERGRID_HAS_TBB
