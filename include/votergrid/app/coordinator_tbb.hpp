#pragma once

#include <votergrid/app/card_processor.hpp>
#include <votergrid/app/coordinator.hpp>
#include <votergrid/core/error.hpp>
#include <votergrid/core/frame.hpp>
#include <votergrid/core/geometry.hpp>
#include <votergrid/core/voter_record.hpp>
#include <votergrid/ocr/field_extractor.hpp>
#include <expected>
#include <vector>

#ifdef VOTERGRID_HAS_TBB

namespace votergrid::app {

/// Same contract as Coordinator::run, scheduled on the TBB task arena instead
/// of a WorkerPool. Each card writes into its own slot, so the output order is
/// the grid order and does not depend on scheduling.
///
/// \param extractor Shared by all tasks; its engine must be thread-safe.
/// \param options on_issue may be invoked from TBB worker threads.
[[nodiscard]] std::expected<std::vector<votergrid::core::VoterRecord>,
                            votergrid::core::PipelineError>
run_sheet_tbb(votergrid::ocr::FieldExtractor& extractor,
              const votergrid::core::Frame& sheet,
              const votergrid::core::GridSpec& grid,
              const votergrid::core::FaceRatios& ratios,
              const CoordinatorOptions& options = {});

}  // namespace votergrid::app

#endif  // VOTERGRID_HAS_TBB
