#pragma once

#include <votergrid/core/card_image.hpp>
#include <votergrid/core/error.hpp>
#include <votergrid/core/frame.hpp>
#include <votergrid/core/geometry.hpp>
#include <cstdint>
#include <expected>
#include <vector>

namespace votergrid::vision {

/// Checks the grid shape only; touches no pixels.
[[nodiscard]] std::expected<void, votergrid::core::PipelineError>
validate_grid(const votergrid::core::GridSpec& grid);

/// Computes the cell rectangles of a width x height sheet split into grid.rows x grid.cols
/// equal cells, row-major. The last row/column absorbs the integer-division remainder.
/// InvalidGrid for a non-positive shape, SegmentationFailed when a nominal cell is
/// zero pixels wide or high.
[[nodiscard]] std::expected<std::vector<votergrid::core::CardCell>,
                            votergrid::core::PipelineError>
layout_cards(std::uint32_t width, std::uint32_t height, const votergrid::core::GridSpec& grid);

/// Cuts the margin bands off a sheet. Zero margins return a copy.
/// SegmentationFailed when the margins leave no pixels.
[[nodiscard]] std::expected<votergrid::core::Frame, votergrid::core::PipelineError>
trim_margins(const votergrid::core::Frame& sheet, const votergrid::core::SheetMargins& margins);

/// Copies one cell out of the sheet. Repeatable: any cell can be recomputed
/// from the same sheet at any time, from any thread.
[[nodiscard]] votergrid::core::CardImage crop_card(const votergrid::core::Frame& sheet,
                                                   const votergrid::core::CardCell& cell);

/// Splits a whole sheet into rows * cols cards in row-major order.
[[nodiscard]] std::expected<std::vector<votergrid::core::CardImage>,
                            votergrid::core::PipelineError>
segment(const votergrid::core::Frame& sheet, const votergrid::core::GridSpec& grid);

}  // namespace votergrid::vision
