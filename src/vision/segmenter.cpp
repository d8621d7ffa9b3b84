#include <votergrid/vision/segmenter.hpp>
#include <votergrid/core/error.hpp>

namespace votergrid::vision {

namespace vc = votergrid::core;

std::expected<void, vc::PipelineError> validate_grid(const vc::GridSpec& grid) {
  if (!grid.valid()) {
    return std::unexpected(vc::PipelineError::InvalidGrid);
  }
  return {};
}

std::expected<std::vector<vc::CardCell>, vc::PipelineError>
layout_cards(std::uint32_t width, std::uint32_t height, const vc::GridSpec& grid) {
  auto valid = validate_grid(grid);
  if (!valid) {
    return std::unexpected(valid.error());
  }

  const auto rows = static_cast<std::uint32_t>(grid.rows);
  const auto cols = static_cast<std::uint32_t>(grid.cols);
  const std::uint32_t cell_w = width / cols;
  const std::uint32_t cell_h = height / rows;
  if (cell_w == 0 || cell_h == 0) {
    return std::unexpected(vc::PipelineError::SegmentationFailed);
  }

  std::vector<vc::CardCell> cells;
  cells.reserve(grid.card_count());
  for (std::uint32_t r = 0; r < rows; ++r) {
    const std::uint32_t y0 = r * cell_h;
    const std::uint32_t y1 = (r + 1 == rows) ? height : y0 + cell_h;
    for (std::uint32_t c = 0; c < cols; ++c) {
      const std::uint32_t x0 = c * cell_w;
      const std::uint32_t x1 = (c + 1 == cols) ? width : x0 + cell_w;
      cells.push_back({r, c, {x0, y0, x1 - x0, y1 - y0}});
    }
  }
  return cells;
}

std::expected<vc::Frame, vc::PipelineError>
trim_margins(const vc::Frame& sheet, const vc::SheetMargins& margins) {
  if (sheet.empty()) {
    return std::unexpected(vc::PipelineError::InvalidFrame);
  }
  const std::uint64_t horizontal = std::uint64_t{margins.left} + margins.right;
  const std::uint64_t vertical = std::uint64_t{margins.top} + margins.bottom;
  if (horizontal >= sheet.width() || vertical >= sheet.height()) {
    return std::unexpected(vc::PipelineError::SegmentationFailed);
  }

  vc::Frame out = sheet.crop({margins.left, margins.top,
                              sheet.width() - static_cast<std::uint32_t>(horizontal),
                              sheet.height() - static_cast<std::uint32_t>(vertical)});
  if (out.empty()) {
    return std::unexpected(vc::PipelineError::InvalidFrame);
  }
  return out;
}

vc::CardImage crop_card(const vc::Frame& sheet, const vc::CardCell& cell) {
  return vc::CardImage{cell, sheet.crop(cell.bounds)};
}

std::expected<std::vector<vc::CardImage>, vc::PipelineError>
segment(const vc::Frame& sheet, const vc::GridSpec& grid) {
  auto cells = layout_cards(sheet.width(), sheet.height(), grid);
  if (!cells) {
    return std::unexpected(cells.error());
  }

  std::vector<vc::CardImage> cards;
  cards.reserve(cells->size());
  for (const auto& cell : *cells) {
    cards.push_back(crop_card(sheet, cell));
  }
  return cards;
}

}  // namespace votergrid::vision
