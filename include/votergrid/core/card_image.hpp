#pragma once

#include <votergrid/core/frame.hpp>
#include <votergrid/core/geometry.hpp>
#include <cstddef>
#include <cstdint>

namespace votergrid::core {

/// Position of one card cell inside a sheet. Cells are enumerated row-major.
struct CardCell {
  std::uint32_t row{0};
  std::uint32_t col{0};
  PixelRect bounds{};  // in sheet pixel coordinates
};

/// One card cut out of a sheet. Owns its pixels; consumed once by a card task.
struct CardImage {
  CardCell cell{};
  Frame image;

  [[nodiscard]] std::uint32_t row() const noexcept { return cell.row; }
  [[nodiscard]] std::uint32_t col() const noexcept { return cell.col; }
};

}  // namespace votergrid::core
