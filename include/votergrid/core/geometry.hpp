#pragma once

#include <cstddef>
#include <cstdint>

namespace votergrid::core {

/// Axis-aligned pixel rectangle: [x, x + width) x [y, y + height).
struct PixelRect {
  std::uint32_t x{0};
  std::uint32_t y{0};
  std::uint32_t width{0};
  std::uint32_t height{0};

  [[nodiscard]] bool empty() const noexcept { return width == 0 || height == 0; }
  [[nodiscard]] std::uint32_t right() const noexcept { return x + width; }
  [[nodiscard]] std::uint32_t bottom() const noexcept { return y + height; }

  friend bool operator==(const PixelRect&, const PixelRect&) = default;
};

/// Card grid shape of one sheet. Signed so that bad input can be reported
/// instead of wrapping.
struct GridSpec {
  int rows{10};
  int cols{3};

  [[nodiscard]] bool valid() const noexcept { return rows > 0 && cols > 0; }
  [[nodiscard]] std::size_t card_count() const noexcept {
    return valid() ? static_cast<std::size_t>(rows) * static_cast<std::size_t>(cols) : 0;
  }
};

/// Pixels trimmed from each edge of a sheet before it is split into cards
/// (printed page header, footer and side gutters).
struct SheetMargins {
  std::uint32_t top{0};
  std::uint32_t left{0};
  std::uint32_t right{0};
  std::uint32_t bottom{0};
};

/// Face position inside a card as fractions of the card size.
/// Defaults match the state voter-roll card template (photo at the right edge).
struct FaceRatios {
  float left{0.78f};
  float top{0.30f};
  float width{0.20f};
  float height{0.55f};
};

}  // namespace votergrid::core
