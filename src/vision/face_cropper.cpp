#include <votergrid/vision/face_cropper.hpp>
#include <algorithm>
#include <cmath>

namespace votergrid::vision {

namespace vc = votergrid::core;

namespace {

bool unit_fraction(float v) { return v >= 0.f && v <= 1.f; }

// Ratios arrive as float (0.78f < 0.78); the epsilon keeps 0.78 * 400 at 312.
constexpr double kRatioEpsilon = 1e-4;

std::uint32_t scaled(double fraction, std::uint32_t extent) {
  const double px = std::floor(fraction * static_cast<double>(extent) + kRatioEpsilon);
  return static_cast<std::uint32_t>(std::clamp(px, 0.0, static_cast<double>(extent)));
}

}  // namespace

std::expected<vc::PixelRect, vc::PipelineError>
face_bounds(std::uint32_t width, std::uint32_t height, const vc::FaceRatios& ratios) {
  if (!unit_fraction(ratios.left) || !unit_fraction(ratios.top) ||
      !unit_fraction(ratios.width) || !unit_fraction(ratios.height)) {
    return std::unexpected(vc::PipelineError::InvalidConfig);
  }

  const std::uint32_t x0 = scaled(ratios.left, width);
  const std::uint32_t y0 = scaled(ratios.top, height);
  const std::uint32_t x1 = scaled(static_cast<double>(ratios.left) + ratios.width, width);
  const std::uint32_t y1 = scaled(static_cast<double>(ratios.top) + ratios.height, height);
  if (x1 <= x0 || y1 <= y0) {
    return std::unexpected(vc::PipelineError::InvalidConfig);
  }
  return vc::PixelRect{x0, y0, x1 - x0, y1 - y0};
}

std::expected<vc::Frame, vc::PipelineError>
crop_face(const vc::Frame& card, const vc::FaceRatios& ratios) {
  if (card.empty()) {
    return std::unexpected(vc::PipelineError::InvalidFrame);
  }
  auto bounds = face_bounds(card.width(), card.height(), ratios);
  if (!bounds) {
    return std::unexpected(bounds.error());
  }
  vc::Frame face = card.crop(*bounds);
  if (face.empty()) {
    return std::unexpected(vc::PipelineError::InvalidFrame);
  }
  return face;
}

}  // namespace votergrid::vision
