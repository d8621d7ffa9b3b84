#pragma once

#include <votergrid/core/error.hpp>
#include <votergrid/core/frame.hpp>
#include <votergrid/core/geometry.hpp>
#include <expected>

namespace votergrid::vision {

/// Pixel rectangle selected by \p ratios inside a width x height card, clamped
/// to the card. InvalidConfig if any ratio is outside [0, 1] or the clamped
/// region is empty.
[[nodiscard]] std::expected<votergrid::core::PixelRect, votergrid::core::PipelineError>
face_bounds(std::uint32_t width, std::uint32_t height, const votergrid::core::FaceRatios& ratios);

/// Cuts the photo area out of a card. Purely geometric: nothing checks that a
/// face is actually there. The returned frame owns its pixels.
[[nodiscard]] std::expected<votergrid::core::Frame, votergrid::core::PipelineError>
crop_face(const votergrid::core::Frame& card, const votergrid::core::FaceRatios& ratios);

}  // namespace votergrid::vision
