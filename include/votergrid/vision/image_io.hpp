#pragma once

#include <votergrid/core/frame.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace votergrid::vision {

/// Load an image file into a Frame (BGR8 or Grayscale8). Returns nullopt on failure.
std::optional<votergrid::core::Frame> load_frame_from_image(const std::string& path);

/// Decode an in-memory JPEG/PNG/WebP buffer into a Frame (BGR8 or Grayscale8).
std::optional<votergrid::core::Frame> decode_frame(std::span<const std::uint8_t> bytes);

/// Encode a Frame as PNG. Returns nullopt if the frame is empty, malformed or
/// the encoder refuses it.
std::optional<std::vector<std::uint8_t>> encode_png(const votergrid::core::Frame& frame);

}  // namespace votergrid::vision
