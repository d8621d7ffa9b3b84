#include <votergrid/core/frame.hpp>
#include <algorithm>
#include <cstddef>
#include <cstring>

namespace votergrid::core {

std::size_t bytes_per_pixel(PixelFormat format) noexcept {
  switch (format) {
    case PixelFormat::Grayscale8:
      return 1;
    case PixelFormat::RGB8:
    case PixelFormat::BGR8:
      return 3;
    case PixelFormat::RGBA8:
    case PixelFormat::BGRA8:
      return 4;
    case PixelFormat::Unknown:
    default:
      return 0;
  }
}

std::size_t Frame::min_bytes(std::uint32_t width,
                             std::uint32_t height,
                             PixelFormat format) {
  return static_cast<std::size_t>(width) * height * bytes_per_pixel(format);
}

Frame Frame::crop(const PixelRect& rect) const {
  const std::uint32_t x0 = std::min(rect.x, width_);
  const std::uint32_t y0 = std::min(rect.y, height_);
  const std::uint32_t x1 = x0 + std::min(rect.width, width_ - x0);
  const std::uint32_t y1 = y0 + std::min(rect.height, height_ - y0);
  if (x1 <= x0 || y1 <= y0) return Frame();
  if (buffer_.size() < min_bytes(width_, height_, format_)) return Frame();

  const std::size_t bpp = bytes_per_pixel(format_);
  const std::size_t src_stride = row_bytes();
  const std::size_t dst_stride = static_cast<std::size_t>(x1 - x0) * bpp;
  std::vector<std::byte> out(dst_stride * (y1 - y0));
  for (std::uint32_t y = y0; y < y1; ++y) {
    std::memcpy(out.data() + static_cast<std::size_t>(y - y0) * dst_stride,
                buffer_.data() + static_cast<std::size_t>(y) * src_stride + x0 * bpp,
                dst_stride);
  }
  return Frame(x1 - x0, y1 - y0, format_, std::move(out));
}

}  // namespace votergrid::core
