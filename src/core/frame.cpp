#include <siteguard/core/frame.hpp>
#include <cstddef>

namespace siteguard::core {

std::size_t Frame::min_bytes(std::uint32_t width,
                             std::uint32_t height,
                             PixelFormat format) {
  const std::size_t pixels = static_cast<std::size_t>(width) * height;
  switch (format) {
    case PixelFormat::Grayscale8:
      return pixels;
    case PixelFormat::RGB8:
    case PixelFormat::BGR8:
      return pixels * 3;
    case PixelFormat::RGBA8:
    case PixelFormat::BGRA8:
      return pixels * 4;
    case PixelFormat::Float32Planar:
      return pixels * 3 * sizeof(float);  // HWC, 3 channels
    case PixelFormat::Unknown:
    default:
      return 0;
  }
}

bool Frame::is_valid() const noexcept {
  if (width_ == 0 || height_ == 0 || format_ == PixelFormat::Unknown) {
    return false;
  }
  return buffer_.size() >= min_bytes(width_, height_, format_);
}

Frame Frame::blank(std::uint32_t width, std::uint32_t height, PixelFormat format) {
  std::vector<std::byte> buffer(min_bytes(width, height, format), std::byte{0});
  return Frame(width, height, format, std::move(buffer));
}

}  // namespace siteguard::core
