#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace siteguard::core {

/// Memory: Frame owns a single contiguous buffer (std::vector<std::byte>);
/// copies are deep, moves are cheap. Use data() for std::span views.
/// Thread-safety: distinct Frame instances are independent; sharing one Frame
/// across threads requires external synchronization.

/// Pixel layout / format.
enum class PixelFormat : std::uint8_t {
  Unknown,
  Grayscale8,
  RGB8,
  BGR8,
  RGBA8,
  BGRA8,
  Float32Planar,  // HWC float, 3 channels, model input
};

/// Single image or video frame: dimensions, format, and owned buffer.
class Frame {
 public:
  Frame() = default;

  Frame(std::uint32_t width,
        std::uint32_t height,
        PixelFormat format,
        std::vector<std::byte> buffer)
      : width_(width),
        height_(height),
        format_(format),
        buffer_(std::move(buffer)) {}

  [[nodiscard]] std::uint32_t width() const noexcept { return width_; }
  [[nodiscard]] std::uint32_t height() const noexcept { return height_; }
  [[nodiscard]] PixelFormat format() const noexcept { return format_; }

  [[nodiscard]] std::span<std::byte> data() noexcept {
    return std::span<std::byte>(buffer_.data(), buffer_.size());
  }
  [[nodiscard]] std::span<const std::byte> data() const noexcept {
    return std::span<const std::byte>(buffer_.data(), buffer_.size());
  }

  [[nodiscard]] bool empty() const noexcept { return buffer_.empty(); }
  [[nodiscard]] std::size_t size_bytes() const noexcept { return buffer_.size(); }

  /// True if dimensions are non-zero, the format is known and the buffer is
  /// large enough for them.
  [[nodiscard]] bool is_valid() const noexcept;

  /// Minimum bytes required for given dimensions and format (for validation).
  [[nodiscard]] static std::size_t min_bytes(std::uint32_t width,
                                             std::uint32_t height,
                                             PixelFormat format);

  /// Zero-filled frame of the given size and format.
  [[nodiscard]] static Frame blank(std::uint32_t width,
                                   std::uint32_t height,
                                   PixelFormat format);

 private:
  std::uint32_t width_{0};
  std::uint32_t height_{0};
  PixelFormat format_{PixelFormat::Unknown};
  std::vector<std::byte> buffer_;
};

}  // namespace siteguard::core
