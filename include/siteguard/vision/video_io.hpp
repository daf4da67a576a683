#pragma once

#include <siteguard/core/error.hpp>
#include <siteguard/core/frame.hpp>
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <string>

namespace cv {
class VideoCapture;
class VideoWriter;
}  // namespace cv

namespace siteguard::vision {

/// Sequential BGR8 frame reader over a video file.
class VideoReader {
 public:
  /// LoadFailed if the file cannot be opened as a video.
  [[nodiscard]] static std::expected<VideoReader, siteguard::core::PipelineError> open(
      const std::string& path);

  VideoReader(VideoReader&&) noexcept;
  VideoReader& operator=(VideoReader&&) noexcept;
  ~VideoReader();

  /// Next frame in decode order; nullopt at end of stream.
  [[nodiscard]] std::optional<siteguard::core::Frame> next();

  [[nodiscard]] double fps() const noexcept { return fps_; }
  [[nodiscard]] std::uint32_t width() const noexcept { return width_; }
  [[nodiscard]] std::uint32_t height() const noexcept { return height_; }
  /// Container's frame count; may be 0 or approximate.
  [[nodiscard]] std::int64_t frame_count() const noexcept { return frame_count_; }

 private:
  VideoReader() = default;

  std::unique_ptr<cv::VideoCapture> capture_;
  double fps_{0.0};
  std::uint32_t width_{0};
  std::uint32_t height_{0};
  std::int64_t frame_count_{0};
};

/// Video file writer. Tries avc1, H264, mp4v, then XVID and MJPG (.avi)
/// until one opens.
class VideoWriter {
 public:
  /// LoadFailed if no codec could be opened. path() is the file actually written.
  [[nodiscard]] static std::expected<VideoWriter, siteguard::core::PipelineError> open(
      const std::string& path, double fps, std::uint32_t width, std::uint32_t height);

  VideoWriter(VideoWriter&&) noexcept;
  VideoWriter& operator=(VideoWriter&&) noexcept;
  ~VideoWriter();

  /// Frame must match the writer size; RGB/RGBA frames are converted to BGR.
  [[nodiscard]] std::expected<void, siteguard::core::PipelineError> write(
      const siteguard::core::Frame& frame);

  [[nodiscard]] const std::string& path() const noexcept { return path_; }
  [[nodiscard]] const std::string& codec() const noexcept { return codec_; }

 private:
  VideoWriter() = default;

  std::unique_ptr<cv::VideoWriter> writer_;
  std::string path_;
  std::string codec_;
  std::uint32_t width_{0};
  std::uint32_t height_{0};
};

}  // namespace siteguard::vision
