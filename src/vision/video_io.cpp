#include <siteguard/vision/video_io.hpp>
#include "frame_cv_utils.hpp"
#include <siteguard/core/logging.hpp>
#include <opencv2/imgproc.hpp>
#include <opencv2/videoio.hpp>
#include <array>
#include <cmath>
#include <filesystem>

namespace siteguard::vision {

namespace sc = siteguard::core;

namespace {

struct CodecChoice {
  const char* fourcc;
  const char* extension;
};

// MJPG is last: OpenCV ships its own MJPEG/AVI encoder, so it opens even
// without an ffmpeg or gstreamer backend.
constexpr std::array<CodecChoice, 5> kCodecs = {{
    {"avc1", ".mp4"},
    {"H264", ".mp4"},
    {"mp4v", ".mp4"},
    {"XVID", ".avi"},
    {"MJPG", ".avi"},
}};

}  // namespace

// --- VideoReader ---

std::expected<VideoReader, sc::PipelineError> VideoReader::open(const std::string& path) {
  VideoReader reader;
  reader.capture_ = std::make_unique<cv::VideoCapture>(path);
  if (!reader.capture_->isOpened()) {
    return std::unexpected(sc::PipelineError::LoadFailed);
  }
  reader.fps_ = reader.capture_->get(cv::CAP_PROP_FPS);
  if (!(reader.fps_ > 0.0) || !std::isfinite(reader.fps_)) reader.fps_ = 25.0;
  reader.width_ = static_cast<std::uint32_t>(reader.capture_->get(cv::CAP_PROP_FRAME_WIDTH));
  reader.height_ = static_cast<std::uint32_t>(reader.capture_->get(cv::CAP_PROP_FRAME_HEIGHT));
  reader.frame_count_ =
      static_cast<std::int64_t>(reader.capture_->get(cv::CAP_PROP_FRAME_COUNT));
  return reader;
}

VideoReader::VideoReader(VideoReader&&) noexcept = default;
VideoReader& VideoReader::operator=(VideoReader&&) noexcept = default;
VideoReader::~VideoReader() = default;

std::optional<sc::Frame> VideoReader::next() {
  if (!capture_) return std::nullopt;
  cv::Mat mat;
  if (!capture_->read(mat) || mat.empty()) {
    return std::nullopt;
  }
  return detail::mat_to_frame(mat, sc::PixelFormat::BGR8);
}

// --- VideoWriter ---

std::expected<VideoWriter, sc::PipelineError> VideoWriter::open(
    const std::string& path, double fps, std::uint32_t width, std::uint32_t height) {
  const sc::Logger log("video");
  const cv::Size size(static_cast<int>(width), static_cast<int>(height));

  for (const auto& c : kCodecs) {
    std::filesystem::path candidate(path);
    candidate.replace_extension(c.extension);

    auto w = std::make_unique<cv::VideoWriter>();
    const int fourcc = cv::VideoWriter::fourcc(c.fourcc[0], c.fourcc[1], c.fourcc[2], c.fourcc[3]);
    if (!w->open(candidate.string(), fourcc, fps, size) || !w->isOpened()) {
      log.debug(std::string("codec ") + c.fourcc + " unavailable");
      continue;
    }

    VideoWriter writer;
    writer.writer_ = std::move(w);
    writer.path_ = candidate.string();
    writer.codec_ = c.fourcc;
    writer.width_ = width;
    writer.height_ = height;
    log.info("writing " + writer.path_ + " with codec " + writer.codec_);
    return writer;
  }
  log.error("no video codec could be opened for " + path);
  return std::unexpected(sc::PipelineError::LoadFailed);
}

VideoWriter::VideoWriter(VideoWriter&&) noexcept = default;
VideoWriter& VideoWriter::operator=(VideoWriter&&) noexcept = default;
VideoWriter::~VideoWriter() = default;

std::expected<void, sc::PipelineError> VideoWriter::write(const sc::Frame& frame) {
  if (!writer_ || frame.width() != width_ || frame.height() != height_) {
    return std::unexpected(sc::PipelineError::InvalidFrame);
  }
  auto mat = detail::frame_to_mat(frame);
  if (!mat) {
    return std::unexpected(sc::PipelineError::InvalidFrame);
  }
  switch (frame.format()) {
    case sc::PixelFormat::BGR8:
      writer_->write(*mat);
      return {};
    case sc::PixelFormat::RGB8: {
      cv::Mat bgr;
      cv::cvtColor(*mat, bgr, cv::COLOR_RGB2BGR);
      writer_->write(bgr);
      return {};
    }
    case sc::PixelFormat::RGBA8:
    case sc::PixelFormat::BGRA8: {
      cv::Mat bgr;
      cv::cvtColor(*mat, bgr,
                   frame.format() == sc::PixelFormat::RGBA8 ? cv::COLOR_RGBA2BGR
                                                           : cv::COLOR_BGRA2BGR);
      writer_->write(bgr);
      return {};
    }
    default:
      return std::unexpected(sc::PipelineError::InvalidFrame);
  }
}

}  // namespace siteguard::vision
