#include <siteguard/vision/load_image.hpp>
#include "frame_cv_utils.hpp"
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <cstdint>
#include <cstring>

namespace siteguard::vision {

namespace sc = siteguard::core;

namespace {

/// imencode/imwrite expect BGR channel order.
std::expected<cv::Mat, sc::PipelineError> to_bgr_mat(const sc::Frame& frame) {
  auto mat = detail::frame_to_mat(frame);
  if (!mat || frame.format() == sc::PixelFormat::Float32Planar) {
    return std::unexpected(sc::PipelineError::InvalidFrame);
  }
  cv::Mat bgr;
  switch (frame.format()) {
    case sc::PixelFormat::RGB8:
      cv::cvtColor(*mat, bgr, cv::COLOR_RGB2BGR);
      return bgr;
    case sc::PixelFormat::RGBA8:
      cv::cvtColor(*mat, bgr, cv::COLOR_RGBA2BGR);
      return bgr;
    case sc::PixelFormat::BGRA8:
      cv::cvtColor(*mat, bgr, cv::COLOR_BGRA2BGR);
      return bgr;
    default:
      return *mat;
  }
}

}  // namespace

std::expected<sc::Frame, sc::PipelineError> load_frame_from_image(const std::string& path) {
  cv::Mat mat = cv::imread(path, cv::IMREAD_COLOR);
  if (mat.empty()) {
    return std::unexpected(sc::PipelineError::LoadFailed);
  }
  return detail::mat_to_frame(mat, sc::PixelFormat::BGR8);
}

std::expected<sc::Frame, sc::PipelineError> decode_frame(std::span<const std::byte> encoded) {
  if (encoded.empty()) {
    return std::unexpected(sc::PipelineError::InvalidFrame);
  }
  const cv::Mat raw(1, static_cast<int>(encoded.size()), CV_8UC1,
                    const_cast<std::byte*>(encoded.data()));
  cv::Mat mat = cv::imdecode(raw, cv::IMREAD_COLOR);
  if (mat.empty()) {
    return std::unexpected(sc::PipelineError::InvalidFrame);
  }
  return detail::mat_to_frame(mat, sc::PixelFormat::BGR8);
}

std::expected<std::vector<std::byte>, sc::PipelineError>
encode_jpeg(const sc::Frame& frame, int quality) {
  auto bgr = to_bgr_mat(frame);
  if (!bgr) {
    return std::unexpected(bgr.error());
  }
  std::vector<std::uint8_t> buf;
  if (!cv::imencode(".jpg", *bgr, buf, {cv::IMWRITE_JPEG_QUALITY, quality})) {
    return std::unexpected(sc::PipelineError::InvalidFrame);
  }
  std::vector<std::byte> out(buf.size());
  std::memcpy(out.data(), buf.data(), buf.size());
  return out;
}

std::expected<void, sc::PipelineError> save_frame(const sc::Frame& frame, const std::string& path) {
  auto bgr = to_bgr_mat(frame);
  if (!bgr) {
    return std::unexpected(bgr.error());
  }
  if (!cv::imwrite(path, *bgr)) {
    return std::unexpected(sc::PipelineError::LoadFailed);
  }
  return {};
}

}  // namespace siteguard::vision
