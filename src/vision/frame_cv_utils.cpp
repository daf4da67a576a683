#include "frame_cv_utils.hpp"
#include <siteguard/core/frame.hpp>
#include <opencv2/core.hpp>
#include <cstddef>
#include <cstring>
#include <vector>

namespace siteguard::vision::detail {

namespace sc = siteguard::core;

namespace {

int mat_type(sc::PixelFormat format) {
  switch (format) {
    case sc::PixelFormat::Grayscale8:
      return CV_8UC1;
    case sc::PixelFormat::RGB8:
    case sc::PixelFormat::BGR8:
      return CV_8UC3;
    case sc::PixelFormat::RGBA8:
    case sc::PixelFormat::BGRA8:
      return CV_8UC4;
    case sc::PixelFormat::Float32Planar:
      return CV_32FC3;
    case sc::PixelFormat::Unknown:
    default:
      return -1;
  }
}

}  // namespace

std::optional<cv::Mat> frame_to_mat(const sc::Frame& frame) {
  // Mat headers have no const form; callers of this overload only read.
  return frame_to_mat(const_cast<sc::Frame&>(frame));
}

std::optional<cv::Mat> frame_to_mat(sc::Frame& frame) {
  if (!frame.is_valid()) return std::nullopt;
  const int type = mat_type(frame.format());
  if (type < 0) return std::nullopt;

  const int w = static_cast<int>(frame.width());
  const int h = static_cast<int>(frame.height());
  const std::size_t step = frame.size_bytes() / static_cast<std::size_t>(h);
  return cv::Mat(h, w, type, frame.data().data(), step);
}

sc::Frame mat_to_frame(const cv::Mat& mat, sc::PixelFormat format) {
  if (mat.empty()) return sc::Frame();

  const cv::Mat packed = mat.isContinuous() ? mat : mat.clone();
  const std::uint32_t w = static_cast<std::uint32_t>(packed.cols);
  const std::uint32_t h = static_cast<std::uint32_t>(packed.rows);
  const std::size_t len = packed.total() * packed.elemSize();
  std::vector<std::byte> buffer(len);
  std::memcpy(buffer.data(), packed.ptr(), len);
  return sc::Frame(w, h, format, std::move(buffer));
}

}  // namespace siteguard::vision::detail
