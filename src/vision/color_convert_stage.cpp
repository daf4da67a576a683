#include <siteguard/vision/color_convert_stage.hpp>
#include "frame_cv_utils.hpp"
#include <opencv2/imgproc.hpp>

namespace siteguard::vision {

namespace sc = siteguard::core;

namespace {

/// cv::cvtColor code for in -> out, or -1 when unsupported.
int conversion_code(sc::PixelFormat in, sc::PixelFormat out) {
  using sc::PixelFormat;
  if (out == PixelFormat::RGB8) {
    switch (in) {
      case PixelFormat::BGR8: return cv::COLOR_BGR2RGB;
      case PixelFormat::BGRA8: return cv::COLOR_BGRA2RGB;
      case PixelFormat::RGBA8: return cv::COLOR_RGBA2RGB;
      case PixelFormat::Grayscale8: return cv::COLOR_GRAY2RGB;
      default: return -1;
    }
  }
  if (out == PixelFormat::BGR8) {
    switch (in) {
      case PixelFormat::RGB8: return cv::COLOR_RGB2BGR;
      case PixelFormat::RGBA8: return cv::COLOR_RGBA2BGR;
      case PixelFormat::BGRA8: return cv::COLOR_BGRA2BGR;
      case PixelFormat::Grayscale8: return cv::COLOR_GRAY2BGR;
      default: return -1;
    }
  }
  return -1;
}

}  // namespace

ColorConvertStage::ColorConvertStage(sc::PixelFormat output_format)
    : output_format_(output_format) {}

std::expected<sc::Frame, sc::PipelineError>
ColorConvertStage::process(const sc::Frame& input) const {
  if (input.format() == output_format_) {
    return input;
  }
  auto mat_in = detail::frame_to_mat(input);
  if (!mat_in) {
    return std::unexpected(sc::PipelineError::InvalidFrame);
  }
  const int code = conversion_code(input.format(), output_format_);
  if (code < 0) {
    return std::unexpected(sc::PipelineError::InvalidFrame);
  }

  cv::Mat mat_out;
  cv::cvtColor(*mat_in, mat_out, code);
  return detail::mat_to_frame(mat_out, output_format_);
}

}  // namespace siteguard::vision
