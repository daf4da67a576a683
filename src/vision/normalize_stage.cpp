#include <siteguard/vision/normalize_stage.hpp>
#include "frame_cv_utils.hpp"
#include <opencv2/core.hpp>

namespace siteguard::vision {

namespace sc = siteguard::core;

NormalizeStage::NormalizeStage(float mean, float scale)
    : mean_(mean), scale_(scale) {}

std::expected<sc::Frame, sc::PipelineError>
NormalizeStage::process(const sc::Frame& input) const {
  const auto fmt = input.format();
  if (fmt != sc::PixelFormat::RGB8 && fmt != sc::PixelFormat::BGR8) {
    return std::unexpected(sc::PipelineError::InvalidFrame);
  }
  auto mat_in = detail::frame_to_mat(input);
  if (!mat_in) {
    return std::unexpected(sc::PipelineError::InvalidFrame);
  }

  cv::Mat mat_float;
  mat_in->convertTo(mat_float, CV_32FC3, scale_, -mean_ * scale_);
  return detail::mat_to_frame(mat_float, sc::PixelFormat::Float32Planar);
}

}  // namespace siteguard::vision
