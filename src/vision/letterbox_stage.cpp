#include <siteguard/vision/letterbox_stage.hpp>
#include "frame_cv_utils.hpp"
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>

namespace siteguard::vision {

namespace sc = siteguard::core;

namespace {

constexpr double kPadValue = 114.0;

std::uint32_t scaled_side(std::uint32_t src, float scale, std::uint32_t dst) noexcept {
  const auto side = static_cast<std::uint32_t>(std::lround(static_cast<float>(src) * scale));
  return std::clamp<std::uint32_t>(side, 1u, dst);
}

}  // namespace

sc::BBox LetterboxGeometry::to_source(const sc::BBox& model_box) const noexcept {
  if (scale <= 0.f) return {};
  return {(model_box.x - pad_x) / scale, (model_box.y - pad_y) / scale,
          model_box.w / scale, model_box.h / scale};
}

LetterboxGeometry letterbox_geometry(std::uint32_t src_width,
                                     std::uint32_t src_height,
                                     std::uint32_t dst_width,
                                     std::uint32_t dst_height) noexcept {
  LetterboxGeometry g;
  if (src_width == 0 || src_height == 0 || dst_width == 0 || dst_height == 0) return g;

  g.scale = std::min(static_cast<float>(dst_width) / static_cast<float>(src_width),
                     static_cast<float>(dst_height) / static_cast<float>(src_height));
  g.resized_width = scaled_side(src_width, g.scale, dst_width);
  g.resized_height = scaled_side(src_height, g.scale, dst_height);
  g.pad_x = std::floor(static_cast<float>(dst_width - g.resized_width) / 2.f);
  g.pad_y = std::floor(static_cast<float>(dst_height - g.resized_height) / 2.f);
  return g;
}

LetterboxStage::LetterboxStage(std::uint32_t target_width,
                               std::uint32_t target_height)
    : target_width_(target_width), target_height_(target_height) {}

std::expected<sc::Frame, sc::PipelineError>
LetterboxStage::process(const sc::Frame& input) const {
  if (input.format() == sc::PixelFormat::Float32Planar) {
    return std::unexpected(sc::PipelineError::InvalidFrame);
  }
  auto mat_in = detail::frame_to_mat(input);
  if (!mat_in) {
    return std::unexpected(sc::PipelineError::InvalidFrame);
  }

  if (target_width_ == 0 || target_height_ == 0) {
    return std::unexpected(sc::PipelineError::InvalidConfig);
  }
  if (input.width() == target_width_ && input.height() == target_height_) {
    return input;
  }

  const auto g = letterbox_geometry(input.width(), input.height(), target_width_, target_height_);
  const int new_w = static_cast<int>(g.resized_width);
  const int new_h = static_cast<int>(g.resized_height);

  cv::Mat resized;
  cv::resize(*mat_in, resized, cv::Size(new_w, new_h), 0, 0, cv::INTER_LINEAR);

  const int left = static_cast<int>(g.pad_x);
  const int top = static_cast<int>(g.pad_y);
  const int right = static_cast<int>(target_width_) - new_w - left;
  const int bottom = static_cast<int>(target_height_) - new_h - top;

  cv::Mat boxed;
  cv::copyMakeBorder(resized, boxed, top, bottom, left, right, cv::BORDER_CONSTANT,
                     cv::Scalar::all(kPadValue));
  return detail::mat_to_frame(boxed, input.format());
}

}  // namespace siteguard::vision
