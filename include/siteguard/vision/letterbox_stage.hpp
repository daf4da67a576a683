#pragma once

#include <siteguard/core/detection.hpp>
#include <siteguard/core/error.hpp>
#include <siteguard/core/frame.hpp>
#include <siteguard/core/pipeline_stage.hpp>
#include <cstdint>
#include <expected>

namespace siteguard::vision {

/// Placement of a source frame inside the letterboxed model input.
struct LetterboxGeometry {
  float scale{1.f};
  float pad_x{0.f};
  float pad_y{0.f};
  std::uint32_t resized_width{0};   // scaled content size, at least 1x1 for a non-empty source
  std::uint32_t resized_height{0};

  /// Maps a box from model-input pixels back to source-frame pixels.
  [[nodiscard]] siteguard::core::BBox to_source(const siteguard::core::BBox& model_box) const noexcept;
};

/// Aspect-preserving scale factor and centred padding for src -> dst.
[[nodiscard]] LetterboxGeometry letterbox_geometry(std::uint32_t src_width,
                                                   std::uint32_t src_height,
                                                   std::uint32_t dst_width,
                                                   std::uint32_t dst_height) noexcept;

/// Resizes an 8-bit frame into a fixed model input keeping aspect ratio;
/// the border is filled with grey (114), as YOLO models expect.
/// Extreme aspect ratios keep at least one pixel of content per side.
class LetterboxStage : public siteguard::core::IPipelineStage {
 public:
  LetterboxStage(std::uint32_t target_width, std::uint32_t target_height);

  [[nodiscard]] std::expected<siteguard::core::Frame, siteguard::core::PipelineError>
  process(const siteguard::core::Frame& input) const override;

 private:
  std::uint32_t target_width_;
  std::uint32_t target_height_;
};

}  // namespace siteguard::vision
