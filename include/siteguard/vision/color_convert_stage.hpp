#pragma once

#include <siteguard/core/error.hpp>
#include <siteguard/core/frame.hpp>
#include <siteguard/core/pipeline_stage.hpp>
#include <expected>

namespace siteguard::vision {

/// Converts 8-bit frames to a 3-channel output format (BGR8 or RGB8).
/// Models trained on RGB need this ahead of letterboxing.
class ColorConvertStage : public siteguard::core::IPipelineStage {
 public:
  explicit ColorConvertStage(siteguard::core::PixelFormat output_format);

  [[nodiscard]] std::expected<siteguard::core::Frame, siteguard::core::PipelineError>
  process(const siteguard::core::Frame& input) const override;

 private:
  siteguard::core::PixelFormat output_format_;
};

}  // namespace siteguard::vision
