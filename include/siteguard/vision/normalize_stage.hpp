#pragma once

#include <siteguard/core/error.hpp>
#include <siteguard/core/frame.hpp>
#include <siteguard/core/pipeline_stage.hpp>
#include <expected>

namespace siteguard::vision {

/// 3-channel u8 frame -> Float32Planar (HWC): (pixel - mean) * scale.
class NormalizeStage : public siteguard::core::IPipelineStage {
 public:
  NormalizeStage(float mean, float scale);

  [[nodiscard]] std::expected<siteguard::core::Frame, siteguard::core::PipelineError>
  process(const siteguard::core::Frame& input) const override;

 private:
  float mean_;
  float scale_;
};

}  // namespace siteguard::vision
