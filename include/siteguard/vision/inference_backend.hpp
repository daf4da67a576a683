#pragma once

#include <siteguard/core/error.hpp>
#include <siteguard/core/frame.hpp>
#include <siteguard/vision/inference_result.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>

namespace siteguard::vision {

/// Fixed input size a model expects. The detector letterboxes source frames to it.
struct ModelInput {
  std::uint32_t width{0};
  std::uint32_t height{0};
};

/// Abstract object detector: Frame -> InferenceResult.
///
/// One backend is loaded per process and shared by every session, so infer()
/// must be safe to call concurrently. Errors: InvalidFrame for input the
/// model cannot take, InferenceFailed for a failed call on one frame,
/// DetectorUnavailable when the model can no longer serve any frame.
class IInferenceBackend {
 public:
  virtual ~IInferenceBackend() = default;

  [[nodiscard]] virtual std::expected<InferenceResult, siteguard::core::PipelineError>
  infer(const siteguard::core::Frame& input) const = 0;

  /// Optional: validate frame format/dimensions before infer. Default: accept.
  [[nodiscard]] virtual std::expected<void, siteguard::core::PipelineError>
  validate_input(const siteguard::core::Frame& /*input*/) const {
    return {};
  }

  /// Input size the model needs, or nullopt if it takes source frames as-is.
  [[nodiscard]] virtual std::optional<ModelInput> model_input() const {
    return std::nullopt;
  }

  /// Short human-readable description for model-info responses.
  [[nodiscard]] virtual std::string describe() const = 0;

  /// Optional: warmup run (e.g. dummy inference). Call once after construction. Default: no-op.
  virtual void warmup() {}
};

}  // namespace siteguard::vision
