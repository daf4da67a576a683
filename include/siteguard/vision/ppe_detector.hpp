#pragma once

#include <siteguard/core/detection.hpp>
#include <siteguard/core/error.hpp>
#include <siteguard/core/frame.hpp>
#include <siteguard/core/pipeline.hpp>
#include <siteguard/vision/detection_decoder.hpp>
#include <siteguard/vision/inference_backend.hpp>
#include <expected>
#include <memory>
#include <optional>
#include <vector>

namespace siteguard::vision {

/// Detection adapter: source frame -> filtered Detections in frame pixels.
///
/// If the backend declares a model input size, frames are converted to RGB,
/// letterboxed and normalised to [0, 1] first, and boxes are mapped back to
/// the source frame. Otherwise the frame goes to the backend unchanged.
///
/// detect() is const and holds no per-call state; one detector (and its
/// backend) is shared by all sessions.
class PpeDetector {
 public:
  PpeDetector(std::shared_ptr<const IInferenceBackend> backend, DetectionDecoder decoder);

  /// Errors: InvalidFrame (unreadable input), InferenceFailed (this frame
  /// failed), DetectorUnavailable (backend gone), DecoderError.
  [[nodiscard]] std::expected<std::vector<siteguard::core::Detection>,
                              siteguard::core::PipelineError>
  detect(const siteguard::core::Frame& frame,
         const siteguard::core::StageTimingCallback* timing_cb = nullptr) const;

  [[nodiscard]] const DetectionDecoder& decoder() const noexcept { return decoder_; }
  [[nodiscard]] const IInferenceBackend& backend() const noexcept { return *backend_; }
  [[nodiscard]] std::size_t preprocess_stage_count() const noexcept {
    return preprocess_.stage_count();
  }

 private:
  std::shared_ptr<const IInferenceBackend> backend_;
  DetectionDecoder decoder_;
  std::optional<ModelInput> model_input_;
  siteguard::core::Pipeline preprocess_;
};

}  // namespace siteguard::vision
