#pragma once

#include <siteguard/core/detection.hpp>
#include <siteguard/vision/inference_backend.hpp>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

namespace siteguard::vision {

/// Deterministic fake detector for tests and the demo CLI.
///
/// Class ids are ObjectLabel ordinals (see DetectionDecoder::label_order_class_map).
/// Each infer() call consumes the next scripted entry if any, otherwise
/// returns the fixed detection list. Thread-safe.
class MockInferenceBackend : public IInferenceBackend {
 public:
  /// Detections returned whenever the script is empty.
  void set_detections(std::vector<siteguard::core::Detection> detections);

  /// Queue one detection list per future infer() call (one per video frame).
  void push_frame(std::vector<siteguard::core::Detection> detections);

  /// Queue a failing call (InferenceFailed, DetectorUnavailable, ...).
  void push_failure(siteguard::core::PipelineError error);

  /// Every call from now on fails with error (detector lost).
  void fail_always(siteguard::core::PipelineError error);

  [[nodiscard]] std::size_t call_count() const;

  [[nodiscard]] std::expected<InferenceResult, siteguard::core::PipelineError>
  infer(const siteguard::core::Frame& input) const override;

  [[nodiscard]] std::expected<void, siteguard::core::PipelineError>
  validate_input(const siteguard::core::Frame& input) const override;

  [[nodiscard]] std::string describe() const override { return "mock"; }

 private:
  struct Step {
    std::vector<siteguard::core::Detection> detections;
    siteguard::core::PipelineError error{siteguard::core::PipelineError::None};
  };

  mutable std::mutex mutex_;
  std::vector<siteguard::core::Detection> detections_;
  mutable std::deque<Step> script_;
  std::optional<siteguard::core::PipelineError> permanent_error_;
  mutable std::size_t calls_{0};
};

}  // namespace siteguard::vision
