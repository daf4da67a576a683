#include <siteguard/vision/mock_inference_backend.hpp>
#include <siteguard/core/detection.hpp>
#include <siteguard/core/error.hpp>
#include <cstdint>
#include <vector>

namespace siteguard::vision {

namespace {

InferenceResult to_result(const std::vector<siteguard::core::Detection>& detections) {
  InferenceResult r;
  r.num_detections = static_cast<std::uint32_t>(detections.size());
  for (const auto& d : detections) {
    r.boxes.push_back(d.bbox.x);
    r.boxes.push_back(d.bbox.y);
    r.boxes.push_back(d.bbox.right());
    r.boxes.push_back(d.bbox.bottom());
    r.scores.push_back(d.confidence);
    r.class_ids.push_back(static_cast<std::int64_t>(static_cast<std::uint8_t>(d.label)));
  }
  return r;
}

}  // namespace

void MockInferenceBackend::set_detections(
    std::vector<siteguard::core::Detection> detections) {
  std::lock_guard lock(mutex_);
  detections_ = std::move(detections);
}

void MockInferenceBackend::push_frame(std::vector<siteguard::core::Detection> detections) {
  std::lock_guard lock(mutex_);
  script_.push_back(Step{std::move(detections), siteguard::core::PipelineError::None});
}

void MockInferenceBackend::push_failure(siteguard::core::PipelineError error) {
  std::lock_guard lock(mutex_);
  script_.push_back(Step{{}, error});
}

void MockInferenceBackend::fail_always(siteguard::core::PipelineError error) {
  std::lock_guard lock(mutex_);
  permanent_error_ = error;
}

std::size_t MockInferenceBackend::call_count() const {
  std::lock_guard lock(mutex_);
  return calls_;
}

std::expected<InferenceResult, siteguard::core::PipelineError>
MockInferenceBackend::infer(const siteguard::core::Frame& /*input*/) const {
  std::lock_guard lock(mutex_);
  ++calls_;
  if (permanent_error_) {
    return std::unexpected(*permanent_error_);
  }
  if (script_.empty()) {
    return to_result(detections_);
  }
  Step step = std::move(script_.front());
  script_.pop_front();
  if (step.error != siteguard::core::PipelineError::None) {
    return std::unexpected(step.error);
  }
  return to_result(step.detections);
}

std::expected<void, siteguard::core::PipelineError>
MockInferenceBackend::validate_input(const siteguard::core::Frame& input) const {
  if (input.empty()) {
    return std::unexpected(siteguard::core::PipelineError::InvalidFrame);
  }
  return {};
}

}  // namespace siteguard::vision
