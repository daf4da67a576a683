#pragma once

#include <siteguard/core/alarm.hpp>
#include <siteguard/core/association.hpp>
#include <siteguard/core/compliance.hpp>
#include <siteguard/core/error.hpp>
#include <siteguard/core/logging.hpp>
#include <siteguard/vision/detection_decoder.hpp>
#include <siteguard/vision/frame_annotator.hpp>
#include <cstdint>
#include <expected>
#include <string>

namespace siteguard::app {

/// Inference backend type: mock (synthetic) or onnx (real model).
enum class InferenceBackendType {
  Mock,
  Onnx,
};

/// Full service configuration: detector, policy, association, alarm, drawing.
struct SiteGuardConfig {
  std::string model_path;
  InferenceBackendType backend_type{InferenceBackendType::Mock};
  float confidence_threshold{0.5f};
  float nms_iou_threshold{0.45f};  // ONNX backend only
  siteguard::vision::ClassToLabelMap class_map{
      siteguard::vision::DetectionDecoder::ppe_model_class_map()};

  siteguard::core::CompliancePolicy policy{};
  siteguard::core::AssociationConfig association{};
  siteguard::core::AlarmConfig alarm{};
  siteguard::vision::AnnotatorOptions annotator{};

  siteguard::core::LogLevel log_level{siteguard::core::LogLevel::Info};
};

/// Default config when no file is provided.
[[nodiscard]] SiteGuardConfig default_config();

/// Load config from a simple key=value file (one per line, '#' comments) on
/// top of default_config(). LoadFailed if the file cannot be opened,
/// InvalidConfig on malformed values. Unknown keys are ignored.
[[nodiscard]] std::expected<SiteGuardConfig, siteguard::core::PipelineError> load_config(
    const std::string& path);

/// Apply one key=value pair. InvalidConfig on malformed value.
[[nodiscard]] std::expected<void, siteguard::core::PipelineError> apply_config_value(
    SiteGuardConfig& config, const std::string& key, const std::string& value);

/// Range and consistency checks; InvalidConfig on failure.
[[nodiscard]] std::expected<void, siteguard::core::PipelineError> validate_config(
    const SiteGuardConfig& config);

}  // namespace siteguard::app
