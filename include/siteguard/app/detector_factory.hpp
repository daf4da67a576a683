#pragma once

#include <siteguard/app/config.hpp>
#include <siteguard/core/error.hpp>
#include <siteguard/vision/inference_backend.hpp>
#include <siteguard/vision/ppe_detector.hpp>
#include <expected>
#include <memory>

namespace siteguard::app {

/// Load the backend named by the config (once per process).
/// Mock: an empty MockInferenceBackend. Onnx: loads model_path; a model that
/// cannot be loaded yields DetectorUnavailable, a build without ONNX Runtime
/// yields InvalidConfig.
[[nodiscard]] std::expected<std::shared_ptr<siteguard::vision::IInferenceBackend>,
                            siteguard::core::PipelineError>
make_backend(const SiteGuardConfig& config);

/// Wrap a backend in the detection adapter with the config's thresholds.
/// The mock backend speaks label ordinals and skips NMS; the ONNX backend
/// uses config.class_map and config.nms_iou_threshold.
[[nodiscard]] std::shared_ptr<const siteguard::vision::PpeDetector> make_detector(
    const SiteGuardConfig& config,
    std::shared_ptr<const siteguard::vision::IInferenceBackend> backend);

}  // namespace siteguard::app
