#include <siteguard/app/detector_factory.hpp>
#include <siteguard/core/logging.hpp>
#include <siteguard/vision/detection_decoder.hpp>
#include <siteguard/vision/mock_inference_backend.hpp>
#ifdef SITEGUARD_HAS_ONNXRUNTIME
#include <siteguard/vision/onnx_inference_backend.hpp>
#endif
#include <exception>
#include <string>

namespace siteguard::app {

namespace sc = siteguard::core;
namespace sv = siteguard::vision;

std::expected<std::shared_ptr<sv::IInferenceBackend>, sc::PipelineError> make_backend(
    const SiteGuardConfig& config) {
  const sc::Logger log("detector");
  if (config.backend_type == InferenceBackendType::Mock) {
    return std::make_shared<sv::MockInferenceBackend>();
  }

#ifdef SITEGUARD_HAS_ONNXRUNTIME
  if (config.model_path.empty()) {
    log.error("backend_type=onnx requires model_path");
    return std::unexpected(sc::PipelineError::InvalidConfig);
  }
  try {
    auto onnx = std::make_shared<sv::OnnxInferenceBackend>(config.model_path);
    onnx->warmup();
    return onnx;
  } catch (const std::exception& e) {
    log.error("cannot load model " + config.model_path + ": " + e.what());
    return std::unexpected(sc::PipelineError::DetectorUnavailable);
  }
#else
  log.error("onnx backend not available (build with -DSITEGUARD_USE_ONNXRUNTIME=ON)");
  return std::unexpected(sc::PipelineError::InvalidConfig);
#endif
}

std::shared_ptr<const sv::PpeDetector> make_detector(
    const SiteGuardConfig& config,
    std::shared_ptr<const sv::IInferenceBackend> backend) {
  if (config.backend_type == InferenceBackendType::Mock) {
    sv::DetectionDecoder decoder(config.confidence_threshold,
                                 sv::DetectionDecoder::label_order_class_map());
    return std::make_shared<const sv::PpeDetector>(std::move(backend), std::move(decoder));
  }
  sv::DetectionDecoder decoder(config.confidence_threshold, config.class_map,
                               config.nms_iou_threshold);
  return std::make_shared<const sv::PpeDetector>(std::move(backend), std::move(decoder));
}

}  // namespace siteguard::app
