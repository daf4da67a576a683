#pragma once

#include <siteguard/core/error.hpp>
#include <siteguard/core/frame.hpp>
#include <siteguard/vision/inference_backend.hpp>
#include <siteguard/vision/inference_result.hpp>
#include <memory>
#include <string>

namespace siteguard::vision {

/// ONNX Runtime backend for YOLO detection models.
///
/// Input: one float image tensor, NCHW [1,3,H,W] or NHWC [1,H,W,3]. The
/// backend receives Float32Planar HWC frames of exactly W x H (the detector
/// letterboxes and normalises beforehand) and transposes to NCHW if needed.
///
/// Output: a single tensor, either
/// - raw YOLOv8 / YOLO11 head [1, 4+nc, N]: (cx, cy, w, h, score per class);
///   each candidate keeps its best class; or
/// - post-NMS [1, N, 6] / [1, 6, N]: (x1, y1, x2, y2, score, class_id).
/// Boxes are returned in model-input pixels as (x1, y1, x2, y2).
///
/// infer() may be called from several threads at once (ONNX Runtime sessions
/// allow concurrent Run()).
class OnnxInferenceBackend : public IInferenceBackend {
 public:
  /// \param model_path Path to the .onnx model file. Throws Ort::Exception if
  ///        it cannot be loaded, std::runtime_error on unsupported shapes.
  explicit OnnxInferenceBackend(std::string model_path);

  ~OnnxInferenceBackend() override;

  OnnxInferenceBackend(const OnnxInferenceBackend&) = delete;
  OnnxInferenceBackend& operator=(const OnnxInferenceBackend&) = delete;

  [[nodiscard]] std::expected<InferenceResult, siteguard::core::PipelineError>
  infer(const siteguard::core::Frame& input) const override;

  [[nodiscard]] std::expected<void, siteguard::core::PipelineError>
  validate_input(const siteguard::core::Frame& input) const override;

  [[nodiscard]] std::optional<ModelInput> model_input() const override;

  [[nodiscard]] std::string describe() const override;

  void warmup() override;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace siteguard::vision
