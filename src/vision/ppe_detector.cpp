#include <siteguard/vision/ppe_detector.hpp>
#include <siteguard/vision/color_convert_stage.hpp>
#include <siteguard/vision/letterbox_stage.hpp>
#include <siteguard/vision/normalize_stage.hpp>
#include <stdexcept>

namespace siteguard::vision {

namespace sc = siteguard::core;

PpeDetector::PpeDetector(std::shared_ptr<const IInferenceBackend> backend,
                         DetectionDecoder decoder)
    : backend_(std::move(backend)), decoder_(std::move(decoder)) {
  if (!backend_) {
    throw std::invalid_argument("PpeDetector: backend is null");
  }
  model_input_ = backend_->model_input();
  if (model_input_) {
    preprocess_.add_stage(std::make_unique<ColorConvertStage>(sc::PixelFormat::RGB8));
    preprocess_.add_stage(
        std::make_unique<LetterboxStage>(model_input_->width, model_input_->height));
    preprocess_.add_stage(std::make_unique<NormalizeStage>(0.f, 1.f / 255.f));
  }
}

std::expected<std::vector<sc::Detection>, sc::PipelineError>
PpeDetector::detect(const sc::Frame& frame, const sc::StageTimingCallback* timing_cb) const {
  if (!frame.is_valid() || frame.format() == sc::PixelFormat::Float32Planar) {
    return std::unexpected(sc::PipelineError::InvalidFrame);
  }

  auto prepared = preprocess_.run(frame, timing_cb);
  if (!prepared) {
    return std::unexpected(prepared.error());
  }
  auto valid = backend_->validate_input(*prepared);
  if (!valid) {
    return std::unexpected(valid.error());
  }
  auto raw = backend_->infer(*prepared);
  if (!raw) {
    return std::unexpected(raw.error());
  }

  std::vector<sc::Detection> detections = decoder_.decode(*raw);
  if (model_input_) {
    const auto g = letterbox_geometry(frame.width(), frame.height(),
                                      model_input_->width, model_input_->height);
    const float fw = static_cast<float>(frame.width());
    const float fh = static_cast<float>(frame.height());
    for (auto& d : detections) {
      d.bbox = sc::clamp_to(g.to_source(d.bbox), fw, fh);
    }
  }
  return detections;
}

}  // namespace siteguard::vision
