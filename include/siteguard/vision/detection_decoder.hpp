#pragma once

#include <siteguard/core/detection.hpp>
#include <siteguard/vision/inference_result.hpp>
#include <cstdint>
#include <optional>
#include <vector>

namespace siteguard::vision {

/// Maps model class id to ObjectLabel; nullopt entries are ignored classes.
using ClassToLabelMap = std::vector<std::optional<siteguard::core::ObjectLabel>>;

/// Decodes InferenceResult -> vector<Detection> with confidence threshold and optional NMS.
class DetectionDecoder {
 public:
  /// nms_iou_threshold <= 0 disables NMS.
  DetectionDecoder(float confidence_threshold,
                   ClassToLabelMap class_to_label,
                   float nms_iou_threshold = 0.f);

  /// Detections in result order; ignored classes and low scores dropped.
  [[nodiscard]] std::vector<siteguard::core::Detection> decode(
      const InferenceResult& result) const;

  void set_confidence_threshold(float t) noexcept { confidence_threshold_ = t; }
  [[nodiscard]] float confidence_threshold() const noexcept {
    return confidence_threshold_;
  }
  [[nodiscard]] float nms_iou_threshold() const noexcept { return nms_iou_threshold_; }
  [[nodiscard]] const ClassToLabelMap& class_map() const noexcept { return class_to_label_; }

  /// Class id == ObjectLabel ordinal (Helmet, Vest, Mask, Person).
  [[nodiscard]] static ClassToLabelMap label_order_class_map();

  /// Construction-site PPE model: 0 Hardhat, 1 Mask, 2 NO-Hardhat, 3 NO-Mask,
  /// 4 NO-Safety Vest, 5 Person, 6 Safety Cone, 7 Safety Vest, 8 machinery, 9 vehicle.
  [[nodiscard]] static ClassToLabelMap ppe_model_class_map();

 private:
  float confidence_threshold_;
  ClassToLabelMap class_to_label_;
  float nms_iou_threshold_;
};

}  // namespace siteguard::vision
