#include <siteguard/vision/detection_decoder.hpp>
#include <siteguard/core/detection.hpp>
#include <opencv2/dnn.hpp>
#include <algorithm>
#include <array>
#include <cstddef>

namespace siteguard::vision {

namespace sc = siteguard::core;

namespace {

/// Class-aware NMS; survivors keep their original relative order.
std::vector<sc::Detection> suppress(const std::vector<sc::Detection>& in, float iou_threshold) {
  std::array<std::vector<std::size_t>, sc::kObjectLabelCount> by_label;
  for (std::size_t i = 0; i < in.size(); ++i) {
    by_label[static_cast<std::size_t>(in[i].label)].push_back(i);
  }

  std::vector<std::size_t> keep;
  for (const auto& indices : by_label) {
    if (indices.empty()) continue;
    std::vector<cv::Rect2d> boxes;
    std::vector<float> scores;
    boxes.reserve(indices.size());
    scores.reserve(indices.size());
    for (const std::size_t i : indices) {
      const auto& b = in[i].bbox;
      boxes.emplace_back(b.x, b.y, b.w, b.h);
      scores.push_back(in[i].confidence);
    }
    std::vector<int> kept;
    cv::dnn::NMSBoxes(boxes, scores, 0.f, iou_threshold, kept);
    for (const int k : kept) {
      keep.push_back(indices[static_cast<std::size_t>(k)]);
    }
  }

  std::sort(keep.begin(), keep.end());
  std::vector<sc::Detection> out;
  out.reserve(keep.size());
  for (const std::size_t i : keep) out.push_back(in[i]);
  return out;
}

}  // namespace

DetectionDecoder::DetectionDecoder(float confidence_threshold,
                                   ClassToLabelMap class_to_label,
                                   float nms_iou_threshold)
    : confidence_threshold_(confidence_threshold),
      class_to_label_(std::move(class_to_label)),
      nms_iou_threshold_(nms_iou_threshold) {}

std::vector<sc::Detection> DetectionDecoder::decode(const InferenceResult& result) const {
  std::vector<sc::Detection> out;
  const std::size_t n = static_cast<std::size_t>(result.num_detections);

  for (std::size_t i = 0; i < n; ++i) {
    if (i >= result.scores.size() || i >= result.class_ids.size() ||
        i * 4 + 3 >= result.boxes.size()) {
      break;
    }
    const float score = result.scores[i];
    if (score < confidence_threshold_) {
      continue;
    }
    const auto cid = result.class_ids[i];
    if (cid < 0 || static_cast<std::size_t>(cid) >= class_to_label_.size()) {
      continue;
    }
    const auto& label = class_to_label_[static_cast<std::size_t>(cid)];
    if (!label) {
      continue;
    }

    sc::Detection d;
    d.label = *label;
    d.confidence = score;
    d.bbox.x = result.boxes[i * 4 + 0];
    d.bbox.y = result.boxes[i * 4 + 1];
    d.bbox.w = result.boxes[i * 4 + 2] - d.bbox.x;
    d.bbox.h = result.boxes[i * 4 + 3] - d.bbox.y;
    out.push_back(d);
  }

  if (nms_iou_threshold_ > 0.f && out.size() > 1) {
    return suppress(out, nms_iou_threshold_);
  }
  return out;
}

ClassToLabelMap DetectionDecoder::label_order_class_map() {
  return {sc::ObjectLabel::Helmet, sc::ObjectLabel::Vest, sc::ObjectLabel::Mask,
          sc::ObjectLabel::Person};
}

ClassToLabelMap DetectionDecoder::ppe_model_class_map() {
  return {
      sc::ObjectLabel::Helmet,  // Hardhat
      sc::ObjectLabel::Mask,
      std::nullopt,  // NO-Hardhat
      std::nullopt,  // NO-Mask
      std::nullopt,  // NO-Safety Vest
      sc::ObjectLabel::Person,
      std::nullopt,  // Safety Cone
      sc::ObjectLabel::Vest,  // Safety Vest
      std::nullopt,  // machinery
      std::nullopt,  // vehicle
  };
}

}  // namespace siteguard::vision
