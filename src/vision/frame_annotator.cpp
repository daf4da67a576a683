#include <siteguard/vision/frame_annotator.hpp>
#include "frame_cv_utils.hpp"
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <array>
#include <cmath>
#include <string>
#include <vector>

namespace siteguard::vision {

namespace sc = siteguard::core;

namespace {

cv::Scalar to_scalar(Rgb c, sc::PixelFormat format) {
  switch (format) {
    case sc::PixelFormat::RGB8:
    case sc::PixelFormat::RGBA8:
      return cv::Scalar(c.r, c.g, c.b, 255);
    default:
      return cv::Scalar(c.b, c.g, c.r, 255);
  }
}

cv::Rect to_rect(const sc::BBox& b) {
  return cv::Rect(static_cast<int>(std::lround(b.x)), static_cast<int>(std::lround(b.y)),
                  static_cast<int>(std::lround(b.w)), static_cast<int>(std::lround(b.h)));
}

std::string person_label(const sc::PersonRecord& p) {
  if (p.verdict == sc::ComplianceVerdict::Compliant) return "OK";
  std::string s = "Missing:";
  for (std::size_t i = 0; i < p.missing.size(); ++i) {
    s += (i == 0 ? " " : ", ");
    s += sc::label_name(p.missing[i]);
  }
  return s;
}

void draw_label(cv::Mat& mat, const cv::Rect& box, const std::string& text,
                const cv::Scalar& background, const cv::Scalar& foreground) {
  constexpr int kFont = cv::FONT_HERSHEY_SIMPLEX;
  constexpr double kScale = 0.5;
  int baseline = 0;
  const cv::Size ts = cv::getTextSize(text, kFont, kScale, 1, &baseline);
  const int h = ts.height + baseline + 4;
  // Above the box if there is room, otherwise just inside its top edge.
  const int top = box.y - h >= 0 ? box.y - h : box.y;
  const cv::Rect bg(box.x, top, ts.width + 4, h);
  cv::rectangle(mat, bg & cv::Rect(0, 0, mat.cols, mat.rows), background, cv::FILLED);
  cv::putText(mat, text, cv::Point(box.x + 2, top + ts.height + 2), kFont, kScale,
              foreground, 1, cv::LINE_AA);
}

void draw_banner(cv::Mat& mat, std::span<const sc::PersonRecord> persons, sc::PixelFormat format) {
  if (mat.cols < 60 || mat.rows < 120) return;

  cv::Mat overlay = mat.clone();
  cv::rectangle(overlay, cv::Point(10, 10), cv::Point(mat.cols - 10, 100),
                to_scalar(kViolationColor, format), cv::FILLED);
  cv::addWeighted(mat, 0.7, overlay, 0.3, 0.0, mat);

  const cv::Scalar white(255, 255, 255, 255);
  cv::putText(mat, "SAFETY VIOLATION", cv::Point(30, 50), cv::FONT_HERSHEY_DUPLEX, 1.2,
              white, 2, cv::LINE_AA);

  std::array<bool, sc::kGearLabels.size()> seen{};
  for (const auto& p : persons) {
    for (const auto m : p.missing) {
      const auto slot = static_cast<std::size_t>(m);
      if (slot < seen.size()) seen[slot] = true;
    }
  }
  std::string text = "Missing:";
  bool first = true;
  for (const auto kind : sc::kGearLabels) {
    if (!seen[static_cast<std::size_t>(kind)]) continue;
    text += first ? " " : ", ";
    text += sc::label_name(kind);
    first = false;
  }
  cv::putText(mat, text, cv::Point(30, 85), cv::FONT_HERSHEY_SIMPLEX, 0.7, white, 2,
              cv::LINE_AA);
}

}  // namespace

Rgb verdict_color(sc::ComplianceVerdict verdict) noexcept {
  return verdict == sc::ComplianceVerdict::Compliant ? kCompliantColor : kViolationColor;
}

Rgb gear_color(sc::ObjectLabel label) noexcept {
  switch (label) {
    case sc::ObjectLabel::Helmet:
      return {255, 215, 0};
    case sc::ObjectLabel::Vest:
      return {255, 140, 0};
    case sc::ObjectLabel::Mask:
      return {0, 200, 255};
    case sc::ObjectLabel::Person:
      break;
  }
  return {255, 255, 255};
}

FrameAnnotator::FrameAnnotator(AnnotatorOptions options) : options_(options) {}

std::expected<sc::Frame, sc::PipelineError>
FrameAnnotator::annotate(const sc::Frame& frame,
                         std::span<const sc::PersonRecord> persons) const {
  sc::Frame out;
  switch (frame.format()) {
    case sc::PixelFormat::Grayscale8: {
      auto gray = detail::frame_to_mat(frame);
      if (!gray) return std::unexpected(sc::PipelineError::InvalidFrame);
      cv::Mat bgr;
      cv::cvtColor(*gray, bgr, cv::COLOR_GRAY2BGR);
      out = detail::mat_to_frame(bgr, sc::PixelFormat::BGR8);
      break;
    }
    case sc::PixelFormat::RGB8:
    case sc::PixelFormat::BGR8:
    case sc::PixelFormat::RGBA8:
    case sc::PixelFormat::BGRA8:
      out = frame;
      break;
    default:
      return std::unexpected(sc::PipelineError::InvalidFrame);
  }

  auto mat = detail::frame_to_mat(out);
  if (!mat) {
    return std::unexpected(sc::PipelineError::InvalidFrame);
  }
  const sc::PixelFormat fmt = out.format();

  const bool any_violation = std::any_of(persons.begin(), persons.end(), [](const auto& p) {
    return p.verdict == sc::ComplianceVerdict::Violation;
  });
  if (options_.draw_banner && any_violation) {
    draw_banner(*mat, persons, fmt);
  }

  if (options_.draw_gear_boxes) {
    for (const auto& p : persons) {
      for (const auto& g : p.gear.items()) {
        cv::rectangle(*mat, to_rect(g.bbox), to_scalar(gear_color(g.label), fmt), 1);
      }
    }
  }

  for (const auto& p : persons) {
    const cv::Scalar color = to_scalar(verdict_color(p.verdict), fmt);
    const cv::Rect box = to_rect(p.person.bbox);
    cv::rectangle(*mat, box, color, options_.box_thickness);
    if (options_.draw_labels) {
      draw_label(*mat, box, person_label(p), color, cv::Scalar(255, 255, 255, 255));
    }
  }
  return out;
}

}  // namespace siteguard::vision
