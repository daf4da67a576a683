#pragma once

#include <siteguard/core/detection.hpp>
#include <siteguard/core/error.hpp>
#include <siteguard/core/frame.hpp>
#include <siteguard/core/person_record.hpp>
#include <cstdint>
#include <expected>
#include <span>

namespace siteguard::vision {

struct Rgb {
  std::uint8_t r{0};
  std::uint8_t g{0};
  std::uint8_t b{0};

  friend bool operator==(const Rgb&, const Rgb&) = default;
};

inline constexpr Rgb kCompliantColor{0, 200, 0};
inline constexpr Rgb kViolationColor{255, 0, 0};

[[nodiscard]] Rgb verdict_color(siteguard::core::ComplianceVerdict verdict) noexcept;
[[nodiscard]] Rgb gear_color(siteguard::core::ObjectLabel label) noexcept;

struct AnnotatorOptions {
  bool draw_gear_boxes{true};
  bool draw_labels{true};
  bool draw_banner{true};  // red "SAFETY VIOLATION" band when anyone is in violation
  int box_thickness{2};
};

/// Draws person verdicts onto a copy of the frame.
///
/// Person boxes are green (Compliant) or red (Violation) and drawn last so
/// gear boxes never cover them. Grayscale input is promoted to BGR8.
class FrameAnnotator {
 public:
  explicit FrameAnnotator(AnnotatorOptions options = {});

  /// InvalidFrame for empty or non-8-bit frames. The input is not modified.
  [[nodiscard]] std::expected<siteguard::core::Frame, siteguard::core::PipelineError>
  annotate(const siteguard::core::Frame& frame,
           std::span<const siteguard::core::PersonRecord> persons) const;

  [[nodiscard]] const AnnotatorOptions& options() const noexcept { return options_; }

 private:
  AnnotatorOptions options_;
};

}  // namespace siteguard::vision
