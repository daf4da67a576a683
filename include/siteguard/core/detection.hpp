#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace siteguard::core {

/// Object classes the pipeline reasons about. Ordinals are stable and are
/// used as class ids by the mock detector.
enum class ObjectLabel : std::uint8_t {
  Helmet,
  Vest,
  Mask,
  Person,
};

inline constexpr std::size_t kObjectLabelCount = 4;

/// Protective gear kinds, in canonical reporting order.
inline constexpr std::array<ObjectLabel, 3> kGearLabels = {
    ObjectLabel::Helmet,
    ObjectLabel::Vest,
    ObjectLabel::Mask,
};

[[nodiscard]] constexpr bool is_gear(ObjectLabel label) noexcept {
  return label != ObjectLabel::Person;
}

[[nodiscard]] std::string_view label_name(ObjectLabel label) noexcept;

/// Accepts Helmet/Vest/Mask/Person (any case) plus the PPE model's own
/// names "Hardhat" and "Safety Vest".
[[nodiscard]] std::optional<ObjectLabel> parse_object_label(std::string_view name);

struct Point2f {
  float x{0.f};
  float y{0.f};
};

/// Axis-aligned bounding box in frame pixel coordinates.
struct BBox {
  float x{0.f};
  float y{0.f};
  float w{0.f};
  float h{0.f};

  [[nodiscard]] float right() const noexcept { return x + w; }
  [[nodiscard]] float bottom() const noexcept { return y + h; }
};

/// Zero for degenerate boxes (w <= 0 or h <= 0).
[[nodiscard]] float area(const BBox& b) noexcept;
[[nodiscard]] float intersection_area(const BBox& a, const BBox& b) noexcept;
[[nodiscard]] float iou(const BBox& a, const BBox& b) noexcept;
[[nodiscard]] Point2f center(const BBox& b) noexcept;
/// Half-open on the right/bottom edge.
[[nodiscard]] bool contains_point(const BBox& b, Point2f p) noexcept;
/// Clamp to the frame rectangle [0, width] x [0, height].
[[nodiscard]] BBox clamp_to(const BBox& b, float width, float height) noexcept;

/// One labelled box with confidence, produced fresh for each frame.
struct Detection {
  ObjectLabel label{ObjectLabel::Person};
  float confidence{0.f};
  BBox bbox{};
};

}  // namespace siteguard::core
