#pragma once

#include <siteguard/core/detection.hpp>
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace siteguard::core {

enum class ComplianceVerdict : std::uint8_t {
  Compliant,
  Violation,
};

[[nodiscard]] constexpr std::string_view verdict_name(ComplianceVerdict v) noexcept {
  return v == ComplianceVerdict::Compliant ? "Compliant" : "Violation";
}

/// Gear associated with one person: one slot per gear kind, so a person can
/// never hold two detections of the same kind.
class GearSet {
 public:
  [[nodiscard]] const std::optional<Detection>& get(ObjectLabel kind) const {
    return slots_[slot(kind)];
  }
  [[nodiscard]] bool has(ObjectLabel kind) const { return get(kind).has_value(); }

  /// Stores d in its kind's slot, replacing any previous entry.
  void set(const Detection& d) { slots_[slot(d.label)] = d; }
  void clear(ObjectLabel kind) { slots_[slot(kind)].reset(); }

  [[nodiscard]] std::size_t size() const noexcept;
  [[nodiscard]] bool empty() const noexcept { return size() == 0; }

  /// Present detections in canonical order (Helmet, Vest, Mask).
  [[nodiscard]] std::vector<Detection> items() const;

 private:
  static std::size_t slot(ObjectLabel kind);

  std::array<std::optional<Detection>, kGearLabels.size()> slots_{};
};

/// Per-person outcome for one frame.
struct PersonRecord {
  std::size_t index{0};  // position of the person in the frame's detections
  Detection person{};
  GearSet gear{};
  ComplianceVerdict verdict{ComplianceVerdict::Compliant};
  std::vector<ObjectLabel> missing;  // canonical order
};

}  // namespace siteguard::core
