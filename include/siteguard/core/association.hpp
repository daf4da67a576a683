#pragma once

#include <siteguard/core/detection.hpp>
#include <siteguard/core/person_record.hpp>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace siteguard::core {

/// How strongly a gear box belongs to a person box.
enum class OverlapMetric : std::uint8_t {
  Containment,  // fraction of the gear box area inside the person box, [0, 1]
  CenterPoint,  // 1 if the gear box centre lies inside the person box, else 0
};

struct AssociationConfig {
  OverlapMetric metric{OverlapMetric::Containment};
  /// Gear qualifies for a person only if overlap > min_overlap.
  float min_overlap{0.f};
};

/// Overlap of gear with person under the given metric.
[[nodiscard]] float overlap(const BBox& gear, const BBox& person, OverlapMetric metric) noexcept;

struct AssociationResult {
  std::vector<PersonRecord> persons;  // one per Person detection, input order
  std::size_t dropped_gear{0};        // gear with no qualifying person
};

/// Groups gear detections with the person they overlap most.
///
/// Each gear detection goes to the person with the highest overlap above
/// config.min_overlap; ties go to the person whose centre is nearest to the
/// gear centre, then to the lower person index. When several detections of
/// one gear kind land on the same person, the highest confidence is kept
/// (ties: higher overlap, then lower detection index). Verdicts are left at
/// their defaults; see evaluate_persons().
///
/// Pure function of its inputs.
[[nodiscard]] AssociationResult associate(std::span<const Detection> detections,
                                          const AssociationConfig& config = {});

}  // namespace siteguard::core
