#pragma once

#include <siteguard/core/detection.hpp>
#include <siteguard/core/person_record.hpp>
#include <span>
#include <vector>

namespace siteguard::core {

/// Rule set applied to each person's gear.
struct CompliancePolicy {
  std::vector<ObjectLabel> required{ObjectLabel::Helmet, ObjectLabel::Vest, ObjectLabel::Mask};
  /// Gear below this confidence counts as absent.
  float min_confidence{0.f};
};

struct ComplianceOutcome {
  ComplianceVerdict verdict{ComplianceVerdict::Compliant};
  std::vector<ObjectLabel> missing;  // canonical order Helmet, Vest, Mask
};

/// Violation iff any required gear kind is absent from gear. Pure.
[[nodiscard]] ComplianceOutcome evaluate(const GearSet& gear, const CompliancePolicy& policy);

/// Fills verdict and missing on every record.
void evaluate_persons(std::span<PersonRecord> persons, const CompliancePolicy& policy);

}  // namespace siteguard::core
