#include <siteguard/core/compliance.hpp>
#include <algorithm>

namespace siteguard::core {

ComplianceOutcome evaluate(const GearSet& gear, const CompliancePolicy& policy) {
  ComplianceOutcome out;
  for (const ObjectLabel kind : kGearLabels) {
    const bool required =
        std::find(policy.required.begin(), policy.required.end(), kind) != policy.required.end();
    if (!required) continue;

    const auto& d = gear.get(kind);
    if (!d || d->confidence < policy.min_confidence) {
      out.missing.push_back(kind);
    }
  }
  out.verdict = out.missing.empty() ? ComplianceVerdict::Compliant
                                    : ComplianceVerdict::Violation;
  return out;
}

void evaluate_persons(std::span<PersonRecord> persons, const CompliancePolicy& policy) {
  for (auto& p : persons) {
    auto outcome = evaluate(p.gear, policy);
    p.verdict = outcome.verdict;
    p.missing = std::move(outcome.missing);
  }
}

}  // namespace siteguard::core
