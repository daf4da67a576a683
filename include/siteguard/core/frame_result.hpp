#pragma once

#include <siteguard/core/alarm.hpp>
#include <siteguard/core/frame.hpp>
#include <siteguard/core/person_record.hpp>
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace siteguard::core {

/// Outcome of the compliance pipeline for one frame.
struct FrameResult {
  std::uint64_t frame_id{0};
  Frame annotated;
  std::vector<PersonRecord> persons;
  AlarmEvent alarm_event{AlarmEvent::None};  // transition caused by this frame
  bool alarm_active{false};                  // alarm state after this frame
  std::size_t dropped_gear{0};

  [[nodiscard]] std::size_t violation_count() const noexcept {
    return static_cast<std::size_t>(std::count_if(
        persons.begin(), persons.end(),
        [](const PersonRecord& p) { return p.verdict == ComplianceVerdict::Violation; }));
  }
  [[nodiscard]] bool has_violation() const noexcept { return violation_count() > 0; }
};

}  // namespace siteguard::core
