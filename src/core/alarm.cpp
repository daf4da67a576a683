#include <siteguard/core/alarm.hpp>
#include <algorithm>

namespace siteguard::core {

std::string_view alarm_event_name(AlarmEvent e) noexcept {
  switch (e) {
    case AlarmEvent::None:
      return "none";
    case AlarmEvent::AlarmOn:
      return "alarm-on";
    case AlarmEvent::AlarmOff:
      return "alarm-off";
  }
  return "none";
}

AlarmStateMachine::AlarmStateMachine(AlarmConfig config, AlarmListener listener)
    : config_(config), listener_(std::move(listener)) {
  config_.trigger_frames = std::max<std::uint32_t>(config_.trigger_frames, 1);
  config_.clear_frames = std::max<std::uint32_t>(config_.clear_frames, 1);
}

AlarmEvent AlarmStateMachine::update(bool frame_has_violation, std::uint64_t frame_id) {
  if (frame_has_violation) {
    ++state_.consecutive_violation_frames;
    state_.consecutive_clear_frames = 0;
  } else {
    ++state_.consecutive_clear_frames;
    state_.consecutive_violation_frames = 0;
  }

  AlarmEvent event = AlarmEvent::None;
  if (state_.phase == AlarmPhase::Idle &&
      state_.consecutive_violation_frames >= config_.trigger_frames) {
    state_.phase = AlarmPhase::Alarming;
    event = AlarmEvent::AlarmOn;
  } else if (state_.phase == AlarmPhase::Alarming &&
             state_.consecutive_clear_frames >= config_.clear_frames) {
    state_.phase = AlarmPhase::Idle;
    event = AlarmEvent::AlarmOff;
  }

  if (event != AlarmEvent::None && listener_) {
    listener_(event, frame_id);
  }
  return event;
}

void AlarmStateMachine::reset() noexcept {
  state_ = AlarmState{};
}

}  // namespace siteguard::core
