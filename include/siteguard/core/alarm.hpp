#pragma once

#include <cstdint>
#include <functional>
#include <string_view>

namespace siteguard::core {

/// Debounce thresholds, in consecutive processed frames. Both must be >= 1.
struct AlarmConfig {
  std::uint32_t trigger_frames{1};
  std::uint32_t clear_frames{10};
};

enum class AlarmPhase : std::uint8_t {
  Idle,
  Alarming,
};

/// Emitted once per transition, never once per frame.
enum class AlarmEvent : std::uint8_t {
  None,
  AlarmOn,
  AlarmOff,
};

[[nodiscard]] std::string_view alarm_event_name(AlarmEvent e) noexcept;

struct AlarmState {
  AlarmPhase phase{AlarmPhase::Idle};
  std::uint32_t consecutive_violation_frames{0};
  std::uint32_t consecutive_clear_frames{0};

  [[nodiscard]] bool active() const noexcept { return phase == AlarmPhase::Alarming; }
};

/// Receives AlarmOn / AlarmOff transitions with the id of the frame that caused them.
using AlarmListener = std::function<void(AlarmEvent event, std::uint64_t frame_id)>;

/// Per-session alarm debouncer.
///
/// Idle -> Alarming once trigger_frames consecutive frames contain a
/// violation; Alarming -> Idle once clear_frames consecutive frames contain
/// none. Not thread-safe: a session feeds it frames in arrival order.
class AlarmStateMachine {
 public:
  explicit AlarmStateMachine(AlarmConfig config = {}, AlarmListener listener = {});

  /// Feed one processed frame. Returns the transition it caused, if any.
  AlarmEvent update(bool frame_has_violation, std::uint64_t frame_id = 0);

  /// Back to Idle with zeroed counters; emits nothing.
  void reset() noexcept;

  [[nodiscard]] const AlarmState& state() const noexcept { return state_; }
  [[nodiscard]] bool active() const noexcept { return state_.active(); }
  [[nodiscard]] const AlarmConfig& config() const noexcept { return config_; }

  void set_listener(AlarmListener listener) { listener_ = std::move(listener); }

 private:
  AlarmConfig config_;
  AlarmListener listener_;
  AlarmState state_{};
};

}  // namespace siteguard::core
