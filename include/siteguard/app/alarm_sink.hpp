#pragma once

#include <siteguard/core/alarm.hpp>
#include <cstdint>
#include <memory>

namespace siteguard::app {

/// Consumer of alarm transitions (e.g. audio playback of the alarm sound).
class IAlarmSink {
 public:
  virtual ~IAlarmSink() = default;

  virtual void on_alarm_on(std::uint64_t frame_id) = 0;
  virtual void on_alarm_off(std::uint64_t frame_id) = 0;
};

/// Writes transitions to the "alarm" logger.
class LoggingAlarmSink : public IAlarmSink {
 public:
  void on_alarm_on(std::uint64_t frame_id) override;
  void on_alarm_off(std::uint64_t frame_id) override;
};

/// Adapts a sink to a session listener. A null sink yields an empty listener.
[[nodiscard]] siteguard::core::AlarmListener make_alarm_listener(std::shared_ptr<IAlarmSink> sink);

}  // namespace siteguard::app
