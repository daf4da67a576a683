#include <siteguard/app/alarm_sink.hpp>
#include <siteguard/core/logging.hpp>
#include <string>

namespace siteguard::app {

namespace sc = siteguard::core;

void LoggingAlarmSink::on_alarm_on(std::uint64_t frame_id) {
  sc::Logger("alarm").warn("ALARM ON at frame " + std::to_string(frame_id));
}

void LoggingAlarmSink::on_alarm_off(std::uint64_t frame_id) {
  sc::Logger("alarm").info("alarm off at frame " + std::to_string(frame_id));
}

sc::AlarmListener make_alarm_listener(std::shared_ptr<IAlarmSink> sink) {
  if (!sink) return {};
  return [sink = std::move(sink)](sc::AlarmEvent event, std::uint64_t frame_id) {
    if (event == sc::AlarmEvent::AlarmOn) {
      sink->on_alarm_on(frame_id);
    } else if (event == sc::AlarmEvent::AlarmOff) {
      sink->on_alarm_off(frame_id);
    }
  };
}

}  // namespace siteguard::app
