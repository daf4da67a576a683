#include <siteguard/app/session.hpp>
#include <siteguard/core/association.hpp>
#include <siteguard/core/compliance.hpp>
#include <stdexcept>
#include <string>

namespace siteguard::app {

namespace sc = siteguard::core;

SessionOptions SessionOptions::from_config(const SiteGuardConfig& config) {
  SessionOptions o;
  o.policy = config.policy;
  o.association = config.association;
  o.alarm = config.alarm;
  o.annotator = config.annotator;
  return o;
}

ComplianceSession::ComplianceSession(
    std::shared_ptr<const siteguard::vision::PpeDetector> detector,
    SessionOptions options,
    sc::AlarmListener listener)
    : detector_(std::move(detector)),
      options_(std::move(options)),
      annotator_(options_.annotator),
      alarm_(options_.alarm, std::move(listener)) {
  if (!detector_) {
    throw std::invalid_argument("ComplianceSession: detector is null");
  }
}

std::unique_ptr<ComplianceSession> ComplianceSession::for_single_image(
    std::shared_ptr<const siteguard::vision::PpeDetector> detector,
    SessionOptions options,
    sc::AlarmListener listener) {
  options.alarm.trigger_frames = 1;
  return std::make_unique<ComplianceSession>(std::move(detector), std::move(options),
                                             std::move(listener));
}

void ComplianceSession::reset() noexcept {
  alarm_.reset();
  next_frame_id_ = 0;
  cancelled_.store(false);
}

std::expected<sc::FrameResult, sc::PipelineError> ComplianceSession::process(
    const sc::Frame& frame) {
  if (cancelled()) {
    return std::unexpected(sc::PipelineError::Cancelled);
  }
  const std::uint64_t frame_id = next_frame_id_++;

  auto detections = detector_->detect(frame);
  if (!detections) {
    const auto err = detections.error();
    const std::string msg = "frame " + std::to_string(frame_id) + ": " +
                            std::string(sc::to_string(err));
    if (err == sc::PipelineError::DetectorUnavailable) {
      log_.error(msg + ", detector unavailable, ending session");
    } else {
      log_.warn(msg + ", frame skipped");
    }
    return std::unexpected(err);
  }

  sc::FrameResult result;
  result.frame_id = frame_id;

  auto grouped = sc::associate(*detections, options_.association);
  result.dropped_gear = grouped.dropped_gear;
  result.persons = std::move(grouped.persons);
  if (!result.persons.empty()) {
    sc::evaluate_persons(result.persons, options_.policy);
  }

  if (options_.annotate) {
    auto annotated = annotator_.annotate(frame, result.persons);
    if (!annotated) {
      log_.warn("frame " + std::to_string(frame_id) + ": annotation failed");
      return std::unexpected(annotated.error());
    }
    result.annotated = std::move(*annotated);
  }

  // A cancel that raced with detection must not leak an alarm event.
  if (cancelled()) {
    return std::unexpected(sc::PipelineError::Cancelled);
  }

  result.alarm_event = alarm_.update(result.has_violation(), frame_id);
  result.alarm_active = alarm_.active();
  if (result.alarm_event != sc::AlarmEvent::None) {
    log_.info("frame " + std::to_string(frame_id) + ": " +
              std::string(sc::alarm_event_name(result.alarm_event)));
  }
  if (log_.enabled(sc::LogLevel::Debug)) {
    log_.debug("frame " + std::to_string(frame_id) + ": persons=" +
               std::to_string(result.persons.size()) +
               " violations=" + std::to_string(result.violation_count()) +
               " dropped_gear=" + std::to_string(result.dropped_gear));
  }
  return result;
}

}  // namespace siteguard::app
