#pragma once

#include <siteguard/app/config.hpp>
#include <siteguard/core/alarm.hpp>
#include <siteguard/core/association.hpp>
#include <siteguard/core/compliance.hpp>
#include <siteguard/core/error.hpp>
#include <siteguard/core/frame.hpp>
#include <siteguard/core/frame_result.hpp>
#include <siteguard/core/logging.hpp>
#include <siteguard/vision/frame_annotator.hpp>
#include <siteguard/vision/ppe_detector.hpp>
#include <atomic>
#include <cstdint>
#include <expected>
#include <memory>

namespace siteguard::app {

/// Per-session knobs; everything except the shared detector.
struct SessionOptions {
  siteguard::core::CompliancePolicy policy{};
  siteguard::core::AssociationConfig association{};
  siteguard::core::AlarmConfig alarm{};
  siteguard::vision::AnnotatorOptions annotator{};
  bool annotate{true};

  [[nodiscard]] static SessionOptions from_config(const SiteGuardConfig& config);
};

/// One video stream or image request: detect -> associate -> evaluate ->
/// annotate -> alarm, frame by frame.
///
/// Owns its alarm state; shares the detector. Frames must be fed in arrival
/// order from one thread. cancel() may be called from any thread.
class ComplianceSession {
 public:
  ComplianceSession(std::shared_ptr<const siteguard::vision::PpeDetector> detector,
                    SessionOptions options,
                    siteguard::core::AlarmListener listener = {});

  ComplianceSession(const ComplianceSession&) = delete;
  ComplianceSession& operator=(const ComplianceSession&) = delete;

  /// Session for one image: the alarm fires on the first violating frame.
  [[nodiscard]] static std::unique_ptr<ComplianceSession> for_single_image(
      std::shared_ptr<const siteguard::vision::PpeDetector> detector,
      SessionOptions options,
      siteguard::core::AlarmListener listener = {});

  /// Process the next frame. On error the alarm state is left untouched:
  /// InferenceFailed / InvalidFrame mean "skip this frame",
  /// DetectorUnavailable ends the session, Cancelled after cancel().
  [[nodiscard]] std::expected<siteguard::core::FrameResult, siteguard::core::PipelineError>
  process(const siteguard::core::Frame& frame);

  /// Stop accepting frames. No alarm event is emitted afterwards.
  void cancel() noexcept { cancelled_.store(true); }
  [[nodiscard]] bool cancelled() const noexcept { return cancelled_.load(); }

  /// Start a new session on this object: Idle alarm, frame ids from 0, not cancelled.
  void reset() noexcept;

  [[nodiscard]] const siteguard::core::AlarmState& alarm_state() const noexcept {
    return alarm_.state();
  }
  [[nodiscard]] std::uint64_t frames_seen() const noexcept { return next_frame_id_; }
  [[nodiscard]] const SessionOptions& options() const noexcept { return options_; }

 private:
  std::shared_ptr<const siteguard::vision::PpeDetector> detector_;
  SessionOptions options_;
  siteguard::vision::FrameAnnotator annotator_;
  siteguard::core::AlarmStateMachine alarm_;
  std::atomic<bool> cancelled_{false};
  std::uint64_t next_frame_id_{0};
  siteguard::core::Logger log_{"session"};
};

}  // namespace siteguard::app
