#pragma once

#include <siteguard/app/session.hpp>
#include <siteguard/core/detection.hpp>
#include <siteguard/core/error.hpp>
#include <siteguard/core/frame.hpp>
#include <siteguard/core/frame_result.hpp>
#include <array>
#include <cstddef>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace siteguard::app {

/// Pulls the next frame of a stream; nullopt at end of stream.
using FrameSource = std::function<std::optional<siteguard::core::Frame>()>;

/// Callback for each processed frame, in arrival order within a session.
using FrameResultCallback = std::function<void(const siteguard::core::FrameResult&)>;

/// Callback for a frame the session skipped (InferenceFailed / InvalidFrame).
using SkippedFrameCallback =
    std::function<void(const siteguard::core::Frame&, siteguard::core::PipelineError)>;

/// Callback for the parallel runners; may be invoked from worker threads
/// and must be thread-safe.
using SessionFrameCallback =
    std::function<void(const std::string& session_id, const siteguard::core::FrameResult&)>;

/// Aggregate outcome of one session.
struct SessionSummary {
  std::string session_id;
  std::size_t frames_processed{0};
  std::size_t frames_skipped{0};
  std::size_t violation_frames{0};
  std::size_t violation_count{0};  // violating persons summed over frames
  std::array<std::size_t, siteguard::core::kGearLabels.size()> missing_counts{};
  std::size_t alarm_on_events{0};
  std::size_t alarm_off_events{0};
  bool alarm_active{false};  // state after the last processed frame
  bool cancelled{false};
  std::optional<siteguard::core::PipelineError> fatal_error;

  [[nodiscard]] bool alarm_triggered() const noexcept { return alarm_on_events > 0; }
  [[nodiscard]] std::size_t missing(siteguard::core::ObjectLabel kind) const {
    return missing_counts.at(static_cast<std::size_t>(kind));
  }
};

/// Runs one image through a fresh single-image session.
[[nodiscard]] std::expected<siteguard::core::FrameResult, siteguard::core::PipelineError>
run_single_image(std::shared_ptr<const siteguard::vision::PpeDetector> detector,
                 const SessionOptions& options,
                 const siteguard::core::Frame& frame,
                 siteguard::core::AlarmListener listener = {});

/// Feeds frames from source into session in order until the source ends, the
/// session is cancelled, or the detector becomes unavailable. Frames that
/// fail with InferenceFailed or InvalidFrame are skipped and handed to on_skip.
SessionSummary run_session(ComplianceSession& session,
                           const FrameSource& source,
                           const FrameResultCallback& callback = {},
                           const SkippedFrameCallback& on_skip = {});

/// Same as run_session over an in-memory frame list.
SessionSummary run_session_frames(ComplianceSession& session,
                                  const std::vector<siteguard::core::Frame>& frames,
                                  const FrameResultCallback& callback = {});

/// One independent stream for the parallel runners. The session is borrowed.
struct SessionJob {
  std::string session_id;
  ComplianceSession* session{nullptr};
  FrameSource source;
};

/// Runs independent sessions in parallel on a thread pool; each session's
/// frames stay in order on one worker. num_workers 0 = hardware concurrency.
/// Returns one summary per job, in job order.
std::vector<SessionSummary> run_sessions_parallel(std::vector<SessionJob>& jobs,
                                                  SessionFrameCallback callback = {},
                                                  std::size_t num_workers = 0);

}  // namespace siteguard::app
