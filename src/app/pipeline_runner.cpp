#include <siteguard/app/pipeline_runner.hpp>
#include <siteguard/core/logging.hpp>
#include <algorithm>
#include <atomic>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace siteguard::app {

namespace sc = siteguard::core;

std::expected<sc::FrameResult, sc::PipelineError> run_single_image(
    std::shared_ptr<const siteguard::vision::PpeDetector> detector,
    const SessionOptions& options,
    const sc::Frame& frame,
    sc::AlarmListener listener) {
  auto session = ComplianceSession::for_single_image(std::move(detector), options,
                                                     std::move(listener));
  return session->process(frame);
}

SessionSummary run_session(ComplianceSession& session,
                           const FrameSource& source,
                           const FrameResultCallback& callback,
                           const SkippedFrameCallback& on_skip) {
  SessionSummary summary;
  if (!source) return summary;

  while (true) {
    if (session.cancelled()) {
      summary.cancelled = true;
      break;
    }
    std::optional<sc::Frame> frame = source();
    if (!frame) break;

    auto result = session.process(*frame);
    if (!result) {
      const auto err = result.error();
      if (err == sc::PipelineError::Cancelled) {
        summary.cancelled = true;
        break;
      }
      if (err == sc::PipelineError::InferenceFailed || err == sc::PipelineError::InvalidFrame) {
        ++summary.frames_skipped;
        if (on_skip) on_skip(*frame, err);
        continue;
      }
      summary.fatal_error = err;
      break;
    }

    ++summary.frames_processed;
    const std::size_t violations = result->violation_count();
    if (violations > 0) ++summary.violation_frames;
    summary.violation_count += violations;
    for (const auto& p : result->persons) {
      for (const auto m : p.missing) ++summary.missing_counts[static_cast<std::size_t>(m)];
    }
    if (result->alarm_event == sc::AlarmEvent::AlarmOn) ++summary.alarm_on_events;
    if (result->alarm_event == sc::AlarmEvent::AlarmOff) ++summary.alarm_off_events;
    summary.alarm_active = result->alarm_active;

    if (callback) callback(*result);
  }
  return summary;
}

SessionSummary run_session_frames(ComplianceSession& session,
                                  const std::vector<sc::Frame>& frames,
                                  const FrameResultCallback& callback) {
  std::size_t next = 0;
  FrameSource source = [&frames, &next]() -> std::optional<sc::Frame> {
    if (next >= frames.size()) return std::nullopt;
    return frames[next++];
  };
  return run_session(session, source, callback);
}

namespace {

std::size_t effective_workers(std::size_t num_workers) {
  if (num_workers > 0) return num_workers;
  const unsigned hw = std::thread::hardware_concurrency();
  return hw > 0 ? static_cast<std::size_t>(hw) : 1;
}

SessionSummary run_job(SessionJob& job, const SessionFrameCallback& callback) {
  SessionSummary summary;
  if (job.session) {
    FrameResultCallback per_frame;
    if (callback) {
      per_frame = [&job, &callback](const sc::FrameResult& r) { callback(job.session_id, r); };
    }
    summary = run_session(*job.session, job.source, per_frame);
  } else {
    sc::Logger("runner").error("session " + job.session_id + " has no session object");
    summary.fatal_error = sc::PipelineError::InvalidConfig;
  }
  summary.session_id = job.session_id;
  return summary;
}

}  // namespace

std::vector<SessionSummary> run_sessions_parallel(std::vector<SessionJob>& jobs,
                                                  SessionFrameCallback callback,
                                                  std::size_t num_workers) {
  const std::size_t n = jobs.size();
  std::vector<SessionSummary> summaries(n);
  if (n == 0) return summaries;

  const std::size_t workers = std::min(effective_workers(num_workers), n);
  if (workers <= 1) {
    for (std::size_t i = 0; i < n; ++i) summaries[i] = run_job(jobs[i], callback);
    return summaries;
  }

  std::queue<std::size_t> index_queue;
  for (std::size_t i = 0; i < n; ++i) {
    index_queue.push(i);
  }
  std::mutex queue_mutex;

  auto worker = [&]() {
    while (true) {
      std::size_t idx;
      {
        std::lock_guard lock(queue_mutex);
        if (index_queue.empty()) break;
        idx = index_queue.front();
        index_queue.pop();
      }
      // Each slot is written by exactly one worker.
      summaries[idx] = run_job(jobs[idx], callback);
    }
  };

  std::vector<std::thread> threads;
  threads.reserve(workers);
  for (std::size_t i = 0; i < workers; ++i) {
    threads.emplace_back(worker);
  }
  for (auto& t : threads) {
    t.join();
  }
  return summaries;
}

}  // namespace siteguard::app
