#include <siteguard/app/pipeline_runner_tbb.hpp>

#ifdef SITEGUARD_HAS_TBB

#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <cstddef>

namespace siteguard::app {

namespace sc = siteguard::core;

std::vector<SessionSummary> run_sessions_tbb(std::vector<SessionJob>& jobs,
                                             SessionFrameCallback callback) {
  std::vector<SessionSummary> summaries(jobs.size());
  if (jobs.empty()) return summaries;

  tbb::parallel_for(
      tbb::blocked_range<std::size_t>(0, jobs.size()),
      [&jobs, &summaries, &callback](const tbb::blocked_range<std::size_t>& range) {
        for (std::size_t i = range.begin(); i != range.end(); ++i) {
          SessionJob& job = jobs[i];
          SessionSummary summary;
          if (job.session) {
            FrameResultCallback per_frame;
            if (callback) {
              per_frame = [&job, &callback](const sc::FrameResult& r) {
                callback(job.session_id, r);
              };
            }
            summary = run_session(*job.session, job.source, per_frame);
          } else {
            summary.fatal_error = sc::PipelineError::InvalidConfig;
          }
          summary.session_id = job.session_id;
          summaries[i] = std::move(summary);
        }
      });
  return summaries;
}

}  // namespace siteguard::app

#endif  // SITEGUARD_HAS_TBB
