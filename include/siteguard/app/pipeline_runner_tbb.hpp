#pragma once

#include <siteguard/app/pipeline_runner.hpp>
#include <vector>

#ifdef SITEGUARD_HAS_TBB

namespace siteguard::app {

/// Runs independent sessions in parallel using TBB.
///
/// Each job is one stream with its own ComplianceSession; a job's frames are
/// processed in order inside a single task, so alarm debouncing is never
/// reordered. Sessions share only the detector, which must be safe for
/// concurrent infer() calls.
///
/// \param jobs Sessions are borrowed; caller keeps ownership.
/// \param callback Invoked for each processed frame with (session_id, result). Must be thread-safe.
/// \return One summary per job, in job order.
std::vector<SessionSummary> run_sessions_tbb(std::vector<SessionJob>& jobs,
                                             SessionFrameCallback callback = {});

}  // namespace siteguard::app

#endif  // SITEGUARD_HAS_TBB
