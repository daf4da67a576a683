#pragma once

#include <siteguard/core/error.hpp>
#include <siteguard/core/frame.hpp>
#include <siteguard/core/pipeline_stage.hpp>
#include <expected>
#include <functional>
#include <memory>
#include <vector>

namespace siteguard::core {

/// Callback for per-stage timing: (stage_index, duration_ms). Optional; pass to run().
using StageTimingCallback = std::function<void(std::size_t stage_index, double duration_ms)>;

/// Runs a sequence of frame stages, feeding each output into the next.
class Pipeline {
 public:
  Pipeline() = default;

  void add_stage(std::unique_ptr<IPipelineStage> stage);

  /// Run all stages on one frame; returns the last stage's output or the
  /// first error. With no stages the input is returned unchanged.
  /// Thread-safe: stages are not modified during process().
  [[nodiscard]] std::expected<Frame, PipelineError> run(
      const Frame& input,
      const StageTimingCallback* timing_cb = nullptr) const;

  [[nodiscard]] std::size_t stage_count() const noexcept {
    return stages_.size();
  }

 private:
  std::vector<std::unique_ptr<IPipelineStage>> stages_;
};

}  // namespace siteguard::core
