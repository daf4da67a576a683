#pragma once

#include <siteguard/core/error.hpp>
#include <siteguard/core/frame.hpp>
#include <expected>

namespace siteguard::core {

/// Abstract frame transform (colour conversion, letterbox, normalisation).
/// process() must not mutate the stage so one chain can serve many threads.
class IPipelineStage {
 public:
  virtual ~IPipelineStage() = default;

  [[nodiscard]] virtual std::expected<Frame, PipelineError> process(
      const Frame& input) const = 0;
};

}  // namespace siteguard::core
