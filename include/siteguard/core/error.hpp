#pragma once

#include <string_view>

namespace siteguard::core {

/// Pipeline error codes; used with std::expected for recoverable failures.
enum class PipelineError {
  None = 0,
  InvalidFrame,         // malformed or unsupported frame (MalformedInput)
  LoadFailed,           // image/video could not be read or decoded
  InferenceFailed,      // detector call failed for one frame (DetectionFailure)
  InvalidConfig,
  DecoderError,
  DetectorUnavailable,  // detector is gone; fatal for the session
  Cancelled,
};

[[nodiscard]] std::string_view to_string(PipelineError e) noexcept;

}  // namespace siteguard::core
