#include <siteguard/core/error.hpp>

namespace siteguard::core {

std::string_view to_string(PipelineError e) noexcept {
  switch (e) {
    case PipelineError::None:
      return "None";
    case PipelineError::InvalidFrame:
      return "InvalidFrame";
    case PipelineError::LoadFailed:
      return "LoadFailed";
    case PipelineError::InferenceFailed:
      return "InferenceFailed";
    case PipelineError::InvalidConfig:
      return "InvalidConfig";
    case PipelineError::DecoderError:
      return "DecoderError";
    case PipelineError::DetectorUnavailable:
      return "DetectorUnavailable";
    case PipelineError::Cancelled:
      return "Cancelled";
  }
  return "Unknown";
}

}  // namespace siteguard::core
