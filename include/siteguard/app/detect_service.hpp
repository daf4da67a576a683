#pragma once

#include <siteguard/app/alarm_sink.hpp>
#include <siteguard/app/pipeline_runner.hpp>
#include <siteguard/app/session.hpp>
#include <siteguard/core/error.hpp>
#include <siteguard/core/frame_result.hpp>
#include <siteguard/vision/ppe_detector.hpp>
#include <cstddef>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace siteguard::app {

/// Transport-neutral response; an HTTP layer forwards these fields as-is.
struct DetectResponse {
  int status{200};
  std::string body;               // JSON
  std::vector<std::byte> media;   // annotated image, when present
  std::string media_type;         // e.g. "image/jpeg"
};

/// HTTP status for a pipeline error: malformed input -> 400, else 500.
[[nodiscard]] int http_status(siteguard::core::PipelineError e) noexcept;

/// JSON object for one frame's per-person verdicts.
[[nodiscard]] std::string frame_result_json(const siteguard::core::FrameResult& result);

/// JSON object for a session summary.
[[nodiscard]] std::string session_summary_json(const SessionSummary& summary);

/// Request handlers of the detection service. One detector is shared by all
/// requests; each request runs in its own session, so handlers may be called
/// concurrently.
class DetectService {
 public:
  DetectService(std::shared_ptr<const siteguard::vision::PpeDetector> detector,
                SessionOptions options,
                std::shared_ptr<IAlarmSink> alarm_sink = {});

  /// {"status":"ok"}
  [[nodiscard]] DetectResponse health() const;

  /// Backend description, class map, required gear and thresholds.
  [[nodiscard]] DetectResponse model_info() const;

  /// Encoded image in, per-person verdicts and an annotated JPEG out.
  [[nodiscard]] DetectResponse detect_image(std::span<const std::byte> encoded) const;

  /// Annotates a video file into output_path (codec may change the extension)
  /// and returns the session summary. Skipped frames are written unannotated.
  [[nodiscard]] DetectResponse detect_video(const std::string& input_path,
                                            const std::string& output_path) const;

 private:
  std::shared_ptr<const siteguard::vision::PpeDetector> detector_;
  SessionOptions options_;
  std::shared_ptr<IAlarmSink> alarm_sink_;
};

}  // namespace siteguard::app
