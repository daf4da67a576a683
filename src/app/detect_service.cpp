#include <siteguard/app/detect_service.hpp>
#include <siteguard/core/detection.hpp>
#include <siteguard/core/logging.hpp>
#include <siteguard/vision/load_image.hpp>
#include <siteguard/vision/video_io.hpp>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <utility>

namespace siteguard::app {

namespace sc = siteguard::core;
namespace sv = siteguard::vision;

using json = nlohmann::json;

namespace {

DetectResponse json_response(int status, const json& body) {
  DetectResponse r;
  r.status = status;
  r.body = body.dump();
  return r;
}

DetectResponse error_response(sc::PipelineError e) {
  json j;
  j["error"] = std::string(sc::to_string(e));
  return json_response(http_status(e), j);
}

json bbox_json(const sc::BBox& b) { return json::array({b.x, b.y, b.w, b.h}); }

json frame_result_to_json(const sc::FrameResult& result) {
  json persons = json::array();
  for (const auto& p : result.persons) {
    json gear = json::array();
    for (const auto& g : p.gear.items()) {
      gear.push_back({{"label", std::string(sc::label_name(g.label))},
                      {"confidence", g.confidence},
                      {"bbox", bbox_json(g.bbox)}});
    }
    json missing = json::array();
    for (const auto m : p.missing) missing.push_back(std::string(sc::label_name(m)));

    json person;
    person["index"] = p.index;
    person["bbox"] = bbox_json(p.person.bbox);
    person["confidence"] = p.person.confidence;
    person["verdict"] = std::string(sc::verdict_name(p.verdict));
    person["gear"] = std::move(gear);
    person["missing"] = std::move(missing);
    persons.push_back(std::move(person));
  }

  json j;
  j["frame_id"] = result.frame_id;
  j["violation_count"] = result.violation_count();
  j["dropped_gear"] = result.dropped_gear;
  j["alarm_event"] = std::string(sc::alarm_event_name(result.alarm_event));
  j["alarm_active"] = result.alarm_active;
  j["persons"] = std::move(persons);
  return j;
}

json session_summary_to_json(const SessionSummary& summary) {
  json stats = json::object();
  for (const auto kind : sc::kGearLabels) {
    stats[std::string(sc::label_name(kind))] = summary.missing(kind);
  }

  json j;
  j["frames_processed"] = summary.frames_processed;
  j["frames_skipped"] = summary.frames_skipped;
  j["violation_frames"] = summary.violation_frames;
  j["violation_count"] = summary.violation_count;
  j["violation_stats"] = std::move(stats);
  j["alarm_triggered"] = summary.alarm_triggered();
  j["alarm_on_events"] = summary.alarm_on_events;
  j["alarm_off_events"] = summary.alarm_off_events;
  j["alarm_active"] = summary.alarm_active;
  j["cancelled"] = summary.cancelled;
  if (summary.fatal_error) {
    j["error"] = std::string(sc::to_string(*summary.fatal_error));
  }
  return j;
}

}  // namespace

int http_status(sc::PipelineError e) noexcept {
  switch (e) {
    case sc::PipelineError::None:
      return 200;
    case sc::PipelineError::InvalidFrame:
    case sc::PipelineError::LoadFailed:
      return 400;
    default:
      return 500;
  }
}

std::string frame_result_json(const sc::FrameResult& result) {
  return frame_result_to_json(result).dump();
}

std::string session_summary_json(const SessionSummary& summary) {
  return session_summary_to_json(summary).dump();
}

DetectService::DetectService(std::shared_ptr<const sv::PpeDetector> detector,
                             SessionOptions options,
                             std::shared_ptr<IAlarmSink> alarm_sink)
    : detector_(std::move(detector)),
      options_(std::move(options)),
      alarm_sink_(std::move(alarm_sink)) {
  if (!detector_) {
    throw std::invalid_argument("DetectService: detector is null");
  }
  options_.annotate = true;
}

DetectResponse DetectService::health() const {
  return json_response(200, json{{"status", "ok"}});
}

DetectResponse DetectService::model_info() const {
  const auto& decoder = detector_->decoder();

  json classes = json::object();
  const auto& map = decoder.class_map();
  for (std::size_t id = 0; id < map.size(); ++id) {
    classes[std::to_string(id)] =
        map[id] ? json(std::string(sc::label_name(*map[id]))) : json(nullptr);
  }
  json required = json::array();
  for (const auto kind : options_.policy.required) {
    required.push_back(std::string(sc::label_name(kind)));
  }

  json j;
  j["backend"] = detector_->backend().describe();
  j["confidence_threshold"] = decoder.confidence_threshold();
  j["nms_iou_threshold"] = decoder.nms_iou_threshold();
  j["min_gear_confidence"] = options_.policy.min_confidence;
  j["classes"] = std::move(classes);
  j["required_gear"] = std::move(required);
  j["alarm_trigger_frames"] = options_.alarm.trigger_frames;
  j["alarm_clear_frames"] = options_.alarm.clear_frames;
  return json_response(200, j);
}

DetectResponse DetectService::detect_image(std::span<const std::byte> encoded) const {
  auto frame = sv::decode_frame(encoded);
  if (!frame) {
    return error_response(frame.error());
  }

  auto result = run_single_image(detector_, options_, *frame, make_alarm_listener(alarm_sink_));
  if (!result) {
    return error_response(result.error());
  }

  auto jpeg = sv::encode_jpeg(result->annotated);
  if (!jpeg) {
    sc::Logger("service").error("annotated image could not be encoded");
    return error_response(jpeg.error());
  }

  DetectResponse r = json_response(200, frame_result_to_json(*result));
  r.media = std::move(*jpeg);
  r.media_type = "image/jpeg";
  return r;
}

DetectResponse DetectService::detect_video(const std::string& input_path,
                                           const std::string& output_path) const {
  sc::Logger log("service");

  auto reader = sv::VideoReader::open(input_path);
  if (!reader) {
    log.warn("cannot open video " + input_path);
    return error_response(reader.error());
  }
  auto writer = sv::VideoWriter::open(output_path, reader->fps(), reader->width(),
                                      reader->height());
  if (!writer) {
    log.error("cannot open video writer for " + output_path);
    return json_response(500, json{{"error", "cannot write output video"}});
  }

  ComplianceSession session(detector_, options_, make_alarm_listener(alarm_sink_));
  std::size_t write_failures = 0;
  FrameSource source = [&reader]() { return reader->next(); };
  auto summary = run_session(
      session, source,
      [&](const sc::FrameResult& r) {
        if (!writer->write(r.annotated)) ++write_failures;
      },
      [&](const sc::Frame& raw, sc::PipelineError) {
        if (!raw.is_valid() || !writer->write(raw)) ++write_failures;
      });
  if (write_failures > 0) {
    log.warn(std::to_string(write_failures) + " frames could not be written to " +
             writer->path());
  }
  if (summary.fatal_error) {
    return error_response(*summary.fatal_error);
  }

  json body = session_summary_to_json(summary);
  body["output_path"] = writer->path();
  log.info("video " + input_path + ": " + std::to_string(summary.frames_processed) +
           " frames, " + std::to_string(summary.violation_frames) + " with violations");
  return json_response(200, body);
}

}  // namespace siteguard::app
