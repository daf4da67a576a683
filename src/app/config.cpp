#include <siteguard/app/config.hpp>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <fstream>
#include <string_view>
#include <vector>

namespace siteguard::app {

namespace sc = siteguard::core;
namespace sv = siteguard::vision;

namespace {

void trim(std::string& s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    s.clear();
    return;
  }
  const auto end = s.find_last_not_of(" \t\r\n");
  s = s.substr(start, end == std::string::npos ? std::string::npos : end - start + 1);
}

bool parse_line(std::string_view line, std::string& key, std::string& value) {
  const auto pos = line.find('=');
  if (pos == std::string_view::npos) return false;
  key.assign(line.substr(0, pos));
  value.assign(line.substr(pos + 1));
  trim(key);
  trim(value);
  return !key.empty();
}

std::vector<std::string> split_list(const std::string& value) {
  std::vector<std::string> out;
  std::string item;
  for (const char c : value) {
    if (c == ',') {
      trim(item);
      out.push_back(item);
      item.clear();
    } else {
      item.push_back(c);
    }
  }
  trim(item);
  if (!item.empty() || !out.empty()) out.push_back(item);
  return out;
}

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

template <typename T>
bool parse_number(const std::string& value, T& out) {
  const char* first = value.data();
  const char* last = value.data() + value.size();
  const auto [ptr, ec] = std::from_chars(first, last, out);
  return ec == std::errc() && ptr == last;
}

bool parse_bool(const std::string& value, bool& out) {
  const std::string v = lower(value);
  if (v == "true" || v == "1" || v == "yes" || v == "on") {
    out = true;
    return true;
  }
  if (v == "false" || v == "0" || v == "no" || v == "off") {
    out = false;
    return true;
  }
  return false;
}

std::unexpected<sc::PipelineError> invalid() {
  return std::unexpected(sc::PipelineError::InvalidConfig);
}

}  // namespace

SiteGuardConfig default_config() {
  SiteGuardConfig c;
  c.policy.min_confidence = c.confidence_threshold;
  return c;
}

std::expected<void, sc::PipelineError> apply_config_value(SiteGuardConfig& c,
                                                          const std::string& key,
                                                          const std::string& value) {
  if (key == "model_path") {
    c.model_path = value;
  } else if (key == "backend_type") {
    const std::string v = lower(value);
    if (v == "onnx") c.backend_type = InferenceBackendType::Onnx;
    else if (v == "mock") c.backend_type = InferenceBackendType::Mock;
    else return invalid();
  } else if (key == "confidence_threshold") {
    if (!parse_number(value, c.confidence_threshold)) return invalid();
    c.policy.min_confidence = c.confidence_threshold;
  } else if (key == "nms_iou_threshold") {
    if (!parse_number(value, c.nms_iou_threshold)) return invalid();
  } else if (key == "class_labels") {
    sv::ClassToLabelMap map;
    for (const auto& name : split_list(value)) {
      if (name.empty() || name == "-") {
        map.push_back(std::nullopt);
        continue;
      }
      const auto label = sc::parse_object_label(name);
      if (!label) return invalid();
      map.push_back(*label);
    }
    c.class_map = std::move(map);
  } else if (key == "required_gear") {
    std::vector<sc::ObjectLabel> required;
    for (const auto& name : split_list(value)) {
      if (name.empty()) continue;
      const auto label = sc::parse_object_label(name);
      if (!label) return invalid();
      if (std::find(required.begin(), required.end(), *label) == required.end()) {
        required.push_back(*label);
      }
    }
    c.policy.required = std::move(required);
  } else if (key == "alarm_trigger_frames") {
    if (!parse_number(value, c.alarm.trigger_frames)) return invalid();
  } else if (key == "alarm_clear_frames") {
    if (!parse_number(value, c.alarm.clear_frames)) return invalid();
  } else if (key == "min_overlap") {
    if (!parse_number(value, c.association.min_overlap)) return invalid();
  } else if (key == "overlap_metric") {
    const std::string v = lower(value);
    if (v == "containment") c.association.metric = sc::OverlapMetric::Containment;
    else if (v == "center" || v == "centre") c.association.metric = sc::OverlapMetric::CenterPoint;
    else return invalid();
  } else if (key == "draw_gear_boxes") {
    if (!parse_bool(value, c.annotator.draw_gear_boxes)) return invalid();
  } else if (key == "draw_banner") {
    if (!parse_bool(value, c.annotator.draw_banner)) return invalid();
  } else if (key == "log_level") {
    const auto level = sc::parse_log_level(value);
    if (!level) return invalid();
    c.log_level = *level;
  }
  return {};
}

std::expected<SiteGuardConfig, sc::PipelineError> load_config(const std::string& path) {
  SiteGuardConfig c = default_config();
  std::ifstream f(path);
  if (!f) return std::unexpected(sc::PipelineError::LoadFailed);

  std::string line;
  std::string key;
  std::string value;
  while (std::getline(f, line)) {
    trim(line);
    if (line.empty() || line[0] == '#') continue;
    if (!parse_line(line, key, value)) continue;
    auto applied = apply_config_value(c, key, value);
    if (!applied) return std::unexpected(applied.error());
  }
  return c;
}

std::expected<void, sc::PipelineError> validate_config(const SiteGuardConfig& c) {
  auto in_unit = [](float v) { return v >= 0.f && v <= 1.f; };
  if (!in_unit(c.confidence_threshold) || !in_unit(c.nms_iou_threshold) ||
      !in_unit(c.policy.min_confidence) || !in_unit(c.association.min_overlap)) {
    return invalid();
  }
  if (c.alarm.trigger_frames < 1 || c.alarm.clear_frames < 1) return invalid();
  if (std::find(c.policy.required.begin(), c.policy.required.end(), sc::ObjectLabel::Person) !=
      c.policy.required.end()) {
    return invalid();
  }
  if (c.backend_type == InferenceBackendType::Onnx && c.model_path.empty()) return invalid();
  if (c.annotator.box_thickness < 1) return invalid();
  return {};
}

}  // namespace siteguard::app
