/**
 * siteguard-cli: PPE compliance check on an image or a video file.
 * Build: cmake -B build && cmake --build build
 * Run:   ./build/siteguard_cli [--config path] [--input image|video] [--output path]
 * Without --input: runs a synthetic frame through the mock detector.
 */

#include <siteguard/app/alarm_sink.hpp>
#include <siteguard/app/config.hpp>
#include <siteguard/app/detector_factory.hpp>
#include <siteguard/app/pipeline_runner.hpp>
#include <siteguard/app/session.hpp>
#include <siteguard/core/detection.hpp>
#include <siteguard/core/error.hpp>
#include <siteguard/core/frame.hpp>
#include <siteguard/core/frame_result.hpp>
#include <siteguard/core/logging.hpp>
#include <siteguard/vision/load_image.hpp>
#include <siteguard/vision/mock_inference_backend.hpp>
#include <siteguard/vision/video_io.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

namespace {

namespace sa = siteguard::app;
namespace sc = siteguard::core;
namespace sv = siteguard::vision;

bool is_video_path(const std::string& path) {
  static constexpr std::array<const char*, 6> kVideoExt = {".mp4", ".avi", ".mov",
                                                           ".mkv", ".m4v", ".webm"};
  std::string ext = std::filesystem::path(path).extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return std::find(kVideoExt.begin(), kVideoExt.end(), ext) != kVideoExt.end();
}

std::string default_output_path(const std::string& input_path, bool video) {
  std::filesystem::path p(input_path);
  std::filesystem::path out_dir("output");
  std::filesystem::create_directories(out_dir);
  const std::string ext = video ? ".mp4" : ".jpg";
  return (out_dir / (p.stem().string() + "_annotated" + ext)).string();
}

/// Two workers on a 320x240 frame: the left one fully equipped, the right one
/// without a mask.
void load_demo_scene(sv::MockInferenceBackend& mock) {
  using sc::ObjectLabel;
  mock.set_detections({
      {ObjectLabel::Person, 0.92f, {20.f, 40.f, 100.f, 190.f}},
      {ObjectLabel::Helmet, 0.88f, {45.f, 42.f, 50.f, 30.f}},
      {ObjectLabel::Vest, 0.81f, {30.f, 100.f, 80.f, 60.f}},
      {ObjectLabel::Mask, 0.77f, {55.f, 75.f, 30.f, 20.f}},
      {ObjectLabel::Person, 0.90f, {180.f, 35.f, 110.f, 195.f}},
      {ObjectLabel::Helmet, 0.85f, {210.f, 38.f, 50.f, 30.f}},
      {ObjectLabel::Vest, 0.79f, {190.f, 100.f, 85.f, 65.f}},
  });
}

std::string describe_result(const sc::FrameResult& result) {
  std::ostringstream out;
  out << "frame_id=" << result.frame_id << " persons=" << result.persons.size()
      << " violations=" << result.violation_count()
      << " alarm=" << (result.alarm_active ? "on" : "off") << "\n";
  for (const auto& p : result.persons) {
    out << "  person#" << p.index << " " << sc::verdict_name(p.verdict)
        << " confidence=" << p.person.confidence << " bbox=(" << p.person.bbox.x << ","
        << p.person.bbox.y << "," << p.person.bbox.w << "," << p.person.bbox.h << ")";
    if (!p.missing.empty()) {
      out << " missing=";
      for (std::size_t i = 0; i < p.missing.size(); ++i) {
        if (i > 0) out << ",";
        out << sc::label_name(p.missing[i]);
      }
    }
    out << "\n";
  }
  return out.str();
}

int run_image(const std::shared_ptr<const sv::PpeDetector>& detector,
              const sa::SessionOptions& options,
              const sc::Frame& frame,
              const std::string& output_path) {
  auto listener = sa::make_alarm_listener(std::make_shared<sa::LoggingAlarmSink>());
  auto result = sa::run_single_image(detector, options, frame, std::move(listener));
  if (!result) {
    std::cerr << "Pipeline error: " << sc::to_string(result.error()) << "\n";
    return 1;
  }
  std::cout << describe_result(*result);

  if (!output_path.empty()) {
    if (auto saved = sv::save_frame(result->annotated, output_path); !saved) {
      std::cerr << "Warning: could not write " << output_path << "\n";
    } else {
      std::cout << "annotated image: " << output_path << "\n";
    }
  }
  return 0;
}

int run_video(const std::shared_ptr<const sv::PpeDetector>& detector,
              const sa::SessionOptions& options,
              const std::string& input_path,
              const std::string& output_path) {
  auto reader = sv::VideoReader::open(input_path);
  if (!reader) {
    std::cerr << "Failed to open video: " << input_path << "\n";
    return 1;
  }
  auto writer = sv::VideoWriter::open(output_path, reader->fps(), reader->width(),
                                      reader->height());
  if (!writer) {
    std::cerr << "Failed to open output video: " << output_path << "\n";
    return 1;
  }

  sa::ComplianceSession session(detector, options,
                                sa::make_alarm_listener(std::make_shared<sa::LoggingAlarmSink>()));
  sa::FrameSource source = [&reader]() { return reader->next(); };
  auto summary = sa::run_session(
      session, source,
      [&writer](const sc::FrameResult& r) {
        if (!writer->write(r.annotated)) {
          std::cerr << "Warning: frame " << r.frame_id << " not written\n";
        }
      },
      [&writer](const sc::Frame& raw, sc::PipelineError) {
        // Keep the output the same length as the input.
        if (raw.is_valid() && !writer->write(raw)) {
          std::cerr << "Warning: skipped frame not written\n";
        }
      });

  std::cout << "frames_processed=" << summary.frames_processed
            << " frames_skipped=" << summary.frames_skipped
            << " violation_frames=" << summary.violation_frames
            << " violation_count=" << summary.violation_count
            << " alarm_triggered=" << (summary.alarm_triggered() ? "yes" : "no") << "\n";
  for (const auto kind : sc::kGearLabels) {
    std::cout << "  missing " << sc::label_name(kind) << ": " << summary.missing(kind) << "\n";
  }
  std::cout << "annotated video: " << writer->path() << " (" << writer->codec() << ")\n";

  if (summary.fatal_error) {
    std::cerr << "Session ended: " << sc::to_string(*summary.fatal_error) << "\n";
    return 1;
  }
  return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  std::string config_path;
  std::string input_path;
  std::string output_path;
  std::string backend_override;  // "mock" or "onnx"
  std::string model_override;
  std::string log_level_override;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--input" && i + 1 < argc) {
      input_path = argv[++i];
    } else if (arg == "--output" && i + 1 < argc) {
      output_path = argv[++i];
    } else if (arg == "--backend" && i + 1 < argc) {
      backend_override = argv[++i];
    } else if (arg == "--model" && i + 1 < argc) {
      model_override = argv[++i];
    } else if (arg == "--log-level" && i + 1 < argc) {
      log_level_override = argv[++i];
    } else if (arg == "--help" || arg == "-h") {
      std::cout << "Usage: siteguard_cli [options] [--input <path>]\n"
                << "  --config <path>     Config (key=value file); default: built-in (mock)\n"
                << "  --backend <type>    Override backend: mock | onnx (default from config)\n"
                << "  --model <path>      Override model path (required for --backend onnx)\n"
                << "  --input <path>      Image or video (optional; demo uses a synthetic frame)\n"
                << "  --output <path>     Annotated output (default: output/<name>_annotated.*)\n"
                << "  --log-level <lvl>   debug | info | warn | error | off\n";
      return 0;
    } else {
      std::cerr << "Unknown argument " << arg << " (see --help)\n";
      return 1;
    }
  }

  sa::SiteGuardConfig cfg = sa::default_config();
  if (!config_path.empty()) {
    auto loaded = sa::load_config(config_path);
    if (!loaded) {
      std::cerr << "Failed to load config " << config_path << ": "
                << sc::to_string(loaded.error()) << "\n";
      return 1;
    }
    cfg = std::move(*loaded);
  }

  if (!backend_override.empty()) {
    if (auto applied = sa::apply_config_value(cfg, "backend_type", backend_override); !applied) {
      std::cerr << "Unknown --backend " << backend_override << " (use mock or onnx)\n";
      return 1;
    }
  }
  if (!model_override.empty()) {
    cfg.model_path = model_override;
  }
  if (!log_level_override.empty()) {
    if (auto applied = sa::apply_config_value(cfg, "log_level", log_level_override); !applied) {
      std::cerr << "Unknown --log-level " << log_level_override << "\n";
      return 1;
    }
  }
  sc::set_log_level(cfg.log_level);

  if (auto valid = sa::validate_config(cfg); !valid) {
    std::cerr << "Invalid configuration\n";
    return 1;
  }

  try {
    auto backend = sa::make_backend(cfg);
    if (!backend) {
      std::cerr << "Detector unavailable: " << sc::to_string(backend.error()) << "\n";
      return 1;
    }
    if (input_path.empty()) {
      if (auto mock = std::dynamic_pointer_cast<sv::MockInferenceBackend>(*backend)) {
        load_demo_scene(*mock);
      }
    }
    auto detector = sa::make_detector(cfg, *backend);
    const sa::SessionOptions options = sa::SessionOptions::from_config(cfg);

    if (input_path.empty()) {
      const sc::Frame frame = sc::Frame::blank(320, 240, sc::PixelFormat::BGR8);
      return run_image(detector, options, frame, output_path);
    }

    const bool video = is_video_path(input_path);
    if (output_path.empty()) {
      output_path = default_output_path(input_path, video);
    }
    if (video) {
      return run_video(detector, options, input_path, output_path);
    }
    auto loaded = sv::load_frame_from_image(input_path);
    if (!loaded) {
      std::cerr << "Failed to load image: " << input_path << "\n";
      return 1;
    }
    return run_image(detector, options, *loaded, output_path);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}
