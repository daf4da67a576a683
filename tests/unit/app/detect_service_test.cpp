#include <siteguard/app/alarm_sink.hpp>
#include <siteguard/app/detect_service.hpp>
#include <siteguard/app/pipeline_runner.hpp>
#include <siteguard/app/session.hpp>
#include <siteguard/core/detection.hpp>
#include <siteguard/core/error.hpp>
#include <siteguard/core/frame.hpp>
#include <siteguard/vision/detection_decoder.hpp>
#include <siteguard/vision/load_image.hpp>
#include <siteguard/vision/mock_inference_backend.hpp>
#include <siteguard/vision/ppe_detector.hpp>
#include <siteguard/vision/video_io.hpp>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace sa = siteguard::app;
namespace sc = siteguard::core;
namespace sv = siteguard::vision;

using json = nlohmann::json;

namespace {

class CountingSink : public sa::IAlarmSink {
 public:
  void on_alarm_on(std::uint64_t) override { ++on; }
  void on_alarm_off(std::uint64_t) override { ++off; }
  int on{0};
  int off{0};
};

struct ServiceFixture {
  std::shared_ptr<sv::MockInferenceBackend> mock = std::make_shared<sv::MockInferenceBackend>();
  std::shared_ptr<CountingSink> sink = std::make_shared<CountingSink>();
  sa::DetectService service{
      std::make_shared<const sv::PpeDetector>(
          mock, sv::DetectionDecoder(0.5f, sv::DetectionDecoder::label_order_class_map())),
      sa::SessionOptions{}, sink};
};

// Scene inside a 160x120 video frame.
const sc::Detection kPerson{sc::ObjectLabel::Person, 0.9f, {10.f, 10.f, 60.f, 100.f}};
const sc::Detection kHelmet{sc::ObjectLabel::Helmet, 0.8f, {20.f, 10.f, 30.f, 20.f}};
const sc::Detection kVest{sc::ObjectLabel::Vest, 0.8f, {15.f, 50.f, 50.f, 30.f}};
const sc::Detection kMask{sc::ObjectLabel::Mask, 0.8f, {25.f, 35.f, 20.f, 10.f}};
const std::vector<sc::Detection> kNoMask = {kPerson, kHelmet, kVest};
const std::vector<sc::Detection> kClear = {kPerson, kHelmet, kVest, kMask};

std::vector<std::byte> jpeg_of_blank(std::uint32_t w, std::uint32_t h) {
  auto jpeg = sv::encode_jpeg(sc::Frame::blank(w, h, sc::PixelFormat::BGR8));
  EXPECT_TRUE(jpeg.has_value());
  return jpeg ? *jpeg : std::vector<std::byte>{};
}

/// Temp directory holding a short blank 160x120 input video.
class VideoDir {
 public:
  explicit VideoDir(const std::string& name, int frames)
      : dir_(std::filesystem::temp_directory_path() / name) {
    std::filesystem::create_directories(dir_);
    auto writer = sv::VideoWriter::open((dir_ / "input.avi").string(), 10.0, 160, 120);
    if (!writer) return;
    input_ = writer->path();
    for (int i = 0; i < frames; ++i) {
      if (!writer->write(sc::Frame::blank(160, 120, sc::PixelFormat::BGR8))) input_.clear();
    }
  }
  ~VideoDir() {
    std::error_code ec;
    std::filesystem::remove_all(dir_, ec);
  }

  [[nodiscard]] const std::string& input() const { return input_; }
  [[nodiscard]] std::string output() const { return (dir_ / "annotated.mp4").string(); }

 private:
  std::filesystem::path dir_;
  std::string input_;
};

int count_frames(const std::string& path) {
  auto reader = sv::VideoReader::open(path);
  if (!reader) return -1;
  int n = 0;
  while (reader->next()) ++n;
  return n;
}

}  // namespace

TEST(DetectService, HttpStatusMapping) {
  EXPECT_EQ(sa::http_status(sc::PipelineError::None), 200);
  EXPECT_EQ(sa::http_status(sc::PipelineError::InvalidFrame), 400);
  EXPECT_EQ(sa::http_status(sc::PipelineError::LoadFailed), 400);
  EXPECT_EQ(sa::http_status(sc::PipelineError::InferenceFailed), 500);
  EXPECT_EQ(sa::http_status(sc::PipelineError::DetectorUnavailable), 500);
}

TEST(DetectService, NullDetectorThrows) {
  EXPECT_THROW(sa::DetectService(nullptr, sa::SessionOptions{}), std::invalid_argument);
}

TEST(DetectService, Health) {
  ServiceFixture fx;
  const auto r = fx.service.health();
  EXPECT_EQ(r.status, 200);
  EXPECT_EQ(json::parse(r.body), (json{{"status", "ok"}}));
}

TEST(DetectService, ModelInfoListsClassesAndPolicy) {
  ServiceFixture fx;
  const auto r = fx.service.model_info();
  EXPECT_EQ(r.status, 200);
  const auto body = json::parse(r.body);
  EXPECT_EQ(body["backend"].get<std::string>(), "mock");
  EXPECT_EQ(body["classes"]["3"].get<std::string>(), "Person");
  EXPECT_EQ(body["required_gear"], (json{"Helmet", "Vest", "Mask"}));
  EXPECT_EQ(body["alarm_trigger_frames"].get<int>(), 1);
  EXPECT_EQ(body["alarm_clear_frames"].get<int>(), 10);
}

TEST(DetectService, DetectImageReportsVerdictsAndAnnotatedJpeg) {
  ServiceFixture fx;
  fx.mock->set_detections({
      {sc::ObjectLabel::Person, 0.9f, {40.f, 40.f, 80.f, 180.f}},
      {sc::ObjectLabel::Helmet, 0.8f, {60.f, 40.f, 40.f, 25.f}},
      {sc::ObjectLabel::Vest, 0.8f, {45.f, 110.f, 70.f, 60.f}},
  });
  const auto r = fx.service.detect_image(jpeg_of_blank(320, 240));
  EXPECT_EQ(r.status, 200);
  const auto body = json::parse(r.body);
  ASSERT_EQ(body["persons"].size(), 1u);
  EXPECT_EQ(body["persons"][0]["verdict"].get<std::string>(), "Violation");
  EXPECT_EQ(body["persons"][0]["missing"], (json{"Mask"}));
  EXPECT_EQ(body["persons"][0]["gear"].size(), 2u);
  EXPECT_EQ(body["alarm_event"].get<std::string>(), "alarm-on");
  EXPECT_TRUE(body["alarm_active"].get<bool>());
  EXPECT_EQ(r.media_type, "image/jpeg");
  ASSERT_GT(r.media.size(), 2u);
  EXPECT_EQ(r.media[0], std::byte{0xFF});
  EXPECT_EQ(fx.sink->on, 1);

  auto decoded = sv::decode_frame(r.media);
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded->width(), 320u);
}

TEST(DetectService, EachImageIsItsOwnSession) {
  ServiceFixture fx;
  fx.mock->set_detections({{sc::ObjectLabel::Person, 0.9f, {40.f, 40.f, 80.f, 180.f}}});
  const auto image = jpeg_of_blank(320, 240);
  EXPECT_EQ(fx.service.detect_image(image).status, 200);
  EXPECT_EQ(fx.service.detect_image(image).status, 200);
  EXPECT_EQ(fx.sink->on, 2);
}

TEST(DetectService, CompliantImageRaisesNoAlarm) {
  ServiceFixture fx;
  fx.mock->set_detections({
      {sc::ObjectLabel::Person, 0.9f, {40.f, 40.f, 80.f, 180.f}},
      {sc::ObjectLabel::Helmet, 0.8f, {60.f, 40.f, 40.f, 25.f}},
      {sc::ObjectLabel::Vest, 0.8f, {45.f, 110.f, 70.f, 60.f}},
      {sc::ObjectLabel::Mask, 0.8f, {65.f, 70.f, 30.f, 15.f}},
  });
  const auto r = fx.service.detect_image(jpeg_of_blank(320, 240));
  EXPECT_EQ(r.status, 200);
  const auto body = json::parse(r.body);
  EXPECT_EQ(body["persons"][0]["verdict"].get<std::string>(), "Compliant");
  EXPECT_EQ(body["alarm_event"].get<std::string>(), "none");
  EXPECT_EQ(fx.sink->on, 0);
}

TEST(DetectService, MalformedImageIs400) {
  ServiceFixture fx;
  const std::vector<std::byte> junk(32, std::byte{0x42});
  const auto r = fx.service.detect_image(junk);
  EXPECT_EQ(r.status, 400);
  EXPECT_TRUE(r.media.empty());
  EXPECT_TRUE(json::parse(r.body).contains("error"));
  EXPECT_EQ(fx.mock->call_count(), 0u);
}

TEST(DetectService, DetectorFailureIs500) {
  ServiceFixture fx;
  fx.mock->fail_always(sc::PipelineError::DetectorUnavailable);
  const auto r = fx.service.detect_image(jpeg_of_blank(64, 64));
  EXPECT_EQ(r.status, 500);
  EXPECT_EQ(json::parse(r.body)["error"].get<std::string>(), "DetectorUnavailable");
  EXPECT_TRUE(r.media.empty());
}

TEST(DetectService, UnreadableVideoIs400) {
  ServiceFixture fx;
  const auto r = fx.service.detect_video("nonexistent_video_12345.mp4", "out.mp4");
  EXPECT_EQ(r.status, 400);
}

TEST(DetectService, DetectVideoSummarizesAndWritesAnnotatedVideo) {
  VideoDir videos("siteguard_detect_video_ok", 6);
  ASSERT_FALSE(videos.input().empty());
  ServiceFixture fx;
  for (const auto* scene : {&kNoMask, &kNoMask, &kClear, &kClear, &kClear, &kClear}) {
    fx.mock->push_frame(*scene);
  }

  const auto r = fx.service.detect_video(videos.input(), videos.output());
  ASSERT_EQ(r.status, 200) << r.body;
  const auto body = json::parse(r.body);
  EXPECT_EQ(body["frames_processed"].get<int>(), 6);
  EXPECT_EQ(body["frames_skipped"].get<int>(), 0);
  EXPECT_EQ(body["violation_frames"].get<int>(), 2);
  EXPECT_EQ(body["violation_stats"]["Mask"].get<int>(), 2);
  EXPECT_EQ(body["violation_stats"]["Helmet"].get<int>(), 0);
  EXPECT_TRUE(body["alarm_triggered"].get<bool>());
  EXPECT_TRUE(body["alarm_active"].get<bool>());  // 4 clear frames < clear threshold of 10
  EXPECT_EQ(fx.sink->on, 1);

  const std::string out = body["output_path"];
  EXPECT_TRUE(std::filesystem::exists(out)) << out;
  EXPECT_EQ(count_frames(out), 6);
}

TEST(DetectService, DetectVideoKeepsSkippedFrames) {
  VideoDir videos("siteguard_detect_video_skip", 4);
  ASSERT_FALSE(videos.input().empty());
  ServiceFixture fx;
  fx.mock->push_frame(kClear);
  fx.mock->push_failure(sc::PipelineError::InferenceFailed);
  fx.mock->push_frame(kClear);
  fx.mock->push_frame(kClear);

  const auto r = fx.service.detect_video(videos.input(), videos.output());
  ASSERT_EQ(r.status, 200) << r.body;
  const auto body = json::parse(r.body);
  EXPECT_EQ(body["frames_processed"].get<int>(), 3);
  EXPECT_EQ(body["frames_skipped"].get<int>(), 1);
  EXPECT_EQ(count_frames(body["output_path"].get<std::string>()), 4);
}

TEST(DetectService, DetectorLossDuringVideoIs500) {
  VideoDir videos("siteguard_detect_video_loss", 3);
  ASSERT_FALSE(videos.input().empty());
  ServiceFixture fx;
  fx.mock->fail_always(sc::PipelineError::DetectorUnavailable);

  const auto r = fx.service.detect_video(videos.input(), videos.output());
  EXPECT_EQ(r.status, 500);
  EXPECT_EQ(json::parse(r.body)["error"].get<std::string>(), "DetectorUnavailable");
}

TEST(DetectService, SummaryJson) {
  sa::SessionSummary s;
  s.frames_processed = 12;
  s.violation_frames = 4;
  s.violation_count = 5;
  s.missing_counts = {1, 0, 4};
  s.alarm_on_events = 1;
  const auto body = json::parse(sa::session_summary_json(s));
  EXPECT_EQ(body["frames_processed"].get<int>(), 12);
  EXPECT_EQ(body["violation_stats"], (json{{"Helmet", 1}, {"Vest", 0}, {"Mask", 4}}));
  EXPECT_TRUE(body["alarm_triggered"].get<bool>());
  EXPECT_FALSE(body.contains("error"));

  s.fatal_error = sc::PipelineError::DetectorUnavailable;
  const auto failed = json::parse(sa::session_summary_json(s));
  EXPECT_EQ(failed["error"].get<std::string>(), "DetectorUnavailable");
}

TEST(DetectService, NonFiniteConfidenceStillYieldsValidJson) {
  sc::FrameResult result;
  sc::PersonRecord p;
  p.person = {sc::ObjectLabel::Person, std::numeric_limits<float>::quiet_NaN(),
              {0.f, 0.f, 10.f, 10.f}};
  p.verdict = sc::ComplianceVerdict::Violation;
  result.persons.push_back(p);

  const auto body = json::parse(sa::frame_result_json(result));
  EXPECT_TRUE(body["persons"][0]["confidence"].is_null());
}
