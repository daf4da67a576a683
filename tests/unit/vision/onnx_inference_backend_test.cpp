// Unit tests for OnnxInferenceBackend.
// One test runs without a model (constructor with missing file). The rest require a real
// YOLO .onnx model: set SITEGUARD_TEST_ONNX_MODEL to its path. They are skipped if the env
// var is unset or the file is missing, so CI without a model still passes.
#ifdef SITEGUARD_HAS_ONNXRUNTIME

#include <siteguard/core/error.hpp>
#include <siteguard/core/frame.hpp>
#include <siteguard/vision/detection_decoder.hpp>
#include <siteguard/vision/onnx_inference_backend.hpp>
#include <siteguard/vision/ppe_detector.hpp>
#include <onnxruntime_cxx_api.h>
#include <gtest/gtest.h>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

namespace sv = siteguard::vision;
namespace sc = siteguard::core;

// Model path for tests that require a real ONNX model. If unset or file missing, those tests are skipped.
static std::string get_test_model_path() {
  const char* env = std::getenv("SITEGUARD_TEST_ONNX_MODEL");
  if (env && env[0] != '\0' && std::filesystem::exists(env)) {
    return env;
  }
  return "";
}

static sc::Frame make_float_frame(std::uint32_t w, std::uint32_t h) {
  return sc::Frame::blank(w, h, sc::PixelFormat::Float32Planar);
}

// Minimal serialized ONNX graphs with a 1x3x8x8 float input "images" whose single
// output a YOLO decoder cannot use.
// images -> SequenceConstruct -> output: sequence(tensor(float))
const unsigned char kSequenceOutputModel[] = {
    0x08, 0x07, 0x42, 0x04, 0x0a, 0x00, 0x10, 0x0d, 0x3a, 0x70, 0x0a, 0x27,
    0x0a, 0x06, 0x69, 0x6d, 0x61, 0x67, 0x65, 0x73, 0x12, 0x06, 0x6f, 0x75,
    0x74, 0x70, 0x75, 0x74, 0x1a, 0x02, 0x6e, 0x30, 0x22, 0x11, 0x53, 0x65,
    0x71, 0x75, 0x65, 0x6e, 0x63, 0x65, 0x43, 0x6f, 0x6e, 0x73, 0x74, 0x72,
    0x75, 0x63, 0x74, 0x12, 0x0f, 0x73, 0x65, 0x71, 0x75, 0x65, 0x6e, 0x63,
    0x65, 0x5f, 0x6f, 0x75, 0x74, 0x70, 0x75, 0x74, 0x5a, 0x20, 0x0a, 0x06,
    0x69, 0x6d, 0x61, 0x67, 0x65, 0x73, 0x12, 0x16, 0x0a, 0x14, 0x08, 0x01,
    0x12, 0x10, 0x0a, 0x02, 0x08, 0x01, 0x0a, 0x02, 0x08, 0x03, 0x0a, 0x02,
    0x08, 0x08, 0x0a, 0x02, 0x08, 0x08, 0x62, 0x12, 0x0a, 0x06, 0x6f, 0x75,
    0x74, 0x70, 0x75, 0x74, 0x12, 0x08, 0x22, 0x06, 0x0a, 0x04, 0x0a, 0x02,
    0x08, 0x01,
};
// images -> Shape -> output: tensor(int64)[4]
const unsigned char kInt64OutputModel[] = {
    0x08, 0x07, 0x42, 0x04, 0x0a, 0x00, 0x10, 0x0d, 0x3a, 0x63, 0x0a, 0x1b,
    0x0a, 0x06, 0x69, 0x6d, 0x61, 0x67, 0x65, 0x73, 0x12, 0x06, 0x6f, 0x75,
    0x74, 0x70, 0x75, 0x74, 0x1a, 0x02, 0x6e, 0x30, 0x22, 0x05, 0x53, 0x68,
    0x61, 0x70, 0x65, 0x12, 0x0c, 0x69, 0x6e, 0x74, 0x36, 0x34, 0x5f, 0x6f,
    0x75, 0x74, 0x70, 0x75, 0x74, 0x5a, 0x20, 0x0a, 0x06, 0x69, 0x6d, 0x61,
    0x67, 0x65, 0x73, 0x12, 0x16, 0x0a, 0x14, 0x08, 0x01, 0x12, 0x10, 0x0a,
    0x02, 0x08, 0x01, 0x0a, 0x02, 0x08, 0x03, 0x0a, 0x02, 0x08, 0x08, 0x0a,
    0x02, 0x08, 0x08, 0x62, 0x14, 0x0a, 0x06, 0x6f, 0x75, 0x74, 0x70, 0x75,
    0x74, 0x12, 0x0a, 0x0a, 0x08, 0x08, 0x07, 0x12, 0x04, 0x0a, 0x02, 0x08,
    0x04,
};

/// Writes a model blob to a temp file; removed on destruction.
class TempModel {
 public:
  TempModel(const std::string& name, const unsigned char* bytes, std::size_t size)
      : path_(std::filesystem::temp_directory_path() / name) {
    std::ofstream out(path_, std::ios::binary);
    out.write(reinterpret_cast<const char*>(bytes), static_cast<std::streamsize>(size));
  }
  ~TempModel() {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
  }
  [[nodiscard]] std::string path() const { return path_.string(); }

 private:
  std::filesystem::path path_;
};

// --- Tests that run without a model ---

TEST(OnnxInferenceBackend, ConstructorThrowsWhenFileMissing) {
  // ONNX Runtime throws Ort::Exception when the model file does not exist.
  EXPECT_THROW(
      { sv::OnnxInferenceBackend backend("nonexistent_onnx_model_12345_should_not_exist.onnx"); },
      Ort::Exception);
}

TEST(OnnxInferenceBackend, NonTensorOutputIsInferenceFailed) {
  TempModel model("siteguard_sequence_output.onnx", kSequenceOutputModel,
                  sizeof(kSequenceOutputModel));
  sv::OnnxInferenceBackend backend(model.path());
  ASSERT_EQ(backend.model_input()->width, 8u);

  auto result = backend.infer(make_float_frame(8, 8));
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), sc::PipelineError::InferenceFailed);
}

TEST(OnnxInferenceBackend, NonFloatOutputIsDecoderError) {
  TempModel model("siteguard_int64_output.onnx", kInt64OutputModel, sizeof(kInt64OutputModel));
  sv::OnnxInferenceBackend backend(model.path());

  auto result = backend.infer(make_float_frame(8, 8));
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), sc::PipelineError::DecoderError);
}

// --- Tests that require a real ONNX model ---

TEST(OnnxInferenceBackend, ReportsModelInput) {
  const std::string path = get_test_model_path();
  if (path.empty()) {
    GTEST_SKIP() << "Set SITEGUARD_TEST_ONNX_MODEL to run (path to .onnx file)";
  }
  sv::OnnxInferenceBackend backend(path);
  const auto input = backend.model_input();
  ASSERT_TRUE(input.has_value());
  EXPECT_GT(input->width, 0u);
  EXPECT_GT(input->height, 0u);
  EXPECT_FALSE(backend.describe().empty());
}

TEST(OnnxInferenceBackend, ValidateInputRejectsWrongFormatAndSize) {
  const std::string path = get_test_model_path();
  if (path.empty()) {
    GTEST_SKIP() << "Set SITEGUARD_TEST_ONNX_MODEL to run (path to .onnx file)";
  }
  sv::OnnxInferenceBackend backend(path);
  const auto input = *backend.model_input();

  auto empty = backend.validate_input(sc::Frame{});
  ASSERT_FALSE(empty.has_value());
  EXPECT_EQ(empty.error(), sc::PipelineError::InvalidFrame);

  auto rgb = backend.validate_input(sc::Frame::blank(input.width, input.height, sc::PixelFormat::RGB8));
  ASSERT_FALSE(rgb.has_value());
  EXPECT_EQ(rgb.error(), sc::PipelineError::InvalidFrame);

  auto small = backend.validate_input(make_float_frame(input.width / 2, input.height / 2));
  ASSERT_FALSE(small.has_value());

  EXPECT_TRUE(backend.validate_input(make_float_frame(input.width, input.height)).has_value());
}

TEST(OnnxInferenceBackend, InferReturnsSaneResult) {
  const std::string path = get_test_model_path();
  if (path.empty()) {
    GTEST_SKIP() << "Set SITEGUARD_TEST_ONNX_MODEL to run (path to .onnx file)";
  }
  sv::OnnxInferenceBackend backend(path);
  backend.warmup();
  const auto input = *backend.model_input();
  auto result = backend.infer(make_float_frame(input.width, input.height));
  ASSERT_TRUE(result.has_value()) << "infer() should succeed with valid frame";
  EXPECT_EQ(result->boxes.size(), result->num_detections * 4u);
  EXPECT_EQ(result->scores.size(), result->num_detections);
  EXPECT_EQ(result->class_ids.size(), result->num_detections);
  for (std::uint32_t i = 0; i < result->num_detections; ++i) {
    EXPECT_GE(result->scores[i], 0.f);
    EXPECT_LE(result->scores[i], 1.f);
  }
}

TEST(OnnxInferenceBackend, DetectorOnSourceFrameKeepsBoxesInside) {
  const std::string path = get_test_model_path();
  if (path.empty()) {
    GTEST_SKIP() << "Set SITEGUARD_TEST_ONNX_MODEL to run (path to .onnx file)";
  }
  auto backend = std::make_shared<sv::OnnxInferenceBackend>(path);
  sv::PpeDetector detector(backend,
                           sv::DetectionDecoder(0.25f, sv::DetectionDecoder::ppe_model_class_map(),
                                                0.45f));
  auto dets = detector.detect(sc::Frame::blank(1280, 720, sc::PixelFormat::BGR8));
  ASSERT_TRUE(dets.has_value());
  for (const auto& d : *dets) {
    EXPECT_GE(d.bbox.x, 0.f);
    EXPECT_LE(d.bbox.right(), 1280.f);
    EXPECT_LE(d.bbox.bottom(), 720.f);
  }
}

#endif  // SITEGUARD_HAS_ONNXRUNTIME
