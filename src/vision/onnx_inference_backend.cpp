#include <siteguard/vision/onnx_inference_backend.hpp>
#include <siteguard/core/error.hpp>
#include <siteguard/core/frame.hpp>
#include <siteguard/core/logging.hpp>
#include <onnxruntime_cxx_api.h>
#include <algorithm>
#include <array>
#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace siteguard::vision {

namespace sc = siteguard::core;

namespace {

constexpr int64_t kNumChannels = 3;
/// Raw-head candidates below this score are not worth handing to the decoder.
constexpr float kCandidateScoreFloor = 0.01f;

Ort::MemoryInfo CpuMemoryInfo() {
  return Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);
}

/// Copy HWC (height, width, channels) float buffer to NCHW (batch, channels, height, width).
void HwcToNchw(const float* hwc, std::uint32_t h, std::uint32_t w, float* nchw) {
  const std::size_t hw = static_cast<std::size_t>(h) * w;
  for (std::uint32_t y = 0; y < h; ++y) {
    for (std::uint32_t x = 0; x < w; ++x) {
      const std::size_t src_idx = (static_cast<std::size_t>(y) * w + x) * kNumChannels;
      const std::size_t dst_idx = static_cast<std::size_t>(y) * w + x;
      nchw[0 * hw + dst_idx] = hwc[src_idx + 0];
      nchw[1 * hw + dst_idx] = hwc[src_idx + 1];
      nchw[2 * hw + dst_idx] = hwc[src_idx + 2];
    }
  }
}

enum class OutputLayout {
  RawHead,        // [1, 4+nc, N]
  PostNmsRows,    // [1, N, 6]
  PostNmsColumns  // [1, 6, N]
};

}  // namespace

struct OnnxInferenceBackend::Impl {
  Ort::Env env{ORT_LOGGING_LEVEL_WARNING, "siteguard"};
  Ort::SessionOptions session_options;
  Ort::Session session{nullptr};

  std::string model_path;
  std::string input_name;
  std::string output_name;

  std::uint32_t input_height{0};
  std::uint32_t input_width{0};
  bool input_is_nchw{true};

  Impl() {
    session_options.SetIntraOpNumThreads(1);
    session_options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_EXTENDED);
  }
};

OnnxInferenceBackend::OnnxInferenceBackend(std::string model_path)
    : impl_(std::make_unique<Impl>()) {
  impl_->model_path = std::move(model_path);
  impl_->session = Ort::Session(impl_->env, impl_->model_path.c_str(), impl_->session_options);

  Ort::AllocatorWithDefaultOptions allocator;
  if (impl_->session.GetInputCount() == 0) {
    throw std::runtime_error("OnnxInferenceBackend: model has no inputs");
  }
  impl_->input_name = impl_->session.GetInputNameAllocated(0, allocator).get();

  const std::vector<int64_t> dims =
      impl_->session.GetInputTypeInfo(0).GetTensorTypeAndShapeInfo().GetShape();
  if (dims.size() != 4u) {
    throw std::runtime_error("OnnxInferenceBackend: expected 4D input");
  }
  if (dims[1] == kNumChannels) {
    impl_->input_is_nchw = true;
    impl_->input_height = static_cast<std::uint32_t>(dims[2]);
    impl_->input_width = static_cast<std::uint32_t>(dims[3]);
  } else if (dims[3] == kNumChannels) {
    impl_->input_is_nchw = false;
    impl_->input_height = static_cast<std::uint32_t>(dims[1]);
    impl_->input_width = static_cast<std::uint32_t>(dims[2]);
  } else {
    throw std::runtime_error("OnnxInferenceBackend: expected input shape [1,3,H,W] or [1,H,W,3]");
  }
  if (dims[2] <= 0 || dims[3] <= 0 || dims[1] <= 0) {
    throw std::runtime_error("OnnxInferenceBackend: dynamic input size is not supported");
  }

  if (impl_->session.GetOutputCount() != 1u) {
    throw std::runtime_error("OnnxInferenceBackend: expected exactly one output tensor");
  }
  impl_->output_name = impl_->session.GetOutputNameAllocated(0, allocator).get();

  sc::Logger("onnx").info("loaded " + impl_->model_path + " (" + describe() + ")");
}

OnnxInferenceBackend::~OnnxInferenceBackend() = default;

std::optional<ModelInput> OnnxInferenceBackend::model_input() const {
  return ModelInput{impl_->input_width, impl_->input_height};
}

std::string OnnxInferenceBackend::describe() const {
  std::ostringstream oss;
  oss << "onnx " << impl_->input_width << "x" << impl_->input_height
      << (impl_->input_is_nchw ? " nchw" : " nhwc");
  return oss.str();
}

std::expected<void, sc::PipelineError>
OnnxInferenceBackend::validate_input(const sc::Frame& input) const {
  if (input.empty()) {
    return std::unexpected(sc::PipelineError::InvalidFrame);
  }
  if (input.format() != sc::PixelFormat::Float32Planar) {
    return std::unexpected(sc::PipelineError::InvalidFrame);
  }
  if (input.width() != impl_->input_width || input.height() != impl_->input_height) {
    return std::unexpected(sc::PipelineError::InvalidFrame);
  }
  if (input.size_bytes() <
      sc::Frame::min_bytes(impl_->input_width, impl_->input_height, input.format())) {
    return std::unexpected(sc::PipelineError::InvalidFrame);
  }
  return {};
}

std::expected<InferenceResult, sc::PipelineError>
OnnxInferenceBackend::infer(const sc::Frame& input) const {
  auto valid = validate_input(input);
  if (!valid) {
    return std::unexpected(valid.error());
  }

  const std::uint32_t h = input.height();
  const std::uint32_t w = input.width();
  const float* src = reinterpret_cast<const float*>(input.data().data());
  const std::size_t num_floats = static_cast<std::size_t>(kNumChannels) * h * w;

  // Per-call scratch so concurrent sessions never share a buffer.
  std::vector<float> tensor_data(num_floats);
  std::array<int64_t, 4> shape{};
  if (impl_->input_is_nchw) {
    HwcToNchw(src, h, w, tensor_data.data());
    shape = {1, kNumChannels, static_cast<int64_t>(h), static_cast<int64_t>(w)};
  } else {
    std::copy(src, src + num_floats, tensor_data.begin());
    shape = {1, static_cast<int64_t>(h), static_cast<int64_t>(w), kNumChannels};
  }

  const char* input_names_c[] = {impl_->input_name.c_str()};
  const char* output_names_c[] = {impl_->output_name.c_str()};
  Ort::RunOptions run_options;

  // Outputs own the tensor data that `data` points into.
  std::vector<Ort::Value> outputs;
  std::vector<int64_t> out_shape;
  const float* data = nullptr;
  try {
    Ort::MemoryInfo mem_info = CpuMemoryInfo();
    Ort::Value input_tensor = Ort::Value::CreateTensor<float>(
        mem_info, tensor_data.data(), tensor_data.size(), shape.data(), shape.size());
    outputs = impl_->session.Run(run_options, input_names_c, &input_tensor, 1,
                                 output_names_c, 1);
    if (outputs.size() != 1u) {
      return std::unexpected(sc::PipelineError::InferenceFailed);
    }
    const auto info = outputs[0].GetTensorTypeAndShapeInfo();
    if (info.GetElementType() != ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT) {
      return std::unexpected(sc::PipelineError::DecoderError);
    }
    out_shape = info.GetShape();
    data = outputs[0].GetTensorData<float>();
  } catch (const Ort::Exception& e) {
    sc::Logger("onnx").warn(std::string("inference failed: ") + e.what());
    return std::unexpected(sc::PipelineError::InferenceFailed);
  }
  if (out_shape.size() != 3u || out_shape[0] != 1) {
    return std::unexpected(sc::PipelineError::DecoderError);
  }

  OutputLayout layout;
  int64_t n = 0;
  int64_t channels = 0;
  if (out_shape[2] == 6) {
    layout = OutputLayout::PostNmsRows;
    n = out_shape[1];
  } else if (out_shape[1] == 6) {
    layout = OutputLayout::PostNmsColumns;
    n = out_shape[2];
  } else if (out_shape[1] > 4 && out_shape[1] < out_shape[2]) {
    layout = OutputLayout::RawHead;
    channels = out_shape[1];
    n = out_shape[2];
  } else {
    return std::unexpected(sc::PipelineError::DecoderError);
  }

  InferenceResult result;
  if (n <= 0) {
    return result;
  }
  result.boxes.reserve(static_cast<std::size_t>(n) * 4u);
  result.scores.reserve(static_cast<std::size_t>(n));
  result.class_ids.reserve(static_cast<std::size_t>(n));

  auto push = [&result](float x1, float y1, float x2, float y2, float score, int64_t cls) {
    result.boxes.push_back(x1);
    result.boxes.push_back(y1);
    result.boxes.push_back(x2);
    result.boxes.push_back(y2);
    result.scores.push_back(score);
    result.class_ids.push_back(cls);
  };

  for (int64_t i = 0; i < n; ++i) {
    switch (layout) {
      case OutputLayout::PostNmsRows: {
        const float* row = data + i * 6;
        push(row[0], row[1], row[2], row[3], row[4], static_cast<int64_t>(row[5]));
        break;
      }
      case OutputLayout::PostNmsColumns: {
        push(data[0 * n + i], data[1 * n + i], data[2 * n + i], data[3 * n + i],
             data[4 * n + i], static_cast<int64_t>(data[5 * n + i]));
        break;
      }
      case OutputLayout::RawHead: {
        int64_t best_class = 0;
        float best_score = 0.f;
        for (int64_t c = 4; c < channels; ++c) {
          const float s = data[c * n + i];
          if (s > best_score) {
            best_score = s;
            best_class = c - 4;
          }
        }
        if (best_score < kCandidateScoreFloor) break;
        const float cx = data[0 * n + i];
        const float cy = data[1 * n + i];
        const float bw = data[2 * n + i];
        const float bh = data[3 * n + i];
        push(cx - bw / 2.f, cy - bh / 2.f, cx + bw / 2.f, cy + bh / 2.f, best_score, best_class);
        break;
      }
    }
  }
  result.num_detections = static_cast<std::uint32_t>(result.scores.size());
  return result;
}

void OnnxInferenceBackend::warmup() {
  const sc::Frame frame = sc::Frame::blank(impl_->input_width, impl_->input_height,
                                           sc::PixelFormat::Float32Planar);
  auto result = infer(frame);
  if (!result) {
    sc::Logger("onnx").warn(std::string("warmup failed: ") +
                            std::string(sc::to_string(result.error())));
  }
}

}  // namespace siteguard::vision
