#include <siteguard/core/frame.hpp>
#include <siteguard/core/pipeline.hpp>
#include <siteguard/core/pipeline_stage.hpp>
#include <gtest/gtest.h>
#include <memory>
#include <vector>

namespace sc = siteguard::core;

namespace {

class PassThroughStage : public sc::IPipelineStage {
 public:
  std::expected<sc::Frame, sc::PipelineError> process(const sc::Frame& input) const override {
    std::vector<std::byte> buf(input.data().begin(), input.data().end());
    return sc::Frame(input.width(), input.height(), input.format(), std::move(buf));
  }
};

/// Adds one to every byte.
class IncrementStage : public sc::IPipelineStage {
 public:
  std::expected<sc::Frame, sc::PipelineError> process(const sc::Frame& input) const override {
    std::vector<std::byte> buf(input.data().begin(), input.data().end());
    for (auto& b : buf) b = static_cast<std::byte>(static_cast<unsigned char>(b) + 1);
    return sc::Frame(input.width(), input.height(), input.format(), std::move(buf));
  }
};

class FailingStage : public sc::IPipelineStage {
 public:
  std::expected<sc::Frame, sc::PipelineError> process(const sc::Frame&) const override {
    return std::unexpected(sc::PipelineError::InvalidFrame);
  }
};

sc::Frame one_pixel(unsigned char value) {
  std::vector<std::byte> buf(1, static_cast<std::byte>(value));
  return sc::Frame(1, 1, sc::PixelFormat::Grayscale8, std::move(buf));
}

}  // namespace

TEST(Pipeline, EmptyPipelineReturnsInput) {
  sc::Pipeline p;
  auto result = p.run(one_pixel(7));
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->data()[0], std::byte{7});
  EXPECT_EQ(p.stage_count(), 0u);
}

TEST(Pipeline, StagesRunInOrder) {
  sc::Pipeline p;
  p.add_stage(std::make_unique<PassThroughStage>());
  p.add_stage(std::make_unique<IncrementStage>());
  p.add_stage(std::make_unique<IncrementStage>());
  auto result = p.run(one_pixel(1));
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->data()[0], std::byte{3});
  EXPECT_EQ(p.stage_count(), 3u);
}

TEST(Pipeline, FirstErrorStopsTheChain) {
  sc::Pipeline p;
  p.add_stage(std::make_unique<FailingStage>());
  p.add_stage(std::make_unique<IncrementStage>());
  auto result = p.run(one_pixel(1));
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), sc::PipelineError::InvalidFrame);
}

TEST(Pipeline, TimingCallbackPerStage) {
  sc::Pipeline p;
  p.add_stage(std::make_unique<PassThroughStage>());
  p.add_stage(std::make_unique<IncrementStage>());
  std::vector<std::size_t> seen;
  sc::StageTimingCallback cb = [&seen](std::size_t idx, double ms) {
    EXPECT_GE(ms, 0.0);
    seen.push_back(idx);
  };
  auto result = p.run(one_pixel(0), &cb);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(seen, (std::vector<std::size_t>{0, 1}));
}
