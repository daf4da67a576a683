#include <siteguard/core/error.hpp>
#include <siteguard/core/frame.hpp>
#include <siteguard/vision/load_image.hpp>
#include <siteguard/vision/video_io.hpp>
#include <gtest/gtest.h>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace sv = siteguard::vision;
namespace sc = siteguard::core;

TEST(LoadImage, MissingFileIsLoadFailed) {
  auto f = sv::load_frame_from_image("nonexistent_image_12345.jpg");
  ASSERT_FALSE(f.has_value());
  EXPECT_EQ(f.error(), sc::PipelineError::LoadFailed);
}

TEST(LoadImage, GarbageBytesAreInvalidFrame) {
  const std::vector<std::byte> junk(64, std::byte{0x5a});
  auto f = sv::decode_frame(junk);
  ASSERT_FALSE(f.has_value());
  EXPECT_EQ(f.error(), sc::PipelineError::InvalidFrame);

  auto empty = sv::decode_frame({});
  ASSERT_FALSE(empty.has_value());
}

TEST(LoadImage, EncodedJpegDecodesToSameSize) {
  const sc::Frame frame = sc::Frame::blank(48, 32, sc::PixelFormat::RGB8);
  auto jpeg = sv::encode_jpeg(frame);
  ASSERT_TRUE(jpeg.has_value());
  ASSERT_GT(jpeg->size(), 2u);
  EXPECT_EQ((*jpeg)[0], std::byte{0xFF});
  EXPECT_EQ((*jpeg)[1], std::byte{0xD8});

  auto decoded = sv::decode_frame(*jpeg);
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded->width(), 48u);
  EXPECT_EQ(decoded->height(), 32u);
  EXPECT_EQ(decoded->format(), sc::PixelFormat::BGR8);
}

TEST(LoadImage, FloatFrameCannotBeEncoded) {
  auto jpeg = sv::encode_jpeg(sc::Frame::blank(4, 4, sc::PixelFormat::Float32Planar));
  ASSERT_FALSE(jpeg.has_value());
  EXPECT_EQ(jpeg.error(), sc::PipelineError::InvalidFrame);
}

TEST(VideoReader, MissingFileIsLoadFailed) {
  auto r = sv::VideoReader::open("nonexistent_video_12345.mp4");
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), sc::PipelineError::LoadFailed);
}

TEST(VideoWriter, RoundTripKeepsFrameCountAndSize) {
  const auto dir = std::filesystem::temp_directory_path() / "siteguard_video_io_test";
  std::filesystem::create_directories(dir);
  std::string written;
  {
    auto writer = sv::VideoWriter::open((dir / "clip.mp4").string(), 10.0, 64, 48);
    ASSERT_TRUE(writer.has_value());
    written = writer->path();
    const auto ext = std::filesystem::path(written).extension();
    EXPECT_TRUE(ext == ".mp4" || ext == ".avi") << written;
    EXPECT_EQ(std::filesystem::path(written).stem(), "clip");
    for (int i = 0; i < 5; ++i) {
      EXPECT_TRUE(writer->write(sc::Frame::blank(64, 48, sc::PixelFormat::BGR8)).has_value());
    }
    auto wrong_size = writer->write(sc::Frame::blank(32, 32, sc::PixelFormat::BGR8));
    ASSERT_FALSE(wrong_size.has_value());
    EXPECT_EQ(wrong_size.error(), sc::PipelineError::InvalidFrame);
  }

  auto reader = sv::VideoReader::open(written);
  ASSERT_TRUE(reader.has_value());
  EXPECT_EQ(reader->width(), 64u);
  EXPECT_EQ(reader->height(), 48u);
  int frames = 0;
  while (reader->next()) ++frames;
  EXPECT_EQ(frames, 5);
  std::filesystem::remove_all(dir);
}
