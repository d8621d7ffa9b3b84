#include <votergrid/core/frame.hpp>
#include <votergrid/vision/color_convert_stage.hpp>
#include <votergrid/vision/enhance_stage.hpp>
#include <votergrid/vision/upscale_stage.hpp>
#include <gtest/gtest.h>
#include <algorithm>
#include <variant>
#include <vector>

namespace vc = votergrid::core;
namespace vv = votergrid::vision;

namespace {

vc::Frame make_uniform(std::uint32_t w, std::uint32_t h, vc::PixelFormat format, unsigned char v) {
  std::vector<std::byte> buf(vc::Frame::min_bytes(w, h, format), std::byte{v});
  return vc::Frame(w, h, format, std::move(buf));
}

/// Left half dark, right half bright.
vc::Frame make_edge(std::uint32_t w, std::uint32_t h) {
  std::vector<std::byte> buf(static_cast<std::size_t>(w) * h);
  for (std::uint32_t y = 0; y < h; ++y) {
    for (std::uint32_t x = 0; x < w; ++x) {
      buf[y * w + x] = std::byte{static_cast<unsigned char>(x < w / 2 ? 60 : 180)};
    }
  }
  return vc::Frame(w, h, vc::PixelFormat::Grayscale8, std::move(buf));
}

const vc::Frame& as_frame(const vc::StageOutput& out) { return std::get<vc::Frame>(out); }

}  // namespace

TEST(ColorConvertStage, RgbToGray) {
  vv::ColorConvertStage stage(vc::PixelFormat::Grayscale8);
  auto out = stage.process(make_uniform(8, 4, vc::PixelFormat::RGB8, 120));
  ASSERT_TRUE(out.has_value());
  const auto& f = as_frame(*out);
  EXPECT_EQ(f.format(), vc::PixelFormat::Grayscale8);
  EXPECT_EQ(f.size_bytes(), 32u);
  EXPECT_EQ(std::to_integer<int>(f.data()[0]), 120);
}

TEST(ColorConvertStage, SameFormatCopies) {
  vv::ColorConvertStage stage(vc::PixelFormat::Grayscale8);
  auto out = stage.process(make_uniform(8, 4, vc::PixelFormat::Grayscale8, 7));
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(as_frame(*out).size_bytes(), 32u);
}

TEST(ColorConvertStage, RejectsEmptyAndUnsupported) {
  vv::ColorConvertStage gray(vc::PixelFormat::Grayscale8);
  EXPECT_EQ(gray.process(vc::Frame{}).error(), vc::PipelineError::InvalidFrame);

  vv::ColorConvertStage rgba(vc::PixelFormat::RGBA8);
  EXPECT_EQ(rgba.process(make_uniform(4, 4, vc::PixelFormat::Grayscale8, 0)).error(),
            vc::PipelineError::InvalidFrame);
}

TEST(UpscaleStage, NarrowCardIsDoubled) {
  vv::UpscaleStage stage(350, 2);
  auto out = stage.process(make_uniform(100, 40, vc::PixelFormat::Grayscale8, 90));
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(as_frame(*out).width(), 200u);
  EXPECT_EQ(as_frame(*out).height(), 80u);
  EXPECT_NEAR(std::to_integer<int>(as_frame(*out).data()[100]), 90, 1);
}

TEST(UpscaleStage, WideCardUnchanged) {
  vv::UpscaleStage stage(350, 2);
  auto out = stage.process(make_uniform(400, 40, vc::PixelFormat::Grayscale8, 90));
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(as_frame(*out).width(), 400u);
}

TEST(EnhanceStage, UniformImageUnchanged) {
  vv::EnhanceStage stage(1.5f, 1.2f);
  auto out = stage.process(make_uniform(16, 16, vc::PixelFormat::Grayscale8, 100));
  ASSERT_TRUE(out.has_value());
  for (auto b : as_frame(*out).data()) ASSERT_NEAR(std::to_integer<int>(b), 100, 1);
}

TEST(EnhanceStage, ContrastSpreadsLevels) {
  auto out = vv::enhance_frame(make_edge(16, 4), 1.5f, 1.0f);
  ASSERT_TRUE(out.has_value());
  // mean 120: 60 -> 30, 180 -> 210
  EXPECT_NEAR(std::to_integer<int>(out->data()[0]), 30, 1);
  EXPECT_NEAR(std::to_integer<int>(out->data()[15]), 210, 1);
}

TEST(EnhanceStage, IdentityFactorsKeepPixels) {
  const vc::Frame in = make_edge(16, 4);
  auto out = vv::enhance_frame(in, 1.0f, 1.0f);
  ASSERT_TRUE(out.has_value());
  EXPECT_TRUE(std::equal(in.data().begin(), in.data().end(), out->data().begin()));
}

TEST(EnhanceStage, EmptyFrameRejected) {
  EXPECT_EQ(vv::enhance_frame(vc::Frame{}, 1.2f, 1.3f).error(), vc::PipelineError::InvalidFrame);
}
