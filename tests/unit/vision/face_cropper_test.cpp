#include <votergrid/core/frame.hpp>
#include <votergrid/core/geometry.hpp>
#include <votergrid/vision/face_cropper.hpp>
#include <gtest/gtest.h>
#include <vector>

namespace vc = votergrid::core;
namespace vv = votergrid::vision;

TEST(FaceCropper, DefaultRatiosOnTypicalCard) {
  auto r = vv::face_bounds(400, 200, vc::FaceRatios{});
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->x, 312u);
  EXPECT_EQ(r->y, 60u);
  EXPECT_EQ(r->right(), 392u);
  EXPECT_EQ(r->bottom(), 170u);
}

TEST(FaceCropper, RegionClampedToCard) {
  auto r = vv::face_bounds(100, 100, {0.9f, 0.9f, 0.5f, 0.5f});
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->right(), 100u);
  EXPECT_EQ(r->bottom(), 100u);
  EXPECT_EQ(r->width, 10u);
}

TEST(FaceCropper, InvalidRatiosRejected) {
  EXPECT_EQ(vv::face_bounds(100, 100, {-0.1f, 0.3f, 0.2f, 0.5f}).error(),
            vc::PipelineError::InvalidConfig);
  EXPECT_EQ(vv::face_bounds(100, 100, {0.5f, 0.3f, 1.5f, 0.5f}).error(),
            vc::PipelineError::InvalidConfig);
  // Zero-area region.
  EXPECT_EQ(vv::face_bounds(100, 100, {0.5f, 0.3f, 0.0f, 0.5f}).error(),
            vc::PipelineError::InvalidConfig);
}

TEST(FaceCropper, CropCopiesFacePixels) {
  std::vector<std::byte> buf(100 * 50 * 3, std::byte{0});
  // Paint the default face region white.
  for (std::uint32_t y = 15; y < 42; ++y) {
    for (std::uint32_t x = 78; x < 98; ++x) {
      for (int ch = 0; ch < 3; ++ch) buf[(y * 100 + x) * 3 + ch] = std::byte{255};
    }
  }
  const vc::Frame card(100, 50, vc::PixelFormat::RGB8, std::move(buf));
  auto face = vv::crop_face(card, vc::FaceRatios{});
  ASSERT_TRUE(face.has_value());
  EXPECT_EQ(face->format(), vc::PixelFormat::RGB8);
  EXPECT_EQ(face->width(), 20u);
  EXPECT_EQ(face->height(), 27u);
  for (auto b : face->data()) ASSERT_EQ(b, std::byte{255});
}

TEST(FaceCropper, EmptyCardRejected) {
  auto face = vv::crop_face(vc::Frame{}, vc::FaceRatios{});
  ASSERT_FALSE(face.has_value());
  EXPECT_EQ(face.error(), vc::PipelineError::InvalidFrame);
}
