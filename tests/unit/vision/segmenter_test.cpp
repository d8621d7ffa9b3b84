#include <votergrid/core/frame.hpp>
#include <votergrid/core/geometry.hpp>
#include <votergrid/vision/segmenter.hpp>
#include <gtest/gtest.h>
#include <algorithm>
#include <vector>

namespace vc = votergrid::core;
namespace vv = votergrid::vision;

namespace {

vc::Frame make_gray(std::uint32_t w, std::uint32_t h) {
  std::vector<std::byte> buf(static_cast<std::size_t>(w) * h);
  for (std::size_t i = 0; i < buf.size(); ++i) buf[i] = std::byte(static_cast<unsigned char>(i % 251));
  return vc::Frame(w, h, vc::PixelFormat::Grayscale8, std::move(buf));
}

}  // namespace

TEST(Segmenter, RejectsNonPositiveGrid) {
  EXPECT_EQ(vv::validate_grid({0, 3}).error(), vc::PipelineError::InvalidGrid);
  EXPECT_EQ(vv::validate_grid({10, -1}).error(), vc::PipelineError::InvalidGrid);
  EXPECT_TRUE(vv::validate_grid({10, 3}).has_value());

  auto cells = vv::layout_cards(300, 1000, {0, 3});
  ASSERT_FALSE(cells.has_value());
  EXPECT_EQ(cells.error(), vc::PipelineError::InvalidGrid);
}

TEST(Segmenter, DefaultGridCellCountAndOrder) {
  auto cells = vv::layout_cards(300, 1000, vc::GridSpec{});
  ASSERT_TRUE(cells.has_value());
  ASSERT_EQ(cells->size(), 30u);
  EXPECT_EQ((*cells)[0].row, 0u);
  EXPECT_EQ((*cells)[0].col, 0u);
  EXPECT_EQ((*cells)[1].row, 0u);
  EXPECT_EQ((*cells)[1].col, 1u);
  EXPECT_EQ((*cells)[3].row, 1u);
  EXPECT_EQ((*cells)[3].col, 0u);
  EXPECT_EQ((*cells)[29].row, 9u);
  EXPECT_EQ((*cells)[29].col, 2u);
  EXPECT_EQ((*cells)[4].bounds, (vc::PixelRect{100, 100, 100, 100}));
}

TEST(Segmenter, LastRowAndColumnAbsorbRemainder) {
  auto cells = vv::layout_cards(302, 1007, {10, 3});
  ASSERT_TRUE(cells.has_value());
  const auto& last = cells->back();
  EXPECT_EQ(last.bounds.x, 200u);
  EXPECT_EQ(last.bounds.width, 102u);
  EXPECT_EQ(last.bounds.y, 900u);
  EXPECT_EQ(last.bounds.height, 107u);
  EXPECT_EQ((*cells)[0].bounds.width, 100u);
  EXPECT_EQ((*cells)[0].bounds.height, 100u);
}

TEST(Segmenter, CellsTileTheSheetWithoutOverlap) {
  const std::uint32_t w = 301;
  const std::uint32_t h = 997;
  auto cells = vv::layout_cards(w, h, {10, 3});
  ASSERT_TRUE(cells.has_value());
  std::vector<int> cover(static_cast<std::size_t>(w) * h, 0);
  for (const auto& c : *cells) {
    EXPECT_LE(c.bounds.right(), w);
    EXPECT_LE(c.bounds.bottom(), h);
    for (std::uint32_t y = c.bounds.y; y < c.bounds.bottom(); ++y) {
      for (std::uint32_t x = c.bounds.x; x < c.bounds.right(); ++x) {
        ++cover[static_cast<std::size_t>(y) * w + x];
      }
    }
  }
  for (int n : cover) ASSERT_EQ(n, 1);
}

TEST(Segmenter, SheetSmallerThanCellFails) {
  auto cells = vv::layout_cards(2, 1000, {10, 3});
  ASSERT_FALSE(cells.has_value());
  EXPECT_EQ(cells.error(), vc::PipelineError::SegmentationFailed);
}

TEST(Segmenter, SegmentCopiesEachCard) {
  const vc::Frame sheet = make_gray(30, 20);
  auto cards = vv::segment(sheet, {2, 3});
  ASSERT_TRUE(cards.has_value());
  ASSERT_EQ(cards->size(), 6u);
  const auto& card = (*cards)[4];  // row 1, col 1
  EXPECT_EQ(card.row(), 1u);
  EXPECT_EQ(card.col(), 1u);
  EXPECT_EQ(card.image.width(), 10u);
  EXPECT_EQ(card.image.height(), 10u);
  EXPECT_EQ(card.image.data()[0], sheet.data()[10 * 30 + 10]);
}

TEST(Segmenter, CropCardIsRepeatable) {
  const vc::Frame sheet = make_gray(30, 20);
  auto cells = vv::layout_cards(sheet.width(), sheet.height(), {2, 3});
  ASSERT_TRUE(cells.has_value());
  const auto a = vv::crop_card(sheet, (*cells)[5]);
  const auto b = vv::crop_card(sheet, (*cells)[5]);
  ASSERT_EQ(a.image.size_bytes(), b.image.size_bytes());
  EXPECT_TRUE(std::equal(a.image.data().begin(), a.image.data().end(), b.image.data().begin()));
}

TEST(Segmenter, TrimMargins) {
  const vc::Frame sheet = make_gray(40, 30);
  auto trimmed = vv::trim_margins(sheet, {5, 2, 3, 1});
  ASSERT_TRUE(trimmed.has_value());
  EXPECT_EQ(trimmed->width(), 35u);
  EXPECT_EQ(trimmed->height(), 24u);
  EXPECT_EQ(trimmed->data()[0], sheet.data()[5 * 40 + 2]);

  auto gone = vv::trim_margins(sheet, {15, 0, 0, 15});
  ASSERT_FALSE(gone.has_value());
  EXPECT_EQ(gone.error(), vc::PipelineError::SegmentationFailed);
}
