#include <gtest/gtest.h>

#include <errno.h>

#include <vector>

#include "platform/font5x7.hpp"
#include "screen/framebuffer.hpp"
#include "screen/screen.hpp"
#include "support/test_support.hpp"

using screen::FrameBuffer;
using screen::Screen;
using test_support::CapturingLogger;
namespace colors = screen::colors;

namespace {

class FrameBufferTest : public ::testing::Test {
 protected:
  FrameBufferTest() : pixels_(128U * 128U, 0U), fb_(pixels_.data(), 128U, 128U) {}

  std::vector<uint16_t> pixels_;
  FrameBuffer fb_;
};

size_t glyph_pixels(char c) {
  const uint8_t* g = platform::font5x7::glyph(c);
  size_t n = 0U;
  for (uint8_t col = 0U; col < platform::font5x7::kWidth; ++col) {
    for (uint8_t row = 0U; row < platform::font5x7::kHeight; ++row) {
      if (platform::font5x7::lit(g, col, row)) {
        ++n;
      }
    }
  }
  return n;
}

}  // namespace

TEST_F(FrameBufferTest, FillCoversEveryPixel) {
  EXPECT_EQ(fb_.width(), 128U);
  EXPECT_EQ(fb_.height(), 128U);
  ASSERT_EQ(fb_.fill(colors::kWhite), 0);
  EXPECT_EQ(fb_.count_color(colors::kWhite), 128U * 128U);
  EXPECT_EQ(fb_.pixel_at(127, 127), colors::kWhite.to_rgb565());
}

TEST_F(FrameBufferTest, PixelAndReadBack) {
  ASSERT_EQ(fb_.pixel(3, 4, colors::kRed), 0);
  EXPECT_EQ(fb_.pixel_at(3, 4), colors::kRed.to_rgb565());
  EXPECT_EQ(pixels_[4U * 128U + 3U], colors::kRed.to_rgb565());

  /* 越界写入被丢弃，越界读取返回 0 */
  ASSERT_EQ(fb_.pixel(-1, 0, colors::kRed), 0);
  ASSERT_EQ(fb_.pixel(128, 0, colors::kRed), 0);
  EXPECT_EQ(fb_.count_color(colors::kRed), 1U);
  EXPECT_EQ(fb_.pixel_at(-1, 0), 0U);
  EXPECT_EQ(fb_.pixel_at(0, 128), 0U);
}

TEST_F(FrameBufferTest, LinesCoverEndpoints) {
  ASSERT_EQ(fb_.line(0, 0, 9, 9, colors::kWhite), 0);
  EXPECT_EQ(fb_.count_color(colors::kWhite), 10U);
  EXPECT_EQ(fb_.pixel_at(9, 9), colors::kWhite.to_rgb565());

  ASSERT_EQ(fb_.fill(colors::kBlack), 0);
  ASSERT_EQ(fb_.line(20, 5, 10, 8, colors::kWhite), 0);
  EXPECT_EQ(fb_.count_color(colors::kWhite), 11U);
  EXPECT_EQ(fb_.pixel_at(20, 5), colors::kWhite.to_rgb565());
  EXPECT_EQ(fb_.pixel_at(10, 8), colors::kWhite.to_rgb565());
}

TEST_F(FrameBufferTest, LineIsClippedPerPixel) {
  ASSERT_EQ(fb_.line(-10, 5, 137, 5, colors::kWhite), 0);
  EXPECT_EQ(fb_.count_color(colors::kWhite), 128U);
}

TEST_F(FrameBufferTest, FillRectIsClipped) {
  ASSERT_EQ(fb_.fill_rect(-5, -5, 10, 10, colors::kGreen), 0);
  EXPECT_EQ(fb_.count_color(colors::kGreen), 25U);
  ASSERT_EQ(fb_.fill_rect(10, 10, 0, 5, colors::kBlue), 0);
  EXPECT_EQ(fb_.count_color(colors::kBlue), 0U);
}

TEST_F(FrameBufferTest, OutlineRectUsesEmulation) {
  ASSERT_EQ(fb_.rect(10, 10, 5, 4, colors::kWhite), 0);
  EXPECT_EQ(fb_.count_color(colors::kWhite), 14U);
  EXPECT_EQ(fb_.pixel_at(12, 11), 0U);
}

TEST_F(FrameBufferTest, TextIsTransparent) {
  ASSERT_EQ(fb_.fill(colors::kBlue), 0);
  ASSERT_EQ(fb_.text("A", 0, 0, colors::kWhite), 0);
  EXPECT_EQ(fb_.count_color(colors::kWhite), glyph_pixels('A'));
  EXPECT_EQ(fb_.count_color(colors::kBlue), 128U * 128U - glyph_pixels('A'));

  /* 字模只占字符格左 5 列、上 7 行 */
  for (int32_t y = 0; y < 8; ++y) {
    EXPECT_NE(fb_.pixel_at(5, y), colors::kWhite.to_rgb565());
  }

  ASSERT_EQ(fb_.text("  ", 0, 20, colors::kWhite), 0);
  EXPECT_EQ(fb_.count_color(colors::kWhite), glyph_pixels('A'));
  EXPECT_EQ(fb_.text(nullptr, 0, 0, colors::kWhite), -EINVAL);
}

TEST_F(FrameBufferTest, TextAdvancesOneCellPerChar) {
  ASSERT_EQ(fb_.text("AA", 0, 0, colors::kWhite), 0);
  for (int32_t y = 0; y < 8; ++y) {
    for (int32_t x = 0; x < 8; ++x) {
      EXPECT_EQ(fb_.pixel_at(x, y), fb_.pixel_at(x + 8, y));
    }
  }
}

TEST_F(FrameBufferTest, ShowCountsFrames) {
  EXPECT_EQ(fb_.frames(), 0U);
  ASSERT_EQ(fb_.show(), 0);
  ASSERT_EQ(fb_.show(), 0);
  EXPECT_EQ(fb_.frames(), 2U);
}

TEST_F(FrameBufferTest, RoundMaskWithBorder) {
  ASSERT_EQ(fb_.fill(colors::kWhite), 0);
  ASSERT_EQ(fb_.apply_round_mask(colors::kBlack, true), 0);

  const uint16_t ring = FrameBuffer::kBorderColor.to_rgb565();
  EXPECT_EQ(fb_.pixel_at(0, 0), colors::kBlack.to_rgb565());
  EXPECT_EQ(fb_.pixel_at(127, 127), colors::kBlack.to_rgb565());
  EXPECT_EQ(fb_.pixel_at(64, 0), ring);
  EXPECT_EQ(fb_.pixel_at(64, 1), ring);
  EXPECT_EQ(fb_.pixel_at(64, 2), colors::kWhite.to_rgb565());
  EXPECT_EQ(fb_.pixel_at(64, 64), colors::kWhite.to_rgb565());
}

TEST_F(FrameBufferTest, RoundMaskWithoutBorder) {
  ASSERT_EQ(fb_.fill(colors::kWhite), 0);
  ASSERT_EQ(fb_.apply_round_mask(colors::kBlack, false), 0);
  EXPECT_EQ(fb_.pixel_at(64, 0), colors::kWhite.to_rgb565());
  EXPECT_EQ(fb_.pixel_at(0, 0), colors::kBlack.to_rgb565());
  EXPECT_EQ(fb_.count_color(FrameBuffer::kBorderColor), 0U);
}

TEST(FrameBufferInvalidTest, NullStorageReportsNoGeometry) {
  FrameBuffer fb(nullptr, 128U, 128U);
  EXPECT_EQ(fb.width(), 0U);
  EXPECT_EQ(fb.height(), 0U);
  EXPECT_EQ(fb.fill(colors::kWhite), -ENODEV);
  EXPECT_EQ(fb.pixel(0, 0, colors::kWhite), -ENODEV);
  EXPECT_EQ(fb.line(0, 0, 1, 1, colors::kWhite), -ENODEV);
  EXPECT_EQ(fb.fill_rect(0, 0, 1, 1, colors::kWhite), -ENODEV);
  EXPECT_EQ(fb.text("a", 0, 0, colors::kWhite), -ENODEV);
  EXPECT_EQ(fb.apply_round_mask(colors::kBlack, true), -ENODEV);
  EXPECT_EQ(fb.count_color(colors::kBlack), 0U);

  CapturingLogger log;
  Screen screen(fb, log);
  EXPECT_EQ(screen.clear(), -EINVAL);
  EXPECT_EQ(log.count(CapturingLogger::Level::kError), 1U);
}

TEST(FrameBufferScreenTest, GaugeRendersArcsAndGap) {
  std::vector<uint16_t> pixels(128U * 128U, 0U);
  FrameBuffer fb(pixels.data(), 128U, 128U);
  CapturingLogger log;
  Screen screen(fb, log);

  ASSERT_EQ(screen.clear(), 0);
  ASSERT_EQ(screen.gauge(342, 0, 500, "mm"), 0);
  ASSERT_EQ(screen.show(), 0);

  /* 圆弧顶点位于前景段内 */
  EXPECT_EQ(fb.pixel_at(64, 8), colors::kLight.to_rgb565());
  /* 前景止于 319 度，右侧 0 度处仍为背景弧 */
  EXPECT_EQ(fb.pixel_at(120, 64), colors::kDark.to_rgb565());
  /* 底部缺口不绘制 */
  EXPECT_EQ(fb.pixel_at(64, 120), colors::kBlack.to_rgb565());
  EXPECT_GT(fb.count_color(colors::kWhite), 0U);
  EXPECT_EQ(fb.frames(), 1U);
}
