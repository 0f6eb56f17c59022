#include <gtest/gtest.h>

#include "screen/color.hpp"

using screen::Color;
namespace colors = screen::colors;

TEST(ColorTest, Gray4ClampsAtConstruction) {
  EXPECT_EQ(Color::gray4(-3).to_gray4(), 0U);
  EXPECT_EQ(Color::gray4(20).to_gray4(), 15U);
  EXPECT_EQ(Color::gray4(7).to_gray4(), 7U);
  EXPECT_TRUE(Color::gray4(7).is_gray4());
  EXPECT_FALSE(colors::kRed.is_gray4());
}

TEST(ColorTest, Gray4ExpandsByReplication) {
  const screen::Rgb8 c = colors::kDark.to_rgb8();
  EXPECT_EQ(c.r, 102U);
  EXPECT_EQ(c.g, 102U);
  EXPECT_EQ(c.b, 102U);
  EXPECT_EQ(colors::kWhite.to_rgb8().r, 255U);
}

TEST(ColorTest, Gray4RoundTripsThroughRgb) {
  for (int v = 0; v <= 15; ++v) {
    const screen::Rgb8 rgb = screen::rgb_to_rgb8(v);
    EXPECT_EQ(screen::rgb_to_gray4(rgb), v) << "level " << v;
  }
}

TEST(ColorTest, RgbLuminanceUsesBt601Weights) {
  EXPECT_EQ(Color::rgb(255U, 255U, 255U).to_gray4(), 15U);
  EXPECT_EQ(Color::rgb(0U, 0U, 0U).to_gray4(), 0U);
  /* (255*77)>>8 = 76 -> 4 */
  EXPECT_EQ(colors::kRed.to_gray4(), 4U);
  /* (255*150)>>8 = 149 -> 9 */
  EXPECT_EQ(colors::kGreen.to_gray4(), 9U);
  /* (255*29)>>8 = 28 -> 1 */
  EXPECT_EQ(colors::kBlue.to_gray4(), 1U);
}

TEST(ColorTest, Rgb565Packing) {
  EXPECT_EQ(colors::kRed.to_rgb565(), 0xF800U);
  EXPECT_EQ(colors::kGreen.to_rgb565(), 0x07E0U);
  EXPECT_EQ(colors::kBlue.to_rgb565(), 0x001FU);
  EXPECT_EQ(colors::kWhite.to_rgb565(), 0xFFFFU);
  EXPECT_EQ(colors::kBlack.to_rgb565(), 0x0000U);
  EXPECT_EQ(screen::rgb565(255U, 255U, 0U), 0xFFE0U);
}

TEST(ColorTest, LuminanceForGrayscalePanels) {
  EXPECT_EQ(colors::kWhite.to_l8(), 255U);
  EXPECT_EQ(colors::kGray.to_l8(), 153U);
  EXPECT_EQ(Color().to_l8(), 0U);
}

TEST(ColorTest, EqualityComparesKindAndChannels) {
  EXPECT_EQ(Color::gray4(9), colors::kGray);
  EXPECT_NE(Color::gray4(15), Color::rgb(255U, 255U, 255U));
  EXPECT_EQ(Color(), colors::kBlack);
}

TEST(ColorTest, PackRowRgb565FillsWords) {
  uint16_t row[4] = {0U, 0U, 0U, 0U};
  EXPECT_EQ(screen::pack_row(colors::kRed, screen::RowFormat::kRgb565, row, 4U), 8U);
  for (uint16_t v : row) {
    EXPECT_EQ(v, 0xF800U);
  }
}

TEST(ColorTest, PackRowL8WritesLeadingBytesOnly) {
  uint16_t row[4] = {0x1234U, 0x1234U, 0x1234U, 0x1234U};
  EXPECT_EQ(screen::pack_row(colors::kWhite, screen::RowFormat::kL8, row, 4U), 4U);
  EXPECT_EQ(row[0], 0xFFFFU);
  EXPECT_EQ(row[1], 0xFFFFU);
  EXPECT_EQ(row[2], 0x1234U);
  EXPECT_EQ(row[3], 0x1234U);

  const uint8_t* bytes = reinterpret_cast<const uint8_t*>(row);
  EXPECT_EQ(screen::pack_row(colors::kBlack, screen::RowFormat::kL8, row, 1U), 1U);
  EXPECT_EQ(bytes[0], 0U);
  EXPECT_EQ(bytes[1], 0xFFU);
}
