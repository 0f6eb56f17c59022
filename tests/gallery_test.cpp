#include <gtest/gtest.h>

#include <errno.h>

#include <cstdint>
#include <cstring>
#include <vector>

#include "screen/draw_list.hpp"
#include "screen/gallery.hpp"
#include "screen/screen.hpp"
#include "support/test_support.hpp"

using screen::DrawCommand;
using screen::DrawList;
using screen::DrawOp;
using screen::Screen;
using screen::gallery::Inputs;
using screen::gallery::Page;
using test_support::CapturingLogger;
namespace gallery = screen::gallery;

namespace {

const char* find_text(const DrawList& list, const char* needle) {
  for (const DrawCommand& c : list) {
    if (std::strcmp(c.text, needle) == 0) {
      return c.text;
    }
  }
  return nullptr;
}

}  // namespace

TEST(GalleryTest, EveryPageDrawsOnCommonSizes) {
  const Inputs inputs;
  for (uint16_t size : {uint16_t{128U}, uint16_t{240U}}) {
    for (size_t i = 0U; i < gallery::kPageCount; ++i) {
      const Page page = static_cast<Page>(i);
      std::vector<DrawCommand> storage(4096);
      DrawList list(storage.data(), storage.size(), size, size);
      CapturingLogger log;
      Screen screen(list, log);

      ASSERT_EQ(gallery::draw(screen, page, inputs), 0) << gallery::page_name(page);
      EXPECT_EQ(list.dropped(), 0U) << gallery::page_name(page);
      ASSERT_GE(list.size(), 3U);
      EXPECT_EQ(list[0].op, DrawOp::kFill);
      EXPECT_EQ(list[0].color, screen::colors::kBlack);
      EXPECT_EQ(list[list.size() - 1U].op, DrawOp::kShow);
      EXPECT_EQ(list.count(DrawOp::kShow), 1U);
      EXPECT_EQ(log.count(CapturingLogger::Level::kError), 0U);
    }
  }
}

TEST(GalleryTest, InvalidPageIsRejected) {
  std::vector<DrawCommand> storage(16);
  DrawList list(storage.data(), storage.size(), 128U, 128U);
  CapturingLogger log;
  Screen screen(list, log);

  EXPECT_EQ(gallery::draw(screen, static_cast<Page>(gallery::kPageCount), Inputs{}), -EINVAL);
  EXPECT_EQ(list.size(), 0U);
}

TEST(GalleryTest, PageNames) {
  EXPECT_STREQ(gallery::page_name(Page::kTemperature), "temperature");
  EXPECT_STREQ(gallery::page_name(Page::kGauge), "gauge");
  EXPECT_STREQ(gallery::page_name(Page::kWatch), "watch");
  EXPECT_STREQ(gallery::page_name(static_cast<Page>(200)), "?");
}

TEST(GalleryTest, TemperaturePageReadings) {
  std::vector<DrawCommand> storage(64);
  DrawList list(storage.data(), storage.size(), 128U, 128U);
  CapturingLogger log;
  Screen screen(list, log);

  Inputs inputs;
  inputs.temperature_dc = -52;
  ASSERT_EQ(gallery::draw(screen, Page::kTemperature, inputs), 0);
  EXPECT_NE(find_text(list, "Temperature"), nullptr);
  EXPECT_NE(find_text(list, "-5.2"), nullptr);
  EXPECT_NE(find_text(list, "C"), nullptr);
  EXPECT_NE(find_text(list, "HTS221 sensor"), nullptr);
}

TEST(GalleryTest, TemperaturePageExtremeReadings) {
  std::vector<DrawCommand> storage(64);
  DrawList list(storage.data(), storage.size(), 128U, 128U);
  CapturingLogger log;
  Screen screen(list, log);

  Inputs inputs;
  inputs.temperature_dc = INT32_MIN;
  ASSERT_EQ(gallery::draw(screen, Page::kTemperature, inputs), 0);
  EXPECT_NE(find_text(list, "-214748364.8"), nullptr);

  list.clear();
  inputs.temperature_dc = INT32_MAX;
  ASSERT_EQ(gallery::draw(screen, Page::kTemperature, inputs), 0);
  EXPECT_NE(find_text(list, "214748364.7"), nullptr);
}

TEST(GalleryTest, BatteryPageShowsBarAndVoltage) {
  std::vector<DrawCommand> storage(64);
  DrawList list(storage.data(), storage.size(), 128U, 128U);
  CapturingLogger log;
  Screen screen(list, log);

  ASSERT_EQ(gallery::draw(screen, Page::kBattery, Inputs{}), 0);
  EXPECT_NE(find_text(list, "72%"), nullptr);
  EXPECT_NE(find_text(list, "3842 mV"), nullptr);
  EXPECT_EQ(list.count(DrawOp::kFillRect), 2U);
}

TEST(GalleryTest, GaugeDrawnBeforeTitle) {
  std::vector<DrawCommand> storage(64);
  DrawList list(storage.data(), storage.size(), 128U, 128U);
  CapturingLogger log;
  Screen screen(list, log);

  ASSERT_EQ(gallery::draw(screen, Page::kGauge, Inputs{}), 0);
  size_t first_arc = list.size();
  size_t title = list.size();
  for (size_t i = 0U; i < list.size(); ++i) {
    if (list[i].op == DrawOp::kArc && first_arc == list.size()) {
      first_arc = i;
    }
    if (std::strcmp(list[i].text, "Distance") == 0) {
      title = i;
    }
  }
  ASSERT_LT(title, list.size());
  EXPECT_LT(first_arc, title);
}

TEST(GalleryTest, UnknownFaceOnlyWarns) {
  std::vector<DrawCommand> storage(16);
  DrawList list(storage.data(), storage.size(), 128U, 128U);
  CapturingLogger log;
  Screen screen(list, log);

  Inputs inputs;
  inputs.face = "bored";
  ASSERT_EQ(gallery::draw(screen, Page::kFace, inputs), 0);
  EXPECT_EQ(list.size(), 2U);
  EXPECT_EQ(log.count(CapturingLogger::Level::kWarn), 1U);
}

TEST(GalleryTest, ShortLightHistory) {
  std::vector<DrawCommand> storage(512);
  DrawList list(storage.data(), storage.size(), 128U, 128U);
  CapturingLogger log;
  Screen screen(list, log);

  Inputs inputs;
  inputs.light_count = 1U;
  ASSERT_EQ(gallery::draw(screen, Page::kGraph, inputs), 0);
  EXPECT_NE(find_text(list, "350"), nullptr);
  EXPECT_EQ(list.count(DrawOp::kLine), 2U);
}

TEST(GalleryTest, BackendErrorAbortsPage) {
  test_support::CountingBackend be(128U, 128U);
  CapturingLogger log;
  Screen screen(be, log);
  be.fail_after = 3;

  EXPECT_EQ(gallery::draw(screen, Page::kMenu, Inputs{}), -EIO);
  EXPECT_EQ(be.shows, 0U);
}
