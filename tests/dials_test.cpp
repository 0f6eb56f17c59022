#include <gtest/gtest.h>

#include <errno.h>

#include <vector>

#include "screen/draw_list.hpp"
#include "screen/screen.hpp"
#include "support/test_support.hpp"

using screen::DrawCommand;
using screen::DrawList;
using screen::DrawOp;
using screen::Point;
using screen::Screen;
using test_support::CapturingLogger;
using test_support::CountingBackend;
namespace colors = screen::colors;

TEST(CompassNeedleTest, NorthPointsUp) {
  const screen::NeedleGeometry n = screen::compass_needle(Point{64, 64}, 40, 0, 3);
  EXPECT_EQ(n.tip, (Point{64, 24}));
  EXPECT_EQ(n.tail, (Point{64, 104}));
  EXPECT_EQ(n.base_a, (Point{61, 64}));
  EXPECT_EQ(n.base_b, (Point{67, 64}));
}

TEST(CompassNeedleTest, EastPointsRight) {
  const screen::NeedleGeometry n = screen::compass_needle(Point{64, 64}, 40, 90, 3);
  EXPECT_EQ(n.tip, (Point{104, 64}));
  EXPECT_EQ(n.tail, (Point{24, 64}));
  EXPECT_EQ(n.base_a, (Point{64, 61}));
  EXPECT_EQ(n.base_b, (Point{64, 67}));
}

TEST(CompassNeedleTest, HeadingWrapsAround) {
  const screen::NeedleGeometry a = screen::compass_needle(Point{64, 64}, 40, 90, 3);
  const screen::NeedleGeometry b = screen::compass_needle(Point{64, 64}, 40, 450, 3);
  const screen::NeedleGeometry c = screen::compass_needle(Point{64, 64}, 40, -270, 3);
  EXPECT_EQ(a.tip, b.tip);
  EXPECT_EQ(a.tip, c.tip);

  const screen::NeedleGeometry s = screen::compass_needle(Point{64, 64}, 40, 180, 3);
  EXPECT_EQ(s.tip, (Point{64, 104}));
}

TEST(HandAnglesTest, TenPastTen) {
  const screen::HandAngles a = screen::hand_angles(10, 10, 30);
  EXPECT_EQ(a.hour, 3050);
  EXPECT_EQ(a.minute, 630);
  EXPECT_EQ(a.second, 1800);
}

TEST(HandAnglesTest, InputsAreWrapped) {
  const screen::HandAngles a = screen::hand_angles(22, 70, 75);
  EXPECT_EQ(a.hour, 10 * 300 + 10 * 5);
  EXPECT_EQ(a.minute, 10 * 60 + 15);
  EXPECT_EQ(a.second, 15 * 60);

  const screen::HandAngles z = screen::hand_angles(12, 0, 0);
  EXPECT_EQ(z.hour, 0);
  EXPECT_EQ(z.minute, 0);
  EXPECT_EQ(z.second, 0);
}

TEST(CompassTest, DrawsCardinalLabels) {
  std::vector<DrawCommand> storage(4096);
  DrawList list(storage.data(), storage.size(), 128U, 128U);
  CapturingLogger log;
  Screen screen(list, log);

  ASSERT_EQ(screen.compass(45), 0);
  EXPECT_EQ(list.dropped(), 0U);

  std::vector<const DrawCommand*> labels;
  for (const DrawCommand& c : list) {
    if (c.op == DrawOp::kText) {
      labels.push_back(&c);
    }
  }
  ASSERT_EQ(labels.size(), 4U);
  EXPECT_STREQ(labels[0]->text, "N");
  EXPECT_EQ(labels[0]->color, colors::kWhite);
  /* N 位于圆心正上方 */
  EXPECT_EQ(labels[0]->x, 60);
  EXPECT_LT(labels[0]->y, 64);
  EXPECT_STREQ(labels[1]->text, "E");
  EXPECT_EQ(labels[1]->color, colors::kGray);
  EXPECT_GT(labels[1]->x, 64);
  EXPECT_STREQ(labels[2]->text, "S");
  EXPECT_GT(labels[2]->y, 64);
  EXPECT_STREQ(labels[3]->text, "W");
  EXPECT_LT(labels[3]->x, 64);
}

TEST(CompassTest, NeedleUsesRequestedColor) {
  CountingBackend be(128U, 128U);
  CapturingLogger log;
  Screen screen(be, log);

  ASSERT_EQ(screen.compass(0, colors::kRed), 0);
  size_t red = 0U;
  for (const test_support::LineCall& l : be.lines) {
    if (l.color == colors::kRed) {
      ++red;
      /* 航向 0：红色半针全部位于中心上方 */
      EXPECT_LE(l.y1, 64);
    }
  }
  EXPECT_GT(red, 0U);
}

TEST(WatchTest, SecondHandAndNumerals) {
  std::vector<DrawCommand> storage(4096);
  DrawList list(storage.data(), storage.size(), 128U, 128U);
  CapturingLogger log;
  Screen screen(list, log);

  ASSERT_EQ(screen.watch(10, 10, 30), 0);
  EXPECT_EQ(list.dropped(), 0U);

  std::vector<const DrawCommand*> red;
  std::vector<const DrawCommand*> numerals;
  for (const DrawCommand& c : list) {
    if (c.op == DrawOp::kLine && c.color == colors::kRed) {
      red.push_back(&c);
    }
    if (c.op == DrawOp::kText) {
      numerals.push_back(&c);
    }
  }

  ASSERT_EQ(red.size(), 1U);
  EXPECT_EQ(red[0]->x, 64);
  EXPECT_EQ(red[0]->y, 64);
  EXPECT_EQ(red[0]->x2, 64);
  EXPECT_EQ(red[0]->y2, 113);

  ASSERT_EQ(numerals.size(), 4U);
  EXPECT_STREQ(numerals[0]->text, "12");
  EXPECT_EQ(numerals[0]->x, 56);
  EXPECT_STREQ(numerals[1]->text, "3");
  EXPECT_STREQ(numerals[2]->text, "6");
  EXPECT_STREQ(numerals[3]->text, "9");
  EXPECT_EQ(numerals[0]->color, colors::kLight);
}

TEST(WatchTest, BackendFailureStopsDrawing) {
  CountingBackend be(128U, 128U);
  CapturingLogger log;
  Screen screen(be, log);
  be.fail_after = 5;

  EXPECT_EQ(screen.watch(3, 0, 0), -EIO);
  EXPECT_EQ(be.calls(), 6U);
}
