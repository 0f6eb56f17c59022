/**
 * @file dials.cpp
 * @brief 圆形表盘类控件：罗盘、指针式表盘、像素画表情。
 *
 * 角度约定：正北（12 点）为 0，顺时针递增；屏幕坐标 y 轴向下，
 * 因此方向向量为 (sin, -cos)。
 */

#include <errno.h>
#include <string.h>

#include "screen/fixed_math.hpp"
#include "screen/raster.hpp"
#include "screen/screen.hpp"

namespace screen {

namespace {

constexpr int32_t kCompassInset = 12;
constexpr int32_t kCompassTick = 6;
constexpr int32_t kCompassCardinalTick = 9;
constexpr int32_t kCompassLabelOut = 8;
constexpr int32_t kNeedleHalfWidth = 3;
constexpr int32_t kPivotRadius = 3;

constexpr int32_t kWatchInset = 6;
constexpr int32_t kWatchQuarterTick = 8;
constexpr int32_t kWatchTick = 4;
constexpr int32_t kWatchNumeralInset = 16;
constexpr int32_t kWatchPivotRadius = 2;

struct DialLabel {
  const char* text;
  int32_t decideg;
};

constexpr DialLabel kCompassLabels[] = {
    {"N", 0},
    {"E", 900},
    {"S", 1800},
    {"W", 2700},
};

constexpr DialLabel kWatchNumerals[] = {
    {"12", 0},
    {"3", 900},
    {"6", 1800},
    {"9", 2700},
};

/* 从中心沿角度 decideg 前进 length 的点。 */
Point polar(Point c, int32_t length, int32_t decideg) noexcept {
  return Point{c.x + fixed::scale_q14(length, fixed::sin_q14(decideg)),
               c.y - fixed::scale_q14(length, fixed::cos_q14(decideg))};
}

int32_t wrap(int32_t v, int32_t mod) noexcept { return ((v % mod) + mod) % mod; }

}  // namespace

NeedleGeometry compass_needle(Point center, int32_t length, int32_t heading_deg,
                              int32_t half_width) noexcept {
  const int32_t d = wrap(heading_deg, 360) * 10;
  const int32_t s = fixed::sin_q14(d);
  const int32_t c = fixed::cos_q14(d);
  const int32_t dx = fixed::scale_q14(length, s);
  const int32_t dy = fixed::scale_q14(length, c);
  const int32_t px = fixed::scale_q14(half_width, c);
  const int32_t py = fixed::scale_q14(half_width, s);

  NeedleGeometry g;
  g.tip = Point{center.x + dx, center.y - dy};
  g.tail = Point{center.x - dx, center.y + dy};
  g.base_a = Point{center.x - px, center.y - py};
  g.base_b = Point{center.x + px, center.y + py};
  return g;
}

HandAngles hand_angles(int32_t hours, int32_t minutes, int32_t seconds) noexcept {
  const int32_t h = wrap(hours, 12);
  const int32_t m = wrap(minutes, 60);
  const int32_t s = wrap(seconds, 60);

  HandAngles a;
  a.hour = h * 300 + m * 5;
  a.minute = m * 60 + s;
  a.second = s * 60;
  return a;
}

int Screen::radial_tick(int32_t decideg, int32_t inner, int32_t outer, Color color,
                        bool bold) noexcept {
  const Point c = center();
  const Point p1 = polar(c, inner, decideg);
  const Point p2 = polar(c, outer, decideg);

  int ret = be_.line(p1.x, p1.y, p2.x, p2.y, color);
  if (ret < 0 || !bold) {
    return ret;
  }

  /* 加粗：沿垂直方向偏移 1 像素再画一条。 */
  const int32_t ox = fixed::scale_q14(1, fixed::cos_q14(decideg));
  const int32_t oy = fixed::scale_q14(1, fixed::sin_q14(decideg));
  return be_.line(p1.x + ox, p1.y + oy, p2.x + ox, p2.y + oy, color);
}

int Screen::triangle_hand(int32_t decideg, int32_t length, int32_t half_width,
                          Color color) noexcept {
  const Point c = center();
  const Point tip = polar(c, length, decideg);
  const int32_t px = fixed::scale_q14(half_width, fixed::cos_q14(decideg));
  const int32_t py = fixed::scale_q14(half_width, fixed::sin_q14(decideg));
  return raster::fill_triangle(be_, tip.x, tip.y, c.x - px, c.y - py, c.x + px, c.y + py, color);
}

int Screen::compass(int32_t heading_deg, Color color) noexcept {
  int ret = init();
  if (ret < 0) {
    return ret;
  }

  const Point c = center();
  const int32_t r = radius() - kCompassInset;

  ret = raster::draw_circle(be_, c.x, c.y, r, colors::kDark);
  if (ret < 0) {
    return ret;
  }
  ret = raster::draw_circle(be_, c.x, c.y, r * 7 / 10, colors::kDark);
  if (ret < 0) {
    return ret;
  }

  for (int32_t deg = 0; deg < 360; deg += 45) {
    const bool cardinal = (deg % 90) == 0;
    ret = radial_tick(deg * 10, r - (cardinal ? kCompassCardinalTick : kCompassTick), r,
                      cardinal ? colors::kLight : colors::kDark, cardinal);
    if (ret < 0) {
      return ret;
    }
  }

  for (const DialLabel& l : kCompassLabels) {
    const Point p = polar(c, r + kCompassLabelOut, l.decideg);
    ret = be_.text(l.text, p.x - raster::kCellWidth / 2, p.y - raster::kCellHeight / 2,
                   l.decideg == 0 ? colors::kWhite : colors::kGray);
    if (ret < 0) {
      return ret;
    }
  }

  const NeedleGeometry n = compass_needle(c, r * 85 / 100, heading_deg, kNeedleHalfWidth);
  ret = raster::fill_triangle(be_, n.tip.x, n.tip.y, n.base_a.x, n.base_a.y, n.base_b.x,
                              n.base_b.y, color);
  if (ret < 0) {
    return ret;
  }
  ret = raster::fill_triangle(be_, n.tail.x, n.tail.y, n.base_a.x, n.base_a.y, n.base_b.x,
                              n.base_b.y, colors::kDark);
  if (ret < 0) {
    return ret;
  }
  return raster::fill_circle(be_, c.x, c.y, kPivotRadius, colors::kGray);
}

int Screen::watch(int32_t hours, int32_t minutes, int32_t seconds, Color color) noexcept {
  int ret = init();
  if (ret < 0) {
    return ret;
  }

  const Point c = center();
  const int32_t r = radius() - kWatchInset;

  for (int32_t i = 0; i < 12; ++i) {
    const bool quarter = (i % 3) == 0;
    ret = radial_tick(i * 300, r - (quarter ? kWatchQuarterTick : kWatchTick), r,
                      quarter ? colors::kLight : colors::kGray, quarter);
    if (ret < 0) {
      return ret;
    }
  }

  for (const DialLabel& l : kWatchNumerals) {
    const Point p = polar(c, r - kWatchNumeralInset, l.decideg);
    ret = centered_text(l.text, p.x, p.y - raster::kCellHeight / 2, colors::kLight);
    if (ret < 0) {
      return ret;
    }
  }

  const HandAngles a = hand_angles(hours, minutes, seconds);
  ret = triangle_hand(a.hour, r * 50 / 100, 3, color);
  if (ret < 0) {
    return ret;
  }
  ret = triangle_hand(a.minute, r * 75 / 100, 2, color);
  if (ret < 0) {
    return ret;
  }

  const Point sec = polar(c, r * 85 / 100, a.second);
  ret = be_.line(c.x, c.y, sec.x, sec.y, colors::kRed);
  if (ret < 0) {
    return ret;
  }
  return raster::fill_circle(be_, c.x, c.y, kWatchPivotRadius, colors::kGray);
}

int Screen::face(const char* expression, const FaceOptions& opts) noexcept {
  if (expression == nullptr) {
    return -EINVAL;
  }

  int ret = init();
  if (ret < 0) {
    return ret;
  }

  const FaceBitmap* bitmap = faces::find(expression);
  if (bitmap == nullptr) {
    log_.warnf("unknown face expression '%s'", expression);
    return 0;
  }
  return face(*bitmap, opts);
}

int Screen::face(const FaceBitmap& bitmap, const FaceOptions& opts) noexcept {
  int ret = init();
  if (ret < 0) {
    return ret;
  }

  const Point c = center();
  const int32_t r = radius();
  int32_t cell = opts.compact ? r / 8 : r * 3 / 2 / 8;
  if (cell < 1) {
    cell = 1;
  }

  const int32_t block = cell * 8;
  const int32_t x0 = c.x - block / 2;
  const int32_t y0 = c.y - block / 2 - (opts.compact ? r / 8 : 0);
  /* 大格子之间留 1 像素缝隙，呈现像素画效果。 */
  const int32_t dot = cell >= 4 ? cell - 1 : cell;

  for (int row = 0; row < 8; ++row) {
    for (int col = 0; col < 8; ++col) {
      if (!bitmap.lit(row, col)) {
        continue;
      }
      ret = be_.fill_rect(x0 + col * cell, y0 + row * cell, dot, dot, opts.color);
      if (ret < 0) {
        return ret;
      }
    }
  }
  return 0;
}

}  // namespace screen
