/**
 * @file widgets.cpp
 * @brief 文本类与数据类控件：title / subtitle / value / bar / gauge / graph / menu。
 */

#include <errno.h>
#include <stdio.h>
#include <string.h>

#include "screen/fixed_math.hpp"
#include "screen/raster.hpp"
#include "screen/screen.hpp"

namespace screen {

namespace {

/* 仪表几何：起点 135 度（左下），顺时针扫 270 度，底部留缺口。 */
constexpr int32_t kGaugeStartDeg = 135;
constexpr int32_t kGaugeSweepDeg = 270;
constexpr uint8_t kGaugeArcWidth = 3U;
constexpr int32_t kGaugeInset = 8;
constexpr int32_t kGaugeLabelInset = 10;
constexpr int32_t kGaugeLabelOverhangDeg = 15;

constexpr int32_t kBarSideMargin = 20;
constexpr int32_t kBarHeight = 8;
constexpr int32_t kBarBelowCenter = 20;

/* 标签与数值之间的间隔。 */
constexpr int32_t kLabelGap = 4;

constexpr int32_t kGraphLeft = 30;
constexpr int32_t kGraphRightMargin = 20;
constexpr int32_t kGraphBottomMargin = 20;
constexpr int32_t kGraphAboveCenter = 5;

constexpr int32_t kMenuItemHeight = 14;
constexpr int32_t kMenuTop = 25;
constexpr int32_t kMenuReserved = 40;
constexpr int32_t kMenuSideMargin = 15;
constexpr int32_t kMenuTextX = 18;

constexpr int32_t kSubtitlePitch = 10;

}  // namespace

int32_t ratio_permille(int32_t value, int32_t min, int32_t max) noexcept {
  int64_t span = static_cast<int64_t>(max) - min;
  if (span <= 0) {
    span = 1;
  }
  const int64_t r = (static_cast<int64_t>(value) - min) * 1000 / span;
  return static_cast<int32_t>(fixed::clamp<int64_t>(r, 0, 1000));
}

int32_t gauge_sweep(int32_t value, int32_t min, int32_t max) noexcept {
  int64_t span = static_cast<int64_t>(max) - min;
  if (span <= 0) {
    span = 1;
  }
  const int64_t s = (static_cast<int64_t>(value) - min) * kGaugeSweepDeg / span;
  return static_cast<int32_t>(fixed::clamp<int64_t>(s, 0, kGaugeSweepDeg));
}

int32_t bar_fill_width(int32_t track_w, int32_t value, int32_t max) noexcept {
  if (max <= 0 || track_w <= 0) {
    return 0;
  }
  const int32_t v = fixed::clamp(value, 0, max);
  return static_cast<int32_t>(static_cast<int64_t>(track_w) * v / max);
}

size_t menu_window_start(size_t count, size_t selected, size_t visible) noexcept {
  if (visible >= count) {
    return 0U;
  }
  const size_t half = visible / 2U;
  const size_t start = selected > half ? selected - half : 0U;
  const size_t last = count - visible;
  return start > last ? last : start;
}

int format_axis_label(int32_t value, char* buf, size_t len) noexcept {
  if (buf == nullptr || len == 0U) {
    return -EINVAL;
  }

  const int64_t mag = value < 0 ? -static_cast<int64_t>(value) : value;
  if (mag < 1000) {
    return snprintf(buf, len, "%ld", static_cast<long>(value));
  }

  const char* sign = value < 0 ? "-" : "";
  const int64_t whole = mag / 1000;
  const int64_t tenth = (mag % 1000) / 100;
  if (mag % 1000 == 0) {
    return snprintf(buf, len, "%s%ldk", sign, static_cast<long>(whole));
  }
  return snprintf(buf, len, "%s%ld.%ldk", sign, static_cast<long>(whole),
                  static_cast<long>(tenth));
}

int Screen::title(const char* text, Color color) noexcept {
  if (text == nullptr) {
    return -EINVAL;
  }

  int ret = init();
  if (ret < 0) {
    return ret;
  }

  const Point p = layout_.resolve(Cardinal::kN, strlen(text), 1U);
  return be_.text(text, p.x, p.y, color);
}

int Screen::subtitle(const char* text, Color color) noexcept {
  if (text == nullptr) {
    return -EINVAL;
  }

  int ret = init();
  if (ret < 0) {
    return ret;
  }

  /* 与 title 对称：在 S 锚点基础上再下移一个字符高度。 */
  const Point p = layout_.resolve(Cardinal::kS, strlen(text), 1U);
  return be_.text(text, p.x, p.y + raster::kCellHeight, color);
}

int Screen::subtitle(const char* const* lines, size_t count, Color color) noexcept {
  if (count == 0U) {
    return 0;
  }
  if (lines == nullptr) {
    return -EINVAL;
  }
  if (count == 1U) {
    return subtitle(lines[0], color);
  }

  int ret = init();
  if (ret < 0) {
    return ret;
  }

  const size_t n = count > kMaxSubtitleLines ? kMaxSubtitleLines : count;
  size_t longest = 0U;
  for (size_t i = 0U; i < n; ++i) {
    if (lines[i] == nullptr) {
      return -EINVAL;
    }
    const size_t len = strlen(lines[i]);
    if (len > longest) {
      longest = len;
    }
  }

  /* 以最长行求得的 S 锚点为中心，整体垂直居中。 */
  const Point anchor = layout_.resolve(Cardinal::kS, longest, 1U);
  const int32_t slot_center = anchor.y + raster::kCellHeight / 2;
  const int32_t rows = static_cast<int32_t>(n);
  const int32_t block_h = rows * raster::kCellHeight + (rows - 1) * (kSubtitlePitch - raster::kCellHeight);
  const int32_t top = slot_center - block_h / 2;
  const int32_t cx = center().x;

  for (size_t i = 0U; i < n; ++i) {
    ret = centered_text(lines[i], cx, top + static_cast<int32_t>(i) * kSubtitlePitch, color);
    if (ret < 0) {
      return ret;
    }
  }
  return 0;
}

int Screen::value(const char* text, const ValueOptions& opts) noexcept {
  if (text == nullptr) {
    return -EINVAL;
  }

  int ret = init();
  if (ret < 0) {
    return ret;
  }

  const uint8_t scale = opts.scale == 0U ? 1U : opts.scale;
  const size_t len = strlen(text);
  const int32_t tw = raster::text_width(len, scale);
  const int32_t ch = raster::kCellHeight * static_cast<int32_t>(scale);
  const int32_t label_block = opts.label != nullptr ? raster::kCellHeight + kLabelGap : 0;
  const int32_t unit_block = opts.unit != nullptr ? ch / 2 + raster::kCellHeight : 0;
  const int32_t block_h = label_block + ch + unit_block;

  const Point c = center();
  const int32_t w = static_cast<int32_t>(viewport().width);
  const int32_t centered_y = c.y - block_h / 2 + label_block + opts.y_offset;

  int32_t x = 0;
  int32_t y = centered_y;
  switch (opts.at) {
    case Cardinal::kCenter:
      x = c.x - tw / 2;
      break;
    case Cardinal::kW:
      x = w / 4 - tw / 2;
      break;
    case Cardinal::kE:
      x = w * 3 / 4 - tw / 2;
      break;
    default: {
      const Point p = layout_.resolve(opts.at, len, scale);
      x = p.x;
      y = p.y + opts.y_offset;
      break;
    }
  }

  const int32_t mid_x = x + tw / 2;
  if (opts.label != nullptr) {
    const int32_t lw = raster::text_width(strlen(opts.label), 1U);
    ret = be_.draw_small_text(opts.label, mid_x - lw / 2, y - raster::kCellHeight - kLabelGap,
                              colors::kGray);
    if (ret < 0) {
      return ret;
    }
  }

  ret = scaled_text(text, x, y, opts.color, scale);
  if (ret < 0) {
    return ret;
  }

  if (opts.unit != nullptr) {
    const int32_t uw = raster::text_width(strlen(opts.unit), 1U);
    ret = be_.draw_medium_text(opts.unit, mid_x - uw / 2, y + ch + ch / 2, colors::kLight);
    if (ret < 0) {
      return ret;
    }
  }
  return 0;
}

int Screen::value(int32_t v, const ValueOptions& opts) noexcept {
  char buf[16];
  (void)snprintf(buf, sizeof(buf), "%ld", static_cast<long>(v));
  return value(buf, opts);
}

int Screen::bar(int32_t value, int32_t max, int32_t y_offset, Color color) noexcept {
  int ret = init();
  if (ret < 0) {
    return ret;
  }

  const Point c = center();
  const int32_t track_w = static_cast<int32_t>(viewport().width) - 2 * kBarSideMargin;
  const int32_t bx = c.x - track_w / 2;
  const int32_t by = c.y + kBarBelowCenter + y_offset;

  ret = be_.fill_rect(bx, by, track_w, kBarHeight, colors::kDark);
  if (ret < 0) {
    return ret;
  }

  const int32_t fill_w = bar_fill_width(track_w, value, max);
  if (fill_w > 0) {
    ret = be_.fill_rect(bx, by, fill_w, kBarHeight, color);
    if (ret < 0) {
      return ret;
    }
  }
  return 0;
}

int Screen::gauge(int32_t value, int32_t min, int32_t max, const char* unit,
                  Color color) noexcept {
  int ret = init();
  if (ret < 0) {
    return ret;
  }

  const Point c = center();
  const int32_t r = radius() - kGaugeInset;

  /* 背景弧 */
  ret = be_.draw_arc(c.x, c.y, r, kGaugeStartDeg, kGaugeSweepDeg, colors::kDark, kGaugeArcWidth);
  if (ret < 0) {
    return ret;
  }

  const int32_t sweep = gauge_sweep(value, min, max);
  if (sweep > 0) {
    ret = be_.draw_arc(c.x, c.y, r, kGaugeStartDeg, sweep, color, kGaugeArcWidth);
    if (ret < 0) {
      return ret;
    }
  }

  ValueOptions vo;
  vo.unit = unit;
  ret = this->value(value, vo);
  if (ret < 0) {
    return ret;
  }

  /* 量程标签放在弧两端稍外侧。 */
  const int32_t lr = r - kGaugeLabelInset;
  const int32_t ends[2] = {kGaugeStartDeg - kGaugeLabelOverhangDeg,
                           kGaugeStartDeg + kGaugeSweepDeg + kGaugeLabelOverhangDeg};
  const int32_t bounds[2] = {min, max};
  for (int i = 0; i < 2; ++i) {
    char buf[16];
    (void)snprintf(buf, sizeof(buf), "%ld", static_cast<long>(bounds[i]));
    const int32_t d = ends[i] * 10;
    const int32_t px = c.x + fixed::scale_q14(lr, fixed::cos_q14(d));
    const int32_t py = c.y + fixed::scale_q14(lr, fixed::sin_q14(d));
    const int32_t tw = raster::text_width(strlen(buf), 1U);
    ret = be_.draw_small_text(buf, px - tw / 2, py - raster::kCellHeight / 2, colors::kGray);
    if (ret < 0) {
      return ret;
    }
  }
  return 0;
}

int Screen::graph(const int32_t* samples, size_t count, int32_t min, int32_t max,
                  Color color) noexcept {
  if (samples == nullptr && count > 0U) {
    return -EINVAL;
  }

  int ret = init();
  if (ret < 0) {
    return ret;
  }

  const Point c = center();
  const int32_t w = static_cast<int32_t>(viewport().width);
  const int32_t h = static_cast<int32_t>(viewport().height);
  const int32_t gx = kGraphLeft;
  const int32_t gy = c.y - kGraphAboveCenter;
  const int32_t gw = w - kGraphLeft - kGraphRightMargin;
  const int32_t gh = h - gy - kGraphBottomMargin;
  if (gw <= 0 || gh <= 0) {
    return 0;
  }

  /* 坐标轴 */
  ret = raster::vline(be_, gx, gy, gh, colors::kDark);
  if (ret < 0) {
    return ret;
  }
  ret = raster::hline(be_, gx, gy + gh, gw, colors::kDark);
  if (ret < 0) {
    return ret;
  }

  /* 虚线中线：2 像素实、2 像素空 */
  const int32_t mid_y = gy + gh / 2;
  for (int32_t x = gx + 2; x < gx + gw; x += 4) {
    ret = raster::plot(be_, x, mid_y, colors::kDark);
    if (ret < 0) {
      return ret;
    }
    if (x + 1 >= gx + gw) {
      break;
    }
    ret = raster::plot(be_, x + 1, mid_y, colors::kDark);
    if (ret < 0) {
      return ret;
    }
  }

  const int32_t hi = max > min ? max : min;

  /* Y 轴标签：右对齐到坐标轴左侧 2 像素 */
  const int32_t marks[3] = {hi, static_cast<int32_t>((static_cast<int64_t>(min) + hi) / 2), min};
  const int32_t rows[3] = {gy, mid_y, gy + gh};
  for (int i = 0; i < 3; ++i) {
    char buf[16];
    if (format_axis_label(marks[i], buf, sizeof(buf)) < 0) {
      return -EINVAL;
    }
    const int32_t tw = raster::text_width(strlen(buf), 1U);
    ret = be_.draw_small_text(buf, gx - tw - 2, rows[i] - raster::kCellHeight / 2, colors::kGray);
    if (ret < 0) {
      return ret;
    }
  }

  if (count == 0U) {
    return 0;
  }

  /* 最新值显示在曲线上方 */
  char latest[16];
  (void)snprintf(latest, sizeof(latest), "%ld", static_cast<long>(samples[count - 1U]));
  const int32_t lw = raster::text_width(strlen(latest), 2U);
  ret = scaled_text(latest, c.x - lw / 2, gy - 2 * raster::kCellHeight - 4, colors::kWhite, 2U);
  if (ret < 0) {
    return ret;
  }

  if (count < 2U) {
    return 0;
  }

  int64_t span = static_cast<int64_t>(hi) - min;
  if (span == 0) {
    span = 1;
  }
  const int64_t last = static_cast<int64_t>(count) - 1;

  int32_t prev_x = 0;
  int32_t prev_y = 0;
  for (size_t i = 0U; i < count; ++i) {
    const int32_t v = fixed::clamp(samples[i], min, hi);
    const int32_t px = gx + static_cast<int32_t>(static_cast<int64_t>(i) * gw / last);
    const int32_t py = gy + static_cast<int32_t>(static_cast<int64_t>(gh) * (static_cast<int64_t>(hi) - v) / span);
    if (i > 0U) {
      ret = be_.line(prev_x, prev_y, px, py, color);
      if (ret < 0) {
        return ret;
      }
    }
    prev_x = px;
    prev_y = py;
  }
  return 0;
}

int Screen::menu(const char* const* items, size_t count, size_t selected, Color color) noexcept {
  if (count == 0U) {
    return 0;
  }
  if (items == nullptr) {
    return -EINVAL;
  }

  int ret = init();
  if (ret < 0) {
    return ret;
  }

  const int32_t w = static_cast<int32_t>(viewport().width);
  const int32_t h = static_cast<int32_t>(viewport().height);
  const int32_t fit = (h - kMenuReserved) / kMenuItemHeight;
  if (fit <= 0) {
    return 0;
  }

  const size_t visible = count < static_cast<size_t>(fit) ? count : static_cast<size_t>(fit);
  const size_t sel = selected < count ? selected : count - 1U;
  const size_t start = menu_window_start(count, sel, visible);

  for (size_t i = start; i < start + visible; ++i) {
    const int32_t iy = kMenuTop + static_cast<int32_t>(i - start) * kMenuItemHeight;
    const char* item = items[i] != nullptr ? items[i] : "";
    char buf[kMaxLineChars + 3U];

    if (i == sel) {
      ret = be_.fill_rect(kMenuSideMargin, iy - 2, w - 2 * kMenuSideMargin, kMenuItemHeight,
                          colors::kDark);
      if (ret < 0) {
        return ret;
      }
      (void)snprintf(buf, sizeof(buf), "> %s", item);
      ret = be_.text(buf, kMenuTextX, iy, color);
    } else {
      (void)snprintf(buf, sizeof(buf), "  %s", item);
      ret = be_.text(buf, kMenuTextX, iy, colors::kGray);
    }
    if (ret < 0) {
      return ret;
    }
  }
  return 0;
}

}  // namespace screen
