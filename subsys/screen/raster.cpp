/**
 * @file raster.cpp
 * @brief 光栅化基元实现（纯整数运算）。
 */

#include "screen/raster.hpp"

#include <errno.h>

#include "screen/fixed_math.hpp"

namespace screen::raster {

namespace {

/** @brief 判断点是否落在后端可视范围内。 */
bool inside(const IPixelBackend& be, int32_t x, int32_t y) noexcept {
  return x >= 0 && y >= 0 && x < static_cast<int32_t>(be.width()) &&
         y < static_cast<int32_t>(be.height());
}

/**
 * @brief 裁剪并绘制一条水平扫描线 [x1, x2]。
 */
int span(IPixelBackend& be, int32_t x1, int32_t x2, int32_t y, Color color) noexcept {
  if (y < 0 || y >= static_cast<int32_t>(be.height())) {
    return 0;
  }
  if (x1 > x2) {
    const int32_t t = x1;
    x1 = x2;
    x2 = t;
  }
  if (x1 < 0) {
    x1 = 0;
  }
  const int32_t max_x = static_cast<int32_t>(be.width()) - 1;
  if (x2 > max_x) {
    x2 = max_x;
  }
  if (x1 > x2) {
    return 0;
  }
  return be.line(x1, y, x2, y, color);
}

/**
 * @brief 三角形边插值：x = xa + (xb-xa)*(y-ya) // (yb-ya)，水平边返回 xa。
 */
int32_t interp(int32_t ya, int32_t xa, int32_t yb, int32_t xb, int32_t y) noexcept {
  if (yb == ya) {
    return xa;
  }
  return xa + fixed::floor_div((xb - xa) * (y - ya), yb - ya);
}

}  // namespace

int plot(IPixelBackend& be, int32_t x, int32_t y, Color color) noexcept {
  if (!inside(be, x, y)) {
    return 0;
  }
  return be.pixel(x, y, color);
}

int hline(IPixelBackend& be, int32_t x, int32_t y, int32_t w, Color color) noexcept {
  if (w <= 0) {
    return 0;
  }
  return span(be, x, x + w - 1, y, color);
}

int vline(IPixelBackend& be, int32_t x, int32_t y, int32_t h, Color color) noexcept {
  if (h <= 0 || x < 0 || x >= static_cast<int32_t>(be.width())) {
    return 0;
  }
  int32_t y1 = y;
  int32_t y2 = y + h - 1;
  if (y1 < 0) {
    y1 = 0;
  }
  const int32_t max_y = static_cast<int32_t>(be.height()) - 1;
  if (y2 > max_y) {
    y2 = max_y;
  }
  if (y1 > y2) {
    return 0;
  }
  return be.line(x, y1, x, y2, color);
}

int fill_rect_lines(IPixelBackend& be, int32_t x, int32_t y, int32_t w, int32_t h,
                    Color color) noexcept {
  if (w <= 0 || h <= 0) {
    return 0;
  }

  for (int32_t row = 0; row < h; ++row) {
    const int ret = hline(be, x, y + row, w, color);
    if (ret < 0) {
      return ret;
    }
  }
  return 0;
}

int rect_lines(IPixelBackend& be, int32_t x, int32_t y, int32_t w, int32_t h,
               Color color) noexcept {
  if (w <= 0 || h <= 0) {
    return 0;
  }

  int ret = hline(be, x, y, w, color);
  if (ret < 0) {
    return ret;
  }
  ret = hline(be, x, y + h - 1, w, color);
  if (ret < 0) {
    return ret;
  }
  ret = vline(be, x, y, h, color);
  if (ret < 0) {
    return ret;
  }
  return vline(be, x + w - 1, y, h, color);
}

int draw_circle(IPixelBackend& be, int32_t cx, int32_t cy, int32_t r, Color color) noexcept {
  if (r < 0) {
    return 0;
  }

  int32_t x = r;
  int32_t y = 0;
  int32_t d = 1 - r;
  while (x >= y) {
    const int32_t pts[8][2] = {
        {x, y}, {y, x}, {-x, y}, {-y, x}, {x, -y}, {y, -x}, {-x, -y}, {-y, -x},
    };
    for (const auto& p : pts) {
      const int ret = plot(be, cx + p[0], cy + p[1], color);
      if (ret < 0) {
        return ret;
      }
    }

    ++y;
    if (d < 0) {
      d += 2 * y + 1;
    } else {
      --x;
      d += 2 * (y - x) + 1;
    }
  }
  return 0;
}

int fill_circle(IPixelBackend& be, int32_t cx, int32_t cy, int32_t r, Color color) noexcept {
  if (r < 0) {
    return 0;
  }

  /* 只遍历落在可视行内的扫描线。 */
  const int64_t rows = static_cast<int64_t>(be.height());
  const int64_t dy_lo = -static_cast<int64_t>(cy) > -r ? -static_cast<int64_t>(cy) : -r;
  const int64_t dy_hi = rows - 1 - cy < r ? rows - 1 - cy : r;
  const int64_t cols = static_cast<int64_t>(be.width());
  const int64_t r2 = static_cast<int64_t>(r) * r;
  for (int64_t dy = dy_lo; dy <= dy_hi; ++dy) {
    const int64_t dx = fixed::isqrt(static_cast<uint64_t>(r2 - dy * dy));
    int64_t x1 = cx - dx;
    int64_t x2 = cx + dx;
    if (x2 < 0 || x1 >= cols) {
      continue;
    }
    x1 = x1 < 0 ? 0 : x1;
    x2 = x2 > cols - 1 ? cols - 1 : x2;
    const int ret = span(be, static_cast<int32_t>(x1), static_cast<int32_t>(x2),
                         static_cast<int32_t>(cy + dy), color);
    if (ret < 0) {
      return ret;
    }
  }
  return 0;
}

int draw_arc_stepped(IPixelBackend& be, int32_t cx, int32_t cy, int32_t r, int32_t start_deg,
                     int32_t sweep_deg, Color color, uint8_t width) noexcept {
  if (sweep_deg <= 0 || r < 0) {
    return 0;
  }
  if (width == 0U) {
    width = 1U;
  }

  const int32_t half = static_cast<int32_t>(width) / 2;
  const int32_t steps = sweep_deg > kMinArcSteps ? sweep_deg : kMinArcSteps;
  for (int32_t i = 0; i <= steps; ++i) {
    /* 角度用十分之一度表示，避免 sweep < steps 时丢失精度。 */
    const int64_t d = static_cast<int64_t>(start_deg) * 10 +
                      static_cast<int64_t>(i) * sweep_deg * 10 / steps;
    const int32_t decideg = static_cast<int32_t>(d % 3600);
    const int32_t c = fixed::cos_q14(decideg);
    const int32_t s = fixed::sin_q14(decideg);
    for (int32_t off = -half; off <= half; ++off) {
      const int32_t rr = r + off;
      const int ret = plot(be, cx + fixed::scale_q14(rr, c), cy + fixed::scale_q14(rr, s), color);
      if (ret < 0) {
        return ret;
      }
    }
  }
  return 0;
}

int fill_triangle(IPixelBackend& be, int32_t x0, int32_t y0, int32_t x1, int32_t y1, int32_t x2,
                  int32_t y2, Color color) noexcept {
  /* 按 y 排序三个顶点：(ax,ay) <= (bx,by) <= (cx,cy)。 */
  int32_t p[3][2] = {{x0, y0}, {x1, y1}, {x2, y2}};
  for (int i = 0; i < 2; ++i) {
    for (int j = 0; j < 2 - i; ++j) {
      if (p[j][1] > p[j + 1][1]) {
        const int32_t tx = p[j][0];
        const int32_t ty = p[j][1];
        p[j][0] = p[j + 1][0];
        p[j][1] = p[j + 1][1];
        p[j + 1][0] = tx;
        p[j + 1][1] = ty;
      }
    }
  }
  const int32_t ax = p[0][0];
  const int32_t ay = p[0][1];
  const int32_t bx = p[1][0];
  const int32_t by = p[1][1];
  const int32_t cx = p[2][0];
  const int32_t cy = p[2][1];

  for (int32_t y = ay; y <= cy; ++y) {
    const int32_t xl = interp(ay, ax, cy, cx, y);
    const int32_t xr = y < by ? interp(ay, ax, by, bx, y) : interp(by, bx, cy, cx, y);
    const int ret = span(be, xl, xr, y, color);
    if (ret < 0) {
      return ret;
    }
  }
  return 0;
}

int faux_scaled_text(IPixelBackend& be, const char* str, int32_t x, int32_t y, Color color,
                     uint8_t scale) noexcept {
  if (str == nullptr) {
    return -EINVAL;
  }
  if (scale != 2U && scale != 3U) {
    return be.text(str, x, y, color);
  }

  for (int32_t dx = 0; dx < scale; ++dx) {
    for (int32_t dy = 0; dy < scale; ++dy) {
      const int ret = be.text(str, x + dx, y + dy, color);
      if (ret < 0) {
        return ret;
      }
    }
  }
  return 0;
}

}  // namespace screen::raster
