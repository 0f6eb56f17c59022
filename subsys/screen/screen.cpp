/**
 * @file screen.cpp
 * @brief Screen 初始化、控制接口与方位文本/基本图形实现。
 */

#include "screen/screen.hpp"

#include <errno.h>
#include <string.h>

#include "screen/raster.hpp"

namespace screen {

int Screen::init() noexcept {
  /* 幂等保护：已经初始化过则直接成功返回。 */
  if (initialized_) {
    return 0;
  }

  const Viewport vp{be_.width(), be_.height()};
  if (!vp.valid()) {
    /* 后端未就绪或配置错误时只报告一次，避免每帧刷屏。 */
    if (!geometry_error_reported_) {
      geometry_error_reported_ = true;
      log_.error("pixel backend reports degenerate geometry", -EINVAL);
    }
    return -EINVAL;
  }

  layout_ = Layout(vp);
  initialized_ = true;
  log_.infof("screen ready: %ux%u radius=%d", static_cast<unsigned>(vp.width),
             static_cast<unsigned>(vp.height), static_cast<int>(vp.radius()));
  return 0;
}

int Screen::clear(Color color) noexcept {
  int ret = init();
  if (ret < 0) {
    return ret;
  }
  return be_.fill(color);
}

int Screen::show() noexcept {
  int ret = init();
  if (ret < 0) {
    return ret;
  }
  return be_.show();
}

int Screen::text(const char* str, Cardinal at, Color color, uint8_t scale) noexcept {
  if (str == nullptr) {
    return -EINVAL;
  }

  int ret = init();
  if (ret < 0) {
    return ret;
  }

  if (scale == 0U) {
    scale = 1U;
  }
  const Point p = layout_.resolve(at, strlen(str), scale);
  return scaled_text(str, p.x, p.y, color, scale);
}

int Screen::text_at(const char* str, int32_t x, int32_t y, Color color, uint8_t scale) noexcept {
  if (str == nullptr) {
    return -EINVAL;
  }

  int ret = init();
  if (ret < 0) {
    return ret;
  }
  return scaled_text(str, x, y, color, scale);
}

int Screen::line(int32_t x1, int32_t y1, int32_t x2, int32_t y2, Color color) noexcept {
  int ret = init();
  if (ret < 0) {
    return ret;
  }
  return be_.line(x1, y1, x2, y2, color);
}

int Screen::circle(int32_t cx, int32_t cy, int32_t r, Color color, bool fill) noexcept {
  int ret = init();
  if (ret < 0) {
    return ret;
  }
  return fill ? raster::fill_circle(be_, cx, cy, r, color)
              : raster::draw_circle(be_, cx, cy, r, color);
}

int Screen::rect(int32_t x, int32_t y, int32_t w, int32_t h, Color color, bool fill) noexcept {
  int ret = init();
  if (ret < 0) {
    return ret;
  }
  return fill ? be_.fill_rect(x, y, w, h, color) : be_.rect(x, y, w, h, color);
}

int Screen::arc(int32_t cx, int32_t cy, int32_t r, int32_t start_deg, int32_t sweep_deg,
                Color color, uint8_t width) noexcept {
  int ret = init();
  if (ret < 0) {
    return ret;
  }
  return be_.draw_arc(cx, cy, r, start_deg, sweep_deg, color, width);
}

int Screen::triangle(Point a, Point b, Point c, Color color) noexcept {
  int ret = init();
  if (ret < 0) {
    return ret;
  }
  return raster::fill_triangle(be_, a.x, a.y, b.x, b.y, c.x, c.y, color);
}

int Screen::pixel(int32_t x, int32_t y, Color color) noexcept {
  int ret = init();
  if (ret < 0) {
    return ret;
  }
  return raster::plot(be_, x, y, color);
}

int Screen::scaled_text(const char* str, int32_t x, int32_t y, Color color,
                        uint8_t scale) noexcept {
  if (scale <= 1U) {
    return be_.text(str, x, y, color);
  }
  return be_.draw_scaled_text(str, x, y, color, scale);
}

int Screen::centered_text(const char* str, int32_t cx, int32_t y, Color color) noexcept {
  const int32_t tw = raster::text_width(strlen(str), 1U);
  return be_.text(str, cx - tw / 2, y, color);
}

}  // namespace screen
