/**
 * @file framebuffer.cpp
 * @brief 内存 RGB565 帧缓冲后端实现。
 */

#include "screen/framebuffer.hpp"

#include <errno.h>

#include "platform/font5x7.hpp"
#include "screen/raster.hpp"

namespace screen {

FrameBuffer::FrameBuffer(uint16_t* pixels, uint16_t width, uint16_t height) noexcept
    : pixels_(pixels), width_(width), height_(height) {}

uint16_t FrameBuffer::width() const noexcept { return valid() ? width_ : 0U; }

uint16_t FrameBuffer::height() const noexcept { return valid() ? height_ : 0U; }

void FrameBuffer::put(int32_t x, int32_t y, uint16_t rgb565) noexcept {
  if (x < 0 || y < 0 || x >= static_cast<int32_t>(width_) || y >= static_cast<int32_t>(height_)) {
    return;
  }
  pixels_[static_cast<size_t>(y) * width_ + static_cast<size_t>(x)] = rgb565;
}

int FrameBuffer::fill(Color color) noexcept {
  if (!valid()) {
    return -ENODEV;
  }

  const uint16_t v = color.to_rgb565();
  const size_t n = static_cast<size_t>(width_) * height_;
  for (size_t i = 0U; i < n; ++i) {
    pixels_[i] = v;
  }
  return 0;
}

int FrameBuffer::pixel(int32_t x, int32_t y, Color color) noexcept {
  if (!valid()) {
    return -ENODEV;
  }
  put(x, y, color.to_rgb565());
  return 0;
}

int FrameBuffer::line(int32_t x1, int32_t y1, int32_t x2, int32_t y2, Color color) noexcept {
  if (!valid()) {
    return -ENODEV;
  }

  /* Bresenham，全八分区，逐像素裁剪。 */
  const uint16_t v = color.to_rgb565();
  const int32_t dx = x2 > x1 ? x2 - x1 : x1 - x2;
  const int32_t dy = y2 > y1 ? y1 - y2 : y2 - y1;
  const int32_t sx = x1 < x2 ? 1 : -1;
  const int32_t sy = y1 < y2 ? 1 : -1;
  int32_t err = dx + dy;
  int32_t x = x1;
  int32_t y = y1;

  while (true) {
    put(x, y, v);
    if (x == x2 && y == y2) {
      break;
    }
    const int32_t e2 = 2 * err;
    if (e2 >= dy) {
      err += dy;
      x += sx;
    }
    if (e2 <= dx) {
      err += dx;
      y += sy;
    }
  }
  return 0;
}

int FrameBuffer::fill_rect(int32_t x, int32_t y, int32_t w, int32_t h, Color color) noexcept {
  if (!valid()) {
    return -ENODEV;
  }
  if (w <= 0 || h <= 0) {
    return 0;
  }

  const uint16_t v = color.to_rgb565();
  for (int32_t row = y; row < y + h; ++row) {
    for (int32_t col = x; col < x + w; ++col) {
      put(col, row, v);
    }
  }
  return 0;
}

int FrameBuffer::text(const char* str, int32_t x, int32_t y, Color color) noexcept {
  if (str == nullptr) {
    return -EINVAL;
  }
  if (!valid()) {
    return -ENODEV;
  }

  /* 5x7 字模画在每个 8x8 字符格的左上角，背景透明。 */
  const uint16_t v = color.to_rgb565();
  int32_t cursor = x;
  for (const char* p = str; *p != '\0'; ++p) {
    const uint8_t* g = platform::font5x7::glyph(*p);
    for (uint8_t col = 0U; col < platform::font5x7::kWidth; ++col) {
      for (uint8_t row = 0U; row < platform::font5x7::kHeight; ++row) {
        if (platform::font5x7::lit(g, col, row)) {
          put(cursor + col, y + row, v);
        }
      }
    }
    cursor += raster::kCellWidth;
  }
  return 0;
}

int FrameBuffer::show() noexcept {
  ++frames_;
  return 0;
}

uint16_t FrameBuffer::pixel_at(int32_t x, int32_t y) const noexcept {
  if (!valid() || x < 0 || y < 0 || x >= static_cast<int32_t>(width_) ||
      y >= static_cast<int32_t>(height_)) {
    return 0U;
  }
  return pixels_[static_cast<size_t>(y) * width_ + static_cast<size_t>(x)];
}

size_t FrameBuffer::count_color(Color color) const noexcept {
  if (!valid()) {
    return 0U;
  }

  const uint16_t v = color.to_rgb565();
  const size_t n = static_cast<size_t>(width_) * height_;
  size_t count = 0U;
  for (size_t i = 0U; i < n; ++i) {
    if (pixels_[i] == v) {
      ++count;
    }
  }
  return count;
}

int FrameBuffer::apply_round_mask(Color background, bool border) noexcept {
  if (!valid()) {
    return -ENODEV;
  }

  const int32_t cx = width_ / 2;
  const int32_t cy = height_ / 2;
  const int32_t r = (width_ < height_ ? width_ : height_) / 2;
  const int64_t outer = static_cast<int64_t>(r) * r;
  const int32_t ri = r > kBorderWidth ? r - kBorderWidth : 0;
  const int64_t inner = static_cast<int64_t>(ri) * ri;
  const uint16_t bg = background.to_rgb565();
  const uint16_t ring = kBorderColor.to_rgb565();

  for (int32_t y = 0; y < static_cast<int32_t>(height_); ++y) {
    for (int32_t x = 0; x < static_cast<int32_t>(width_); ++x) {
      const int64_t dx = x - cx;
      const int64_t dy = y - cy;
      const int64_t d2 = dx * dx + dy * dy;
      if (d2 > outer) {
        put(x, y, bg);
      } else if (border && d2 > inner) {
        put(x, y, ring);
      }
    }
  }
  return 0;
}

}  // namespace screen
