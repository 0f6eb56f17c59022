/**
 * @file pixel_backend.cpp
 * @brief IPixelBackend 可选能力的默认（模拟）实现。
 */

#include "screen/ipixel_backend.hpp"

#include "screen/raster.hpp"

namespace screen {

int IPixelBackend::fill_rect(int32_t x, int32_t y, int32_t w, int32_t h, Color color) noexcept {
  return raster::fill_rect_lines(*this, x, y, w, h, color);
}

int IPixelBackend::rect(int32_t x, int32_t y, int32_t w, int32_t h, Color color) noexcept {
  return raster::rect_lines(*this, x, y, w, h, color);
}

int IPixelBackend::draw_scaled_text(const char* str, int32_t x, int32_t y, Color color,
                                    uint8_t scale) noexcept {
  return raster::faux_scaled_text(*this, str, x, y, color, scale);
}

int IPixelBackend::draw_small_text(const char* str, int32_t x, int32_t y, Color color) noexcept {
  return text(str, x, y, color);
}

int IPixelBackend::draw_medium_text(const char* str, int32_t x, int32_t y, Color color) noexcept {
  return text(str, x, y, color);
}

int IPixelBackend::draw_arc(int32_t cx, int32_t cy, int32_t r, int32_t start_deg,
                            int32_t sweep_deg, Color color, uint8_t width) noexcept {
  return raster::draw_arc_stepped(*this, cx, cy, r, start_deg, sweep_deg, color, width);
}

}  // namespace screen
