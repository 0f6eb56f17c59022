/**
 * @file raster.hpp
 * @brief 光栅化基元：圆、实心圆、带宽度圆弧、实心三角形、伪放大字体、矩形模拟。
 * @note 所有基元按后端宽高裁剪到 [0,width) x [0,height)，越界像素静默丢弃。
 */

#pragma once

#include <cstddef>
#include <cstdint>

#include "screen/color.hpp"
#include "screen/ipixel_backend.hpp"

namespace screen::raster {

/** @brief 逻辑字符格宽度（像素，未缩放）。 */
constexpr int32_t kCellWidth = 8;
/** @brief 逻辑字符格高度（像素，未缩放）。 */
constexpr int32_t kCellHeight = 8;
/** @brief 圆弧模拟的最少角度步数。 */
constexpr int32_t kMinArcSteps = 60;

/**
 * @brief 计算字符串在指定缩放下的像素宽度。
 * @param len 字符数。
 * @param scale 缩放倍数。
 * @return len * 8 * scale。
 */
constexpr int32_t text_width(size_t len, uint8_t scale) noexcept {
  return static_cast<int32_t>(len) * kCellWidth * static_cast<int32_t>(scale);
}

/**
 * @brief 绘制单个像素（越界丢弃）。
 * @return 0 表示成功；负值为后端错误。
 */
int plot(IPixelBackend& be, int32_t x, int32_t y, Color color) noexcept;

/**
 * @brief 绘制水平线段 [x, x+w)（裁剪后交给后端 line）。
 */
int hline(IPixelBackend& be, int32_t x, int32_t y, int32_t w, Color color) noexcept;

/**
 * @brief 绘制垂直线段 [y, y+h)（裁剪后交给后端 line）。
 */
int vline(IPixelBackend& be, int32_t x, int32_t y, int32_t h, Color color) noexcept;

/**
 * @brief 逐行 line() 模拟实心矩形。
 */
int fill_rect_lines(IPixelBackend& be, int32_t x, int32_t y, int32_t w, int32_t h,
                    Color color) noexcept;

/**
 * @brief 四条边线模拟矩形边框。
 */
int rect_lines(IPixelBackend& be, int32_t x, int32_t y, int32_t w, int32_t h,
               Color color) noexcept;

/**
 * @brief 中点（Bresenham）画圆，每步输出八向对称点。
 * @param r 半径；0 时只画圆心，负值不绘制。
 */
int draw_circle(IPixelBackend& be, int32_t cx, int32_t cy, int32_t r, Color color) noexcept;

/**
 * @brief 逐扫描线实心圆，半宽 isqrt(r^2 - dy^2)。
 */
int fill_circle(IPixelBackend& be, int32_t cx, int32_t cy, int32_t r, Color color) noexcept;

/**
 * @brief 角度步进绘制带宽度的圆弧。
 * @note 步数 max(sweep, 60)；每步在 [-width/2, width/2] 径向偏移上各输出一个像素，
 *       坐标四舍五入。IPixelBackend::draw_arc 的默认实现。
 */
int draw_arc_stepped(IPixelBackend& be, int32_t cx, int32_t cy, int32_t r, int32_t start_deg,
                     int32_t sweep_deg, Color color, uint8_t width) noexcept;

/**
 * @brief 扫描线实心三角形。
 */
int fill_triangle(IPixelBackend& be, int32_t x0, int32_t y0, int32_t x1, int32_t y1, int32_t x2,
                  int32_t y2, Color color) noexcept;

/**
 * @brief 伪放大字体：在 2x2 / 3x3 偏移网格上重复绘制 1 倍字体。
 * @note 其他倍数退化为一次 1 倍绘制。IPixelBackend::draw_scaled_text 的默认实现。
 * @return 0 表示成功；str 为空返回 -EINVAL。
 */
int faux_scaled_text(IPixelBackend& be, const char* str, int32_t x, int32_t y, Color color,
                     uint8_t scale) noexcept;

}  // namespace screen::raster
