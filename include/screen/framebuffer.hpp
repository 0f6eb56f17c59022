/**
 * @file framebuffer.hpp
 * @brief 内存 RGB565 帧缓冲后端（模拟器）：离线渲染、像素检查与圆形遮罩导出。
 */

#pragma once

#include <cstddef>
#include <cstdint>

#include "screen/ipixel_backend.hpp"

namespace screen {

/**
 * @brief 基于调用方缓冲的 RGB565 像素后端。
 * @note 缓冲按行存储，长度至少 width * height；生命周期由调用方管理。
 *       所有写入逐像素裁剪。缓冲为空或尺寸为 0 时报告 0x0 几何。
 */
class FrameBuffer final : public IPixelBackend {
 public:
  /** @brief 圆形遮罩边框宽度（像素）。 */
  static constexpr int32_t kBorderWidth = 2;
  /** @brief 圆形遮罩边框颜色。 */
  static constexpr Color kBorderColor = Color::gray4(5);

  /**
   * @brief 绑定调用方缓冲。
   * @param pixels RGB565 缓冲，行优先。
   * @param width 宽度（像素）。
   * @param height 高度（像素）。
   */
  FrameBuffer(uint16_t* pixels, uint16_t width, uint16_t height) noexcept;

  uint16_t width() const noexcept override;
  uint16_t height() const noexcept override;
  int fill(Color color) noexcept override;
  int pixel(int32_t x, int32_t y, Color color) noexcept override;
  int line(int32_t x1, int32_t y1, int32_t x2, int32_t y2, Color color) noexcept override;
  int text(const char* str, int32_t x, int32_t y, Color color) noexcept override;

  /**
   * @brief 提交一帧（仅计数）。
   * @return 0。
   */
  int show() noexcept override;

  /** @brief 原生矩形填充（逐行裁剪后直接写缓冲）。 */
  int fill_rect(int32_t x, int32_t y, int32_t w, int32_t h, Color color) noexcept override;

  /**
   * @brief 读取像素。
   * @return RGB565 值；越界返回 0。
   */
  uint16_t pixel_at(int32_t x, int32_t y) const noexcept;

  /**
   * @brief 统计等于给定颜色（按 RGB565 比较）的像素数。
   */
  size_t count_color(Color color) const noexcept;

  /**
   * @brief 把内切圆以外的像素置为背景色，可选绘制 2 像素边框环。
   * @param background 圆外背景色。
   * @param border 是否绘制边框环。
   * @return 0 表示成功；-ENODEV 表示缓冲无效。
   */
  int apply_round_mask(Color background, bool border) noexcept;

  /** @brief show() 被调用的次数。 */
  uint32_t frames() const noexcept { return frames_; }

  /** @brief 原始缓冲。 */
  const uint16_t* data() const noexcept { return pixels_; }

 private:
  bool valid() const noexcept { return pixels_ != nullptr && width_ != 0U && height_ != 0U; }

  /** @brief 写入单个像素（越界丢弃）。 */
  void put(int32_t x, int32_t y, uint16_t rgb565) noexcept;

  uint16_t* pixels_ = nullptr;
  uint16_t width_ = 0U;
  uint16_t height_ = 0U;
  uint32_t frames_ = 0U;
};

}  // namespace screen
