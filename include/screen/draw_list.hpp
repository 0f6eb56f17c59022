/**
 * @file draw_list.hpp
 * @brief 记录型后端：把绘制调用按顺序记录为命令列表，可回放到其他后端。
 */

#pragma once

#include <cstddef>
#include <cstdint>

#include "screen/ipixel_backend.hpp"

namespace screen {

/**
 * @brief 绘制命令种类。
 */
enum class DrawOp : uint8_t {
  kFill = 0,
  kPixel,
  kLine,
  kText,
  kShow,
  kFillRect,
  kRect,
  kScaledText,
  kSmallText,
  kMediumText,
  kArc,
};

/**
 * @brief 单条绘制命令。
 */
struct DrawCommand {
  /** @brief 文本负载最大字符数（超出部分截断）。 */
  static constexpr size_t kMaxText = 31U;

  DrawOp op = DrawOp::kFill;
  Color color;
  /** @brief 起点 / 左上角 / 圆心。 */
  int32_t x = 0;
  int32_t y = 0;
  /** @brief 直线终点。 */
  int32_t x2 = 0;
  int32_t y2 = 0;
  /** @brief 矩形尺寸。 */
  int32_t w = 0;
  int32_t h = 0;
  /** @brief 圆弧半径、起始角、扫角（度）。 */
  int32_t r = 0;
  int32_t start_deg = 0;
  int32_t sweep_deg = 0;
  /** @brief 文本缩放倍数或圆弧宽度。 */
  uint8_t param = 0U;
  char text[kMaxText + 1U] = {};
};

/**
 * @brief 场景列表后端。
 * @note 所有可选能力均原生覆盖（记录而不模拟），因此记录结果就是控件层的调用序列。
 *       命令存储由调用方提供；容量耗尽后新命令被丢弃并返回 -ENOMEM。
 */
class DrawList final : public IPixelBackend {
 public:
  /**
   * @brief 绑定命令存储与报告的几何。
   * @param storage 命令数组。
   * @param capacity 数组长度。
   * @param width 报告宽度。
   * @param height 报告高度。
   */
  DrawList(DrawCommand* storage, size_t capacity, uint16_t width, uint16_t height) noexcept
      : cmds_(storage), capacity_(storage != nullptr ? capacity : 0U), width_(width),
        height_(height) {}

  uint16_t width() const noexcept override { return width_; }
  uint16_t height() const noexcept override { return height_; }
  int fill(Color color) noexcept override;
  int pixel(int32_t x, int32_t y, Color color) noexcept override;
  int line(int32_t x1, int32_t y1, int32_t x2, int32_t y2, Color color) noexcept override;
  int text(const char* str, int32_t x, int32_t y, Color color) noexcept override;
  int show() noexcept override;
  int fill_rect(int32_t x, int32_t y, int32_t w, int32_t h, Color color) noexcept override;
  int rect(int32_t x, int32_t y, int32_t w, int32_t h, Color color) noexcept override;
  int draw_scaled_text(const char* str, int32_t x, int32_t y, Color color,
                       uint8_t scale) noexcept override;
  int draw_small_text(const char* str, int32_t x, int32_t y, Color color) noexcept override;
  int draw_medium_text(const char* str, int32_t x, int32_t y, Color color) noexcept override;
  int draw_arc(int32_t cx, int32_t cy, int32_t r, int32_t start_deg, int32_t sweep_deg,
               Color color, uint8_t width) noexcept override;

  /**
   * @brief 按记录顺序把命令重放到目标后端。
   * @param target 目标后端。
   * @return 0 表示成功；否则返回目标后端的第一个错误。
   */
  int replay(IPixelBackend& target) const noexcept;

  /** @brief 清空记录（不清除丢弃计数）。 */
  void clear() noexcept { size_ = 0U; }

  /** @brief 已记录命令数。 */
  size_t size() const noexcept { return size_; }

  /** @brief 容量。 */
  size_t capacity() const noexcept { return capacity_; }

  /** @brief 因容量不足被丢弃的命令数。 */
  uint32_t dropped() const noexcept { return dropped_; }

  /** @brief 第 i 条命令（调用方保证 i < size()）。 */
  const DrawCommand& operator[](size_t i) const noexcept { return cmds_[i]; }

  /** @brief 统计某种命令的条数。 */
  size_t count(DrawOp op) const noexcept;

  const DrawCommand* begin() const noexcept { return cmds_; }
  const DrawCommand* end() const noexcept { return cmds_ + size_; }

 private:
  /** @brief 追加一条命令；满时返回 -ENOMEM。 */
  int push(const DrawCommand& cmd) noexcept;

  /** @brief 追加一条带文本负载的命令。 */
  int push_text(DrawOp op, const char* str, int32_t x, int32_t y, Color color,
                uint8_t param) noexcept;

  DrawCommand* cmds_ = nullptr;
  size_t capacity_ = 0U;
  size_t size_ = 0U;
  uint32_t dropped_ = 0U;
  uint16_t width_ = 0U;
  uint16_t height_ = 0U;
};

}  // namespace screen
