/**
 * @file ipixel_backend.hpp
 * @brief 像素后端能力接口：绘制引擎唯一依赖的显示抽象。
 */

#pragma once

#include <cstdint>

#include "screen/color.hpp"

namespace screen {

/**
 * @brief 像素后端接口。
 * @note 必选能力为纯虚函数，缺失时无法实例化；可选能力带默认实现，
 *       默认实现通过必选能力模拟（见 raster.hpp），后端覆盖即视为原生能力并被优先使用。
 *       所有坐标为后端像素坐标，越界像素由实现静默丢弃。
 */
class IPixelBackend {
 public:
  virtual ~IPixelBackend() = default;

  /**
   * @brief 获取后端宽度（像素）。
   * @return 宽度；未就绪时返回 0。
   */
  virtual uint16_t width() const noexcept = 0;

  /**
   * @brief 获取后端高度（像素）。
   * @return 高度；未就绪时返回 0。
   */
  virtual uint16_t height() const noexcept = 0;

  /**
   * @brief 全屏填充单色。
   * @param color 颜色。
   * @return 0 表示成功；负值表示失败。
   */
  virtual int fill(Color color) noexcept = 0;

  /**
   * @brief 绘制单个像素。
   * @param x X 坐标。
   * @param y Y 坐标。
   * @param color 颜色。
   * @return 0 表示成功（含越界丢弃）；负值表示失败。
   */
  virtual int pixel(int32_t x, int32_t y, Color color) noexcept = 0;

  /**
   * @brief 绘制直线（含两端点）。
   * @return 0 表示成功；负值表示失败。
   */
  virtual int line(int32_t x1, int32_t y1, int32_t x2, int32_t y2, Color color) noexcept = 0;

  /**
   * @brief 以 8x8 字符格绘制字符串（透明背景）。
   * @param str 字符串。
   * @param x 左上角 X。
   * @param y 左上角 Y。
   * @param color 颜色。
   * @return 0 表示成功；负值表示失败。
   */
  virtual int text(const char* str, int32_t x, int32_t y, Color color) noexcept = 0;

  /**
   * @brief 提交绘制结果（后端自定义，立即模式后端可为空操作）。
   * @return 0 表示成功；负值表示失败。
   */
  virtual int show() noexcept = 0;

  /**
   * @brief 填充矩形。默认逐行调用 line()。
   * @return 0 表示成功；负值表示失败。
   */
  virtual int fill_rect(int32_t x, int32_t y, int32_t w, int32_t h, Color color) noexcept;

  /**
   * @brief 绘制矩形边框。默认用四条 line() 拼接。
   * @return 0 表示成功；负值表示失败。
   */
  virtual int rect(int32_t x, int32_t y, int32_t w, int32_t h, Color color) noexcept;

  /**
   * @brief 绘制放大字体。默认在 scale x scale 网格上重复绘制 1 倍字体（伪加粗）。
   * @param scale 放大倍数。
   * @return 0 表示成功；负值表示失败。
   */
  virtual int draw_scaled_text(const char* str, int32_t x, int32_t y, Color color,
                               uint8_t scale) noexcept;

  /**
   * @brief 绘制小号字体（标签、坐标轴）。默认等同 text()。
   */
  virtual int draw_small_text(const char* str, int32_t x, int32_t y, Color color) noexcept;

  /**
   * @brief 绘制中号字体（单位）。默认等同 text()。
   */
  virtual int draw_medium_text(const char* str, int32_t x, int32_t y, Color color) noexcept;

  /**
   * @brief 绘制带宽度的圆弧。默认按角度步进逐像素绘制。
   * @param cx 圆心 X。
   * @param cy 圆心 Y。
   * @param r 半径。
   * @param start_deg 起始角（度，0 度指向 +X，顺时针增大）。
   * @param sweep_deg 扫过角度（度）。
   * @param color 颜色。
   * @param width 径向宽度（像素）。
   * @return 0 表示成功；负值表示失败。
   */
  virtual int draw_arc(int32_t cx, int32_t cy, int32_t r, int32_t start_deg, int32_t sweep_deg,
                       Color color, uint8_t width) noexcept;
};

}  // namespace screen
