/**
 * @file layout.hpp
 * @brief 视口几何与方位布局解析：把 "N"/"CENTER" 等方位 + 文本尺寸映射为绝对坐标。
 */

#pragma once

#include <cstddef>
#include <cstdint>

namespace screen {

/**
 * @brief 整数坐标点。
 */
struct Point {
  int32_t x = 0;
  int32_t y = 0;

  constexpr bool operator==(const Point& other) const noexcept {
    return x == other.x && y == other.y;
  }
  constexpr bool operator!=(const Point& other) const noexcept { return !(*this == other); }
};

/**
 * @brief 方位锚点（8 个罗盘方位 + 中心）。
 */
enum class Cardinal : uint8_t {
  kN = 0,
  kNE,
  kE,
  kSE,
  kS,
  kSW,
  kW,
  kNW,
  kCenter,
};

/**
 * @brief 解析方位名称（大小写不敏感，"C" 视同 "CENTER"）。
 * @param name 方位名称。
 * @param[out] out 解析结果。
 * @return 0 表示成功；-EINVAL 表示名称为空或未知。
 */
int parse_cardinal(const char* name, Cardinal& out) noexcept;

/**
 * @brief 方位名称（"N"、"NE"、...、"CENTER"）。
 */
const char* cardinal_name(Cardinal at) noexcept;

/**
 * @brief 矩形视口，可视区域为其内切圆。
 */
struct Viewport {
  uint16_t width = 0U;
  uint16_t height = 0U;

  /** @brief 视口中心 (width/2, height/2)。 */
  constexpr Point center() const noexcept {
    return Point{static_cast<int32_t>(width / 2U), static_cast<int32_t>(height / 2U)};
  }

  /** @brief 内切圆半径 min(width, height) / 2。 */
  constexpr int32_t radius() const noexcept {
    return static_cast<int32_t>((width < height ? width : height) / 2U);
  }

  /** @brief 一行可容纳的 1 倍字符数。 */
  constexpr int32_t max_chars() const noexcept { return static_cast<int32_t>(width / 8U); }

  /** @brief 是否为非退化视口（半径大于 0）。 */
  constexpr bool valid() const noexcept { return radius() > 0; }
};

/**
 * @brief 圆形屏幕上的文本布局解析器。
 */
class Layout {
 public:
  /** @brief 上下边距的额外留白（像素）。 */
  static constexpr int32_t kNsPadding = 2;
  /** @brief 左右边距在字符高度之外的留白（像素）。 */
  static constexpr int32_t kEwPadding = 4;

  explicit constexpr Layout(Viewport vp) noexcept : vp_(vp) {}

  /** @brief 绑定的视口。 */
  constexpr const Viewport& viewport() const noexcept { return vp_; }

  /**
   * @brief 计算 N/S 方位的最小上下边距，使宽度 text_w 的文本落在内切圆内。
   * @param text_w 文本像素宽度。
   * @param from_edge 边距下限（通常为字符高度）。
   * @return 文本过宽（半宽 >= 半径）时返回半径；否则
   *         max(r - isqrt(r^2 - (w/2)^2) + 2, from_edge)。
   */
  int32_t margin_ns(int32_t text_w, int32_t from_edge) const noexcept;

  /**
   * @brief E/W 方位的固定左右边距。
   * @param scale 字体缩放倍数。
   * @return 8 * scale + 4。
   */
  constexpr int32_t margin_ew(uint8_t scale) const noexcept {
    return 8 * static_cast<int32_t>(scale) + kEwPadding;
  }

  /**
   * @brief 解析方位为文本块左上角坐标。
   * @param at 方位。
   * @param text_len 字符数。
   * @param scale 缩放倍数（0 按 1 处理）。
   * @return 文本块左上角坐标。
   */
  Point resolve(Cardinal at, size_t text_len, uint8_t scale) const noexcept;

 private:
  Viewport vp_;
};

}  // namespace screen
