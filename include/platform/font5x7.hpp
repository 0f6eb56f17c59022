/**
 * @file font5x7.hpp
 * @brief 5x7 ASCII 字库接口定义。
 */

#pragma once

#include <cstdint>

namespace platform::font5x7 {

/** @brief 字体宽度（像素）。 */
constexpr uint8_t kWidth = 5U;
/** @brief 字体高度（像素）。 */
constexpr uint8_t kHeight = 7U;
/** @brief 字库覆盖的首个字符。 */
constexpr char kFirst = ' ';
/** @brief 字库覆盖的最后一个字符。 */
constexpr char kLast = '~';

/**
 * @brief 根据 ASCII 字符获取 5x7 字模（按列存储，LSB 在上）。
 * @param c 输入字符，超出 0x20~0x7E 的按 '?' 处理。
 * @return 指向 5 字节字模数据的指针。
 */
const uint8_t *glyph(char c) noexcept;

/**
 * @brief 查询字模某像素是否点亮。
 * @param g glyph() 返回的字模。
 * @param col 列号 0~4。
 * @param row 行号 0~6。
 */
inline bool lit(const uint8_t *g, uint8_t col, uint8_t row) noexcept {
  return ((g[col] >> row) & 0x01U) != 0U;
}

} // namespace platform::font5x7
