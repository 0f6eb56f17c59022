/**
 * @file faces.hpp
 * @brief 8x8 像素画表情字典。
 */

#pragma once

#include <cstdint>

namespace screen {

/**
 * @brief 8x8 单色位图，每行 1 字节，最高位为最左列，1 表示点亮。
 */
struct FaceBitmap {
  uint8_t rows[8] = {};

  /**
   * @brief 查询某格是否点亮。
   * @param row 行号 0~7。
   * @param col 列号 0~7。
   */
  constexpr bool lit(int row, int col) const noexcept {
    return ((rows[row] >> (7 - col)) & 0x01U) != 0U;
  }
};

namespace faces {

inline constexpr FaceBitmap kHappy = {{0x00, 0x66, 0x66, 0x00, 0x81, 0x42, 0x3C, 0x00}};
inline constexpr FaceBitmap kSad = {{0x00, 0x66, 0x66, 0x00, 0x00, 0x3C, 0x42, 0x81}};
inline constexpr FaceBitmap kSurprised = {{0x00, 0x66, 0x66, 0x00, 0x18, 0x24, 0x24, 0x18}};
inline constexpr FaceBitmap kSleeping = {{0x00, 0x00, 0xE7, 0x00, 0x00, 0x00, 0x3C, 0x00}};
inline constexpr FaceBitmap kAngry = {{0xC3, 0x66, 0x00, 0x66, 0x00, 0x3C, 0x42, 0x00}};
inline constexpr FaceBitmap kLove = {{0x00, 0xA5, 0xE7, 0x42, 0x00, 0x81, 0x42, 0x3C}};

/**
 * @brief 按名称查找表情（大小写敏感："happy"、"sad"、"surprised"、"sleeping"、"angry"、"love"）。
 * @param name 表情名称。
 * @return 找到时返回常量位图指针；未知名称或空指针返回 nullptr。
 */
const FaceBitmap* find(const char* name) noexcept;

}  // namespace faces

}  // namespace screen
