/**
 * @file fixed_math.hpp
 * @brief 定点数学工具：整数平方根、十分之一度精度的 Q14 正余弦、四舍五入除法。
 */

#pragma once

#include <cstdint>

namespace screen::fixed {

/** @brief Q14 定点的 1.0。 */
constexpr int32_t kOne = 1 << 14;

/**
 * @brief 整数平方根（向下取整）。
 * @param v 输入值。
 * @return floor(sqrt(v))。
 */
uint32_t isqrt(uint64_t v) noexcept;

/**
 * @brief 正弦（Q14）。
 * @param decideg 角度，单位 0.1 度，任意整数（自动归一化到 [0,3600)）。
 * @return sin 值乘以 16384，范围 [-16384, 16384]。
 */
int32_t sin_q14(int32_t decideg) noexcept;

/**
 * @brief 余弦（Q14）。
 * @param decideg 角度，单位 0.1 度。
 * @return cos 值乘以 16384。
 */
int32_t cos_q14(int32_t decideg) noexcept;

/**
 * @brief 有符号四舍五入除法（远离零取整 .5）。
 * @param num 被除数。
 * @param den 除数，必须大于 0。
 * @return round(num / den)。
 */
constexpr int32_t round_div(int64_t num, int64_t den) noexcept {
  return static_cast<int32_t>(num >= 0 ? (num + den / 2) / den : -((-num + den / 2) / den));
}

/**
 * @brief 计算 length * q14 并四舍五入到整数像素。
 * @param length 长度（像素）。
 * @param q14 Q14 系数（通常为正余弦）。
 * @return 四舍五入后的像素偏移。
 */
constexpr int32_t scale_q14(int32_t length, int32_t q14) noexcept {
  return round_div(static_cast<int64_t>(length) * q14, kOne);
}

/**
 * @brief 向负无穷取整的整数除法（与 Python // 一致）。
 * @param num 被除数。
 * @param den 除数，不为 0。
 * @return floor(num / den)。
 */
constexpr int32_t floor_div(int32_t num, int32_t den) noexcept {
  const int32_t q = num / den;
  return ((num % den) != 0 && ((num < 0) != (den < 0))) ? q - 1 : q;
}

/**
 * @brief 区间钳位。
 */
template <typename T>
constexpr T clamp(T v, T lo, T hi) noexcept {
  return v < lo ? lo : (v > hi ? hi : v);
}

}  // namespace screen::fixed
