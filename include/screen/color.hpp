/**
 * @file color.hpp
 * @brief 颜色模型：RGB 三元组与兼容旧接口的 4 位灰度（Gray4）标签联合。
 */

#pragma once

#include <cstddef>
#include <cstdint>

namespace screen {

/**
 * @brief 8 位 RGB 三元组。
 */
struct Rgb8 {
  uint8_t r = 0U;
  uint8_t g = 0U;
  uint8_t b = 0U;
};

/**
 * @brief 颜色值（标签联合）。
 * @note Gray4 在构造时即钳位到 [0,15]，绘制期不再做兼容转换。
 */
class Color {
 public:
  /** @brief 颜色种类标签。 */
  enum class Kind : uint8_t {
    kRgb = 0,
    kGray4 = 1,
  };

  /** @brief 默认构造为 Gray4(0)，即黑色。 */
  constexpr Color() noexcept = default;

  /**
   * @brief 构造 RGB 颜色。
   * @param r 红色分量（0~255）。
   * @param g 绿色分量（0~255）。
   * @param b 蓝色分量（0~255）。
   * @return RGB 颜色。
   */
  static constexpr Color rgb(uint8_t r, uint8_t g, uint8_t b) noexcept {
    return Color(Kind::kRgb, r, g, b);
  }

  /**
   * @brief 构造 4 位灰度颜色。
   * @param level 灰度级，超出 [0,15] 时按边界处理。
   * @return Gray4 颜色。
   */
  static constexpr Color gray4(int level) noexcept {
    return Color(Kind::kGray4, static_cast<uint8_t>(level < 0 ? 0 : (level > 15 ? 15 : level)),
                 0U, 0U);
  }

  /** @brief 颜色种类。 */
  constexpr Kind kind() const noexcept { return kind_; }

  /** @brief 是否为 Gray4。 */
  constexpr bool is_gray4() const noexcept { return kind_ == Kind::kGray4; }

  /**
   * @brief 转换为 RGB 三元组。
   * @return Gray4 按 v*17 复制到三通道；RGB 原样返回。
   */
  constexpr Rgb8 to_rgb8() const noexcept {
    if (kind_ == Kind::kGray4) {
      const uint8_t v = static_cast<uint8_t>(a_ * 17U);
      return Rgb8{v, v, v};
    }
    return Rgb8{a_, b_, c_};
  }

  /**
   * @brief 转换为 4 位灰度。
   * @return Gray4 原样返回；RGB 使用 BT.601 定点亮度 (R*77+G*150+B*29)>>8 再右移 4 位。
   */
  constexpr uint8_t to_gray4() const noexcept {
    if (kind_ == Kind::kGray4) {
      return a_;
    }
    const uint32_t y = (static_cast<uint32_t>(a_) * 77U + static_cast<uint32_t>(b_) * 150U +
                        static_cast<uint32_t>(c_) * 29U) >>
                       8U;
    return static_cast<uint8_t>(y >> 4U);
  }

  /**
   * @brief 转换为 8 位亮度（L_8 面板）。
   * @return to_gray4() * 17。
   */
  constexpr uint8_t to_l8() const noexcept { return static_cast<uint8_t>(to_gray4() * 17U); }

  /**
   * @brief 转换为 RGB565。
   * @return ((R&0xF8)<<8) | ((G&0xFC)<<3) | (B>>3)。
   */
  constexpr uint16_t to_rgb565() const noexcept {
    const Rgb8 c = to_rgb8();
    return static_cast<uint16_t>(((c.r & 0xF8U) << 8) | ((c.g & 0xFCU) << 3) | (c.b >> 3));
  }

  constexpr bool operator==(const Color& other) const noexcept {
    return kind_ == other.kind_ && a_ == other.a_ && b_ == other.b_ && c_ == other.c_;
  }

  constexpr bool operator!=(const Color& other) const noexcept { return !(*this == other); }

 private:
  constexpr Color(Kind kind, uint8_t a, uint8_t b, uint8_t c) noexcept
      : kind_(kind), a_(a), b_(b), c_(c) {}

  Kind kind_ = Kind::kGray4;
  /* Gray4 时 a_ 为灰度级；RGB 时 a_/b_/c_ 为 R/G/B。 */
  uint8_t a_ = 0U;
  uint8_t b_ = 0U;
  uint8_t c_ = 0U;
};

/**
 * @brief RGB 三元组转 4 位灰度。
 * @param c 输入颜色。
 * @return 0~15 灰度级。
 */
constexpr uint8_t rgb_to_gray4(const Rgb8& c) noexcept {
  return Color::rgb(c.r, c.g, c.b).to_gray4();
}

/**
 * @brief 把 Gray4 灰度级扩展为 RGB 三元组。
 * @param level 灰度级，超出 [0,15] 时按边界处理。
 * @return v*17 复制到三通道。
 */
constexpr Rgb8 rgb_to_rgb8(int level) noexcept { return Color::gray4(level).to_rgb8(); }

/**
 * @brief 8 位 RGB 分量打包为 RGB565。
 */
constexpr uint16_t rgb565(uint8_t r, uint8_t g, uint8_t b) noexcept {
  return Color::rgb(r, g, b).to_rgb565();
}

/**
 * @brief 面板行缓冲的像素格式。
 */
enum class RowFormat : uint8_t {
  kRgb565 = 0,
  kL8 = 1,
};

/**
 * @brief 用纯色填满一行面板缓冲。
 * @param color 颜色。
 * @param format 行格式；kL8 时按字节写入缓冲开头。
 * @param row 行缓冲（uint16_t 对齐），长度至少 width 个元素。
 * @param width 像素数。
 * @return 写入的字节数。
 */
inline size_t pack_row(Color color, RowFormat format, uint16_t* row, size_t width) noexcept {
  if (format == RowFormat::kRgb565) {
    const uint16_t v = color.to_rgb565();
    for (size_t i = 0U; i < width; ++i) {
      row[i] = v;
    }
    return width * sizeof(uint16_t);
  }

  const uint8_t v = color.to_l8();
  uint8_t* bytes = reinterpret_cast<uint8_t*>(row);
  for (size_t i = 0U; i < width; ++i) {
    bytes[i] = v;
  }
  return width;
}

namespace colors {

/* 兼容 SSD1327 的 4 位灰度常量。 */
inline constexpr Color kBlack = Color::gray4(0);
inline constexpr Color kDark = Color::gray4(6);
inline constexpr Color kGray = Color::gray4(9);
inline constexpr Color kLight = Color::gray4(11);
inline constexpr Color kWhite = Color::gray4(15);

/* RGB 常量（灰度面板上按亮度显示）。 */
inline constexpr Color kRed = Color::rgb(255U, 0U, 0U);
inline constexpr Color kGreen = Color::rgb(0U, 255U, 0U);
inline constexpr Color kBlue = Color::rgb(0U, 0U, 255U);
inline constexpr Color kYellow = Color::rgb(255U, 255U, 0U);
inline constexpr Color kOrange = Color::rgb(255U, 165U, 0U);
inline constexpr Color kCyan = Color::rgb(0U, 255U, 255U);
inline constexpr Color kMagenta = Color::rgb(255U, 0U, 255U);
inline constexpr Color kPink = Color::rgb(255U, 105U, 180U);

}  // namespace colors

}  // namespace screen
