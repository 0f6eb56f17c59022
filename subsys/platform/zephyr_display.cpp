/**
 * @file zephyr_display.cpp
 * @brief IPixelBackend 的 Zephyr Display API 后端实现（RGB565 / L_8 面板）。
 */

#include <errno.h>
#include <zephyr/device.h>
#include <zephyr/devicetree.h>
#include <zephyr/drivers/display.h>

#include "platform/font5x7.hpp"
#include "platform/platform_display.hpp"
#include "screen/raster.hpp"

namespace {

/** @brief 静态行缓冲支持的最大屏幕宽度。 */
constexpr uint16_t kMaxDisplayWidth = 320U;

/**
 * @brief Zephyr Display API 的像素后端实现。
 * @note 写入立即生效，show() 为空操作。原生覆盖 fill_rect 与 draw_scaled_text。
 */
class ZephyrPixelBackend final : public screen::IPixelBackend {
 public:
  /**
   * @brief 初始化显示设备并协商像素格式。
   * @return 0 成功；负值失败。
   */
  int init() noexcept;

  /**
   * @brief 获取屏幕宽度（像素）。
   * @return 已初始化时返回宽度；否则返回 0。
   */
  uint16_t width() const noexcept override;

  /**
   * @brief 获取屏幕高度（像素）。
   * @return 已初始化时返回高度；否则返回 0。
   */
  uint16_t height() const noexcept override;

  int fill(screen::Color color) noexcept override;
  int pixel(int32_t x, int32_t y, screen::Color color) noexcept override;
  int line(int32_t x1, int32_t y1, int32_t x2, int32_t y2, screen::Color color) noexcept override;

  /**
   * @brief 绘制字符串：5x7 字模画在 8x8 字符格左上角，背景透明。
   */
  int text(const char* str, int32_t x, int32_t y, screen::Color color) noexcept override;

  /** @brief 写入即时生效，无需提交。 */
  int show() noexcept override { return 0; }

  /**
   * @brief 原生矩形填充（裁剪后按行写入）。
   */
  int fill_rect(int32_t x, int32_t y, int32_t w, int32_t h,
                screen::Color color) noexcept override;

  /**
   * @brief 原生放大字体：每个点亮像素画成 scale x scale 方块。
   */
  int draw_scaled_text(const char* str, int32_t x, int32_t y, screen::Color color,
                       uint8_t scale) noexcept override;

 private:
  /**
   * @brief 执行矩形区域写入（假设参数已完成校验/裁剪）。
   * @param x 左上角 X。
   * @param y 左上角 Y。
   * @param w 宽度。
   * @param h 高度。
   * @param color 颜色。
   * @return 0 成功；负值失败。
   */
  int write_solid_rect(uint16_t x, uint16_t y, uint16_t w, uint16_t h,
                       screen::Color color) noexcept;

  /** @brief 裁剪后写入矩形，完全越界时直接返回 0。 */
  int clipped_rect(int32_t x, int32_t y, int32_t w, int32_t h, screen::Color color) noexcept;

  /** @brief 以指定像素块尺寸绘制字符串。 */
  int glyph_text(const char* str, int32_t x, int32_t y, screen::Color color,
                 uint8_t scale) noexcept;

  /** @brief 显示设备句柄。 */
  const struct device* display_dev_ = nullptr;
  /** @brief 显示能力缓存。 */
  struct display_capabilities caps_{};
  /** @brief 协商后的像素格式。 */
  enum display_pixel_format format_ = PIXEL_FORMAT_RGB_565;
  /** @brief 初始化状态标志。 */
  bool initialized_ = false;
  /** @brief 单行像素缓冲（按当前格式打包，L_8 时只用前 w 字节）。 */
  uint16_t line_buf_[kMaxDisplayWidth]{};
};

/** @brief 全局像素后端实例。 */
ZephyrPixelBackend g_display;

uint16_t ZephyrPixelBackend::width() const noexcept {
  if (!initialized_) {
    return 0U;
  }

  return caps_.x_resolution;
}

uint16_t ZephyrPixelBackend::height() const noexcept {
  if (!initialized_) {
    return 0U;
  }

  return caps_.y_resolution;
}

int ZephyrPixelBackend::write_solid_rect(uint16_t x, uint16_t y, uint16_t w, uint16_t h,
                                         screen::Color color) noexcept {
  if (w == 0U || h == 0U) {
    return 0;
  }

  if (w > kMaxDisplayWidth) {
    return -ENOMEM;
  }

  const screen::RowFormat row_format = format_ == PIXEL_FORMAT_RGB_565
                                           ? screen::RowFormat::kRgb565
                                           : screen::RowFormat::kL8;
  const size_t bytes = screen::pack_row(color, row_format, line_buf_, w);

  struct display_buffer_descriptor desc{};
  desc.width = w;
  desc.height = 1U;
  desc.pitch = w;
  desc.buf_size = static_cast<uint32_t>(bytes);

  for (uint16_t row = 0U; row < h; ++row) {
    desc.frame_incomplete = (row + 1U) < h;
    int ret = display_write(display_dev_, x, y + row, &desc, line_buf_);
    if (ret < 0) {
      return ret;
    }
  }

  return 0;
}

int ZephyrPixelBackend::clipped_rect(int32_t x, int32_t y, int32_t w, int32_t h,
                                     screen::Color color) noexcept {
  int ret = init();
  if (ret < 0) {
    return ret;
  }

  if (w <= 0 || h <= 0) {
    return 0;
  }

  const int32_t sw = static_cast<int32_t>(caps_.x_resolution);
  const int32_t sh = static_cast<int32_t>(caps_.y_resolution);
  int32_t x0 = x < 0 ? 0 : x;
  int32_t y0 = y < 0 ? 0 : y;
  int32_t x1 = x + w > sw ? sw : x + w;
  int32_t y1 = y + h > sh ? sh : y + h;
  if (x0 >= x1 || y0 >= y1) {
    return 0;
  }

  return write_solid_rect(static_cast<uint16_t>(x0), static_cast<uint16_t>(y0),
                          static_cast<uint16_t>(x1 - x0), static_cast<uint16_t>(y1 - y0), color);
}

int ZephyrPixelBackend::init() noexcept {
  /* 幂等保护：已经初始化过则直接成功返回。 */
  if (initialized_) {
    return 0;
  }

  /* 从 devicetree 的 zephyr_display chosen 节点拿到显示设备。 */
  display_dev_ = DEVICE_DT_GET(DT_CHOSEN(zephyr_display));
  if (!device_is_ready(display_dev_)) {
    return -ENODEV;
  }

  display_get_capabilities(display_dev_, &caps_);

  /* 优先 RGB565，灰度面板退回 L_8。 */
  if ((caps_.supported_pixel_formats & PIXEL_FORMAT_RGB_565) != 0U) {
    format_ = PIXEL_FORMAT_RGB_565;
  } else if ((caps_.supported_pixel_formats & PIXEL_FORMAT_L_8) != 0U) {
    format_ = PIXEL_FORMAT_L_8;
  } else {
    return -ENOTSUP;
  }

  if (caps_.current_pixel_format != format_) {
    int ret = display_set_pixel_format(display_dev_, format_);
    if (ret < 0) {
      return ret;
    }
    display_get_capabilities(display_dev_, &caps_);
    if (caps_.current_pixel_format != format_) {
      return -ENOTSUP;
    }
  }

  if (caps_.x_resolution > kMaxDisplayWidth) {
    return -ENOMEM;
  }

  /* 关闭 blanking，让面板真正开始显示像素内容。 */
  int ret = display_blanking_off(display_dev_);
  /* 某些驱动未实现该接口会返回 -ENOSYS，这里按可接受处理。 */
  if (ret < 0 && ret != -ENOSYS) {
    return ret;
  }

  initialized_ = true;
  return 0;
}

int ZephyrPixelBackend::fill(screen::Color color) noexcept {
  int ret = init();
  if (ret < 0) {
    return ret;
  }

  return write_solid_rect(0U, 0U, caps_.x_resolution, caps_.y_resolution, color);
}

int ZephyrPixelBackend::pixel(int32_t x, int32_t y, screen::Color color) noexcept {
  return clipped_rect(x, y, 1, 1, color);
}

int ZephyrPixelBackend::line(int32_t x1, int32_t y1, int32_t x2, int32_t y2,
                             screen::Color color) noexcept {
  /* 水平/垂直线直接按矩形写入，减少 display_write 次数。 */
  if (y1 == y2) {
    const int32_t xa = x1 < x2 ? x1 : x2;
    const int32_t xb = x1 < x2 ? x2 : x1;
    return clipped_rect(xa, y1, xb - xa + 1, 1, color);
  }
  if (x1 == x2) {
    const int32_t ya = y1 < y2 ? y1 : y2;
    const int32_t yb = y1 < y2 ? y2 : y1;
    return clipped_rect(x1, ya, 1, yb - ya + 1, color);
  }

  const int32_t dx = x2 > x1 ? x2 - x1 : x1 - x2;
  const int32_t dy = y2 > y1 ? y1 - y2 : y2 - y1;
  const int32_t sx = x1 < x2 ? 1 : -1;
  const int32_t sy = y1 < y2 ? 1 : -1;
  int32_t err = dx + dy;
  int32_t x = x1;
  int32_t y = y1;

  while (true) {
    int ret = clipped_rect(x, y, 1, 1, color);
    if (ret < 0) {
      return ret;
    }
    if (x == x2 && y == y2) {
      break;
    }
    const int32_t e2 = 2 * err;
    if (e2 >= dy) {
      err += dy;
      x += sx;
    }
    if (e2 <= dx) {
      err += dx;
      y += sy;
    }
  }
  return 0;
}

int ZephyrPixelBackend::glyph_text(const char* str, int32_t x, int32_t y, screen::Color color,
                                   uint8_t scale) noexcept {
  if (str == nullptr) {
    return -EINVAL;
  }

  int ret = init();
  if (ret < 0) {
    return ret;
  }

  if (scale == 0U) {
    scale = 1U;
  }

  const int32_t step = screen::raster::kCellWidth * static_cast<int32_t>(scale);
  int32_t cursor = x;
  for (const char* p = str; *p != '\0'; ++p) {
    const uint8_t* g = platform::font5x7::glyph(*p);
    for (uint8_t col = 0U; col < platform::font5x7::kWidth; ++col) {
      for (uint8_t row = 0U; row < platform::font5x7::kHeight; ++row) {
        if (!platform::font5x7::lit(g, col, row)) {
          continue;
        }
        ret = clipped_rect(cursor + col * scale, y + row * scale, scale, scale, color);
        if (ret < 0) {
          return ret;
        }
      }
    }
    cursor += step;
  }

  return 0;
}

int ZephyrPixelBackend::text(const char* str, int32_t x, int32_t y,
                             screen::Color color) noexcept {
  return glyph_text(str, x, y, color, 1U);
}

int ZephyrPixelBackend::fill_rect(int32_t x, int32_t y, int32_t w, int32_t h,
                                  screen::Color color) noexcept {
  return clipped_rect(x, y, w, h, color);
}

int ZephyrPixelBackend::draw_scaled_text(const char* str, int32_t x, int32_t y,
                                         screen::Color color, uint8_t scale) noexcept {
  return glyph_text(str, x, y, color, scale);
}

}  // namespace

namespace platform {

int display_init() noexcept { return g_display.init(); }

/**
 * @brief 获取全局像素后端实例。
 * @return IPixelBackend 引用。
 */
screen::IPixelBackend& display() { return g_display; }

}  // namespace platform
