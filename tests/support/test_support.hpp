/**
 * @file test_support.hpp
 * @brief 主机测试替身：捕获型日志、仅实现必选能力的计数后端。
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "platform/ilogger.hpp"
#include "screen/ipixel_backend.hpp"

namespace test_support {

/**
 * @brief 记录所有日志行的 ILogger。
 */
class CapturingLogger final : public platform::ILogger {
 public:
  enum class Level { kInfo, kWarn, kError };

  struct Entry {
    Level level;
    std::string msg;
    int err;
  };

  void info(const char* msg) override;
  void warn(const char* msg) override;
  void error(const char* msg, int err) override;
  void vinfof(const char* fmt, va_list args) override;
  void vwarnf(const char* fmt, va_list args) override;
  void verrorf(const char* fmt, va_list args) override;

  /** @brief 某级别日志条数。 */
  size_t count(Level level) const;

  std::vector<Entry> entries;

 private:
  void append(Level level, const char* fmt, va_list args, int err);
};

struct PixelCall {
  int32_t x;
  int32_t y;
  screen::Color color;
};

struct LineCall {
  int32_t x1;
  int32_t y1;
  int32_t x2;
  int32_t y2;
  screen::Color color;
};

struct TextCall {
  std::string text;
  int32_t x;
  int32_t y;
  screen::Color color;
};

/**
 * @brief 只实现必选能力的后端，可选能力全部走默认模拟。
 * @note fail_after >= 0 时，第 fail_after 次之后的绘制调用返回 -EIO。
 */
class CountingBackend final : public screen::IPixelBackend {
 public:
  CountingBackend(uint16_t width, uint16_t height) : width_(width), height_(height) {}

  uint16_t width() const noexcept override { return width_; }
  uint16_t height() const noexcept override { return height_; }
  int fill(screen::Color color) noexcept override;
  int pixel(int32_t x, int32_t y, screen::Color color) noexcept override;
  int line(int32_t x1, int32_t y1, int32_t x2, int32_t y2, screen::Color color) noexcept override;
  int text(const char* str, int32_t x, int32_t y, screen::Color color) noexcept override;
  int show() noexcept override;

  /** @brief 绘制调用总数（不含 width/height）。 */
  size_t calls() const { return calls_; }

  std::vector<screen::Color> fills;
  std::vector<PixelCall> pixels;
  std::vector<LineCall> lines;
  std::vector<TextCall> texts;
  size_t shows = 0U;
  int fail_after = -1;

 private:
  /** @brief 计数并判断本次调用是否应注入失败。 */
  bool should_fail() noexcept;

  uint16_t width_;
  uint16_t height_;
  size_t calls_ = 0U;
};

}  // namespace test_support
