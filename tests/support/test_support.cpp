/**
 * @file test_support.cpp
 * @brief 主机测试替身实现。
 */

#include "support/test_support.hpp"

#include <errno.h>
#include <stdio.h>

namespace test_support {

void CapturingLogger::append(Level level, const char* fmt, va_list args, int err) {
  char buf[256];
  vsnprintf(buf, sizeof(buf), fmt, args);
  entries.push_back(Entry{level, buf, err});
}

void CapturingLogger::info(const char* msg) { entries.push_back(Entry{Level::kInfo, msg, 0}); }

void CapturingLogger::warn(const char* msg) { entries.push_back(Entry{Level::kWarn, msg, 0}); }

void CapturingLogger::error(const char* msg, int err) {
  entries.push_back(Entry{Level::kError, msg, err});
}

void CapturingLogger::vinfof(const char* fmt, va_list args) { append(Level::kInfo, fmt, args, 0); }

void CapturingLogger::vwarnf(const char* fmt, va_list args) { append(Level::kWarn, fmt, args, 0); }

void CapturingLogger::verrorf(const char* fmt, va_list args) {
  append(Level::kError, fmt, args, 0);
}

size_t CapturingLogger::count(Level level) const {
  size_t n = 0U;
  for (const Entry& e : entries) {
    if (e.level == level) {
      ++n;
    }
  }
  return n;
}

bool CountingBackend::should_fail() noexcept {
  ++calls_;
  return fail_after >= 0 && calls_ > static_cast<size_t>(fail_after);
}

int CountingBackend::fill(screen::Color color) noexcept {
  if (should_fail()) {
    return -EIO;
  }
  fills.push_back(color);
  return 0;
}

int CountingBackend::pixel(int32_t x, int32_t y, screen::Color color) noexcept {
  if (should_fail()) {
    return -EIO;
  }
  pixels.push_back(PixelCall{x, y, color});
  return 0;
}

int CountingBackend::line(int32_t x1, int32_t y1, int32_t x2, int32_t y2,
                          screen::Color color) noexcept {
  if (should_fail()) {
    return -EIO;
  }
  lines.push_back(LineCall{x1, y1, x2, y2, color});
  return 0;
}

int CountingBackend::text(const char* str, int32_t x, int32_t y, screen::Color color) noexcept {
  if (str == nullptr) {
    return -EINVAL;
  }
  if (should_fail()) {
    return -EIO;
  }
  texts.push_back(TextCall{str, x, y, color});
  return 0;
}

int CountingBackend::show() noexcept {
  if (should_fail()) {
    return -EIO;
  }
  ++shows;
  return 0;
}

}  // namespace test_support
