/**
 * @file zephyr_logger.cpp
 * @brief ILogger 的 Zephyr LOG 后端实现。
 */

#include <stdarg.h>
#include <stdio.h>
#include <zephyr/kernel.h>
#include <zephyr/logging/log.h>

#include "platform/platform_logger.hpp"

LOG_MODULE_REGISTER(round_screen, CONFIG_ROUND_SCREEN_LOG_LEVEL);

namespace {

/** @brief 格式化日志临时缓冲区长度. */
constexpr size_t kLogFormatBufferSize = 192U;

/** @brief 日志级别（决定转发到哪个 LOG 宏）. */
enum class Level : uint8_t {
  kInfo,
  kWarn,
  kError,
};

/**
 * @brief 把已格式化的消息按级别转发给 Zephyr LOG。
 * @param level 日志级别。
 * @param msg 消息字符串。
 */
void emit(Level level, const char* msg) {
  switch (level) {
    case Level::kInfo:
      LOG_INF("%s", msg);
      break;
    case Level::kWarn:
      LOG_WRN("%s", msg);
      break;
    case Level::kError:
      LOG_ERR("%s", msg);
      break;
  }
}

/**
 * @brief 格式化 va_list 并输出。
 * @param level 日志级别。
 * @param fmt printf 风格格式串。
 * @param args 可变参数列表。
 */
void emit_formatted(Level level, const char* fmt, va_list args) {
  char msg[kLogFormatBufferSize] = {};
  if (fmt == nullptr) {
    emit(level, "(null)");
    return;
  }

  va_list args_copy;
  va_copy(args_copy, args);
  const int n = vsnprintf(msg, sizeof(msg), fmt, args_copy);
  va_end(args_copy);

  if (n < 0) {
    emit(level, "log format error");
    return;
  }
  emit(level, msg);
}

/**
 * @brief 基于 Zephyr LOG 宏的日志实现。
 */
class ZephyrLogger final : public platform::ILogger {
 public:
  void info(const char* msg) override { LOG_INF("%s", msg); }

  void warn(const char* msg) override { LOG_WRN("%s", msg); }

  void error(const char* msg, int err) override { LOG_ERR("%s err=%d", msg, err); }

  void vinfof(const char* fmt, va_list args) override { emit_formatted(Level::kInfo, fmt, args); }

  void vwarnf(const char* fmt, va_list args) override { emit_formatted(Level::kWarn, fmt, args); }

  void verrorf(const char* fmt, va_list args) override {
    emit_formatted(Level::kError, fmt, args);
  }
};

/** @brief 全局日志对象实例。 */
ZephyrLogger g_logger;

}  // namespace

namespace platform {

/**
 * @brief 获取全局日志实例。
 * @return ILogger 引用。
 */
ILogger& logger() { return g_logger; }

}  // namespace platform
