/**
 * @file platform_clock.hpp
 * @brief 平台时钟接口：为表盘提供本地时分秒。
 */

#pragma once

#include <cstdint>

namespace platform {

/**
 * @brief 本地时间（时分秒）。
 */
struct TimeOfDay {
  int32_t hours = 0;
  int32_t minutes = 0;
  int32_t seconds = 0;
  /** @brief true 表示来自 RTC；false 表示由系统运行时间推算。 */
  bool from_rtc = false;
};

/**
 * @brief 读取当前时间。
 * @param[out] out 输出时间。
 * @return 0 表示读到 RTC 时间；-ENODEV 表示 RTC 不可用或读取失败，此时 out 为运行时间推算值。
 */
int clock_now(TimeOfDay &out) noexcept;

} // namespace platform
