/**
 * @file zephyr_clock.cpp
 * @brief 平台时钟实现：优先读取片上 RTC，不可用时退回系统运行时间。
 */

#include "platform/platform_clock.hpp"

#include <errno.h>
#include <zephyr/device.h>
#include <zephyr/devicetree.h>
#include <zephyr/drivers/rtc.h>
#include <zephyr/kernel.h>

namespace platform {

int clock_now(TimeOfDay &out) noexcept {
#if DT_NODE_HAS_STATUS(DT_NODELABEL(rtc), okay)
  const struct device *rtc_dev = DEVICE_DT_GET(DT_NODELABEL(rtc));
  if (device_is_ready(rtc_dev)) {
    struct rtc_time rtc_tm = {};
    if (rtc_get_time(rtc_dev, &rtc_tm) == 0) {
      out.hours = rtc_tm.tm_hour;
      out.minutes = rtc_tm.tm_min;
      out.seconds = rtc_tm.tm_sec;
      out.from_rtc = true;
      return 0;
    }
  }
#endif

  /* RTC 不可用：用运行时间模拟一个从 00:00:00 开始走的时钟。 */
  const int64_t up_s = k_uptime_get() / 1000;
  out.hours = static_cast<int32_t>((up_s / 3600) % 24);
  out.minutes = static_cast<int32_t>((up_s / 60) % 60);
  out.seconds = static_cast<int32_t>(up_s % 60);
  out.from_rtc = false;
  return -ENODEV;
}

} // namespace platform
