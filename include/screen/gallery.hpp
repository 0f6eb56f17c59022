/**
 * @file gallery.hpp
 * @brief 参考界面集合：每页一个 draw(screen) 入口，在板上轮播、在主机上用作渲染回归。
 */

#pragma once

#include <cstddef>
#include <cstdint>

#include "screen/screen.hpp"

namespace screen::gallery {

/**
 * @brief 页面编号。
 */
enum class Page : uint8_t {
  kTemperature = 0,
  kBattery,
  kComfort,
  kGauge,
  kGraph,
  kMenu,
  kCompass,
  kFace,
  kWatch,
};

/** @brief 页面总数。 */
constexpr size_t kPageCount = 9U;
/** @brief 曲线页样本容量。 */
constexpr size_t kGraphSamples = 20U;

/**
 * @brief 页面输入数据，默认值为参考界面所用读数。
 */
struct Inputs {
  /** @brief 温度（0.1 摄氏度）。 */
  int32_t temperature_dc = 235;
  int32_t battery_percent = 72;
  int32_t battery_mv = 3842;
  int32_t humidity_percent = 45;
  int32_t distance_mm = 342;
  /** @brief 光照历史（lux），按时间顺序，最后一个为最新值。 */
  int32_t light[kGraphSamples] = {350, 375, 410, 390, 450, 525, 560, 540, 575, 610,
                                  590, 625, 600, 640, 610, 625, 590, 610, 650, 847};
  size_t light_count = kGraphSamples;
  size_t menu_selected = 2U;
  int32_t heading_deg = 0;
  /** @brief 表情名称。 */
  const char* face = "happy";
  int32_t hours = 10;
  int32_t minutes = 10;
  int32_t seconds = 30;
};

/**
 * @brief 页面名称（用于日志）。
 * @return 未知页面返回 "?"。
 */
const char* page_name(Page page) noexcept;

/**
 * @brief 绘制一整页：clear、控件序列、show。
 * @param screen 目标屏幕。
 * @param page 页面。
 * @param inputs 输入数据。
 * @return 0 表示成功；-EINVAL 表示页面编号无效；其他负值为后端错误。
 */
int draw(Screen& screen, Page page, const Inputs& inputs) noexcept;

}  // namespace screen::gallery
