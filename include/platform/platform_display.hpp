/**
 * @file platform_display.hpp
 * @brief 平台显示实例访问接口。
 */

#pragma once

#include "screen/ipixel_backend.hpp"

namespace platform {

/**
 * @brief 初始化 devicetree chosen 显示设备（幂等）。
 * @return 0 表示成功；-ENODEV 设备未就绪；-ENOTSUP 像素格式不支持；其他负值为驱动错误。
 */
int display_init() noexcept;

/**
 * @brief 获取全局像素后端实例。
 * @return IPixelBackend 引用，生命周期贯穿整个程序运行期；未初始化时报告 0x0 几何。
 */
screen::IPixelBackend &display();

} // namespace platform
