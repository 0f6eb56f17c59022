/**
 * @file app_Init.hpp
 * @brief 应用初始化接口声明。
 */

#pragma once

namespace app {

/**
 * @brief 初始化显示并启动界面轮播服务。
 * @return 0 表示成功；负值表示失败。
 */
int app_Init() noexcept;

} // namespace app
