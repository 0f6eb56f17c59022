/**
 * @file main.cpp
 * @brief 应用主入口：把控制权交给 app 初始化流程。
 */

#include <zephyr/kernel.h>

#include "app/app_Init.hpp"

/**
 * @brief 应用入口函数。
 * @return app 层初始化结果码，0 表示成功，负值表示失败。
 */
int main(void) {
  const int ret = app::app_Init();
  if (ret < 0) {
    return ret;
  }
  // 绘制全部由轮播服务线程完成，主线程保持空闲。
  while (true) {
    k_sleep(K_FOREVER);
  }
}
