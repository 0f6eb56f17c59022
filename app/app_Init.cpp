/**
 * @file app_Init.cpp
 * @brief 应用初始化与服务启动实现。
 */

#include "app/app_Init.hpp"

#include "platform/platform_display.hpp"
#include "platform/platform_logger.hpp"
#include "servers/gallery_service.hpp"

namespace app {

/**
 * @brief 初始化显示并启动界面轮播服务。
 * @return 0 表示初始化/启动成功；负值表示启动失败。
 * @note 使用静态服务对象保证后台线程运行期间对象生命周期有效。
 */
int app_Init() noexcept {
  int ret = platform::display_init();
  if (ret < 0) {
    platform::logger().error("failed to init display", ret);
    return ret;
  }

  screen::IPixelBackend& display = platform::display();
  platform::logger().infof("display ready: %ux%u", static_cast<unsigned>(display.width()),
                           static_cast<unsigned>(display.height()));

  static servers::GalleryService gallery_service(display, platform::logger());
  ret = gallery_service.run();
  if (ret < 0) {
    platform::logger().error("failed to start gallery service", ret);
    return ret;
  }
  return 0;
}

}  // namespace app
