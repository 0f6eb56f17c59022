/**
 * @file gallery_service.hpp
 * @brief 界面轮播服务声明：独立线程按帧周期绘制参考界面，定时切页。
 */

#pragma once

#include <zephyr/autoconf.h>
#include <zephyr/kernel.h>
#include <zephyr/sys/atomic.h>

#include "platform/ilogger.hpp"
#include "screen/gallery.hpp"
#include "screen/ipixel_backend.hpp"
#include "screen/screen.hpp"

namespace servers {

/**
 * @brief 界面轮播服务。
 * @note 服务独占一个 Screen；每 CONFIG_ROUND_SCREEN_GALLERY_FRAME_MS 重绘当前页，
 *       每 CONFIG_ROUND_SCREEN_GALLERY_PAGE_MS 切到下一页。
 */
class GalleryService {
public:
	/**
	 * @brief 构造轮播服务。
	 * @param backend 像素后端，必须在服务生命周期内保持有效。
	 * @param log 日志接口引用，必须在服务生命周期内保持有效。
	 */
	GalleryService(screen::IPixelBackend &backend, platform::ILogger &log)
		: log_(log), screen_(backend, log)
	{
	}

	/**
	 * @brief 启动服务线程（幂等）。
	 * @return 0 表示成功或已在运行；负值表示启动失败。
	 */
	int run() noexcept;

	/**
	 * @brief 请求停止服务线程。
	 * @note 该函数仅发出停止请求并唤醒线程，不阻塞等待线程退出。
	 */
	void stop() noexcept;

private:
	/** @brief 服务线程栈大小（字节）。 */
	static constexpr size_t kStackSize = CONFIG_ROUND_SCREEN_GALLERY_STACK_SIZE;
	/** @brief 服务线程优先级。 */
	static constexpr int kPriority = K_LOWEST_APPLICATION_THREAD_PRIO;
	/** @brief 帧周期（毫秒）。 */
	static constexpr int32_t kFramePeriodMs = CONFIG_ROUND_SCREEN_GALLERY_FRAME_MS;
	/** @brief 每页停留时间（毫秒）。 */
	static constexpr int64_t kPagePeriodMs = CONFIG_ROUND_SCREEN_GALLERY_PAGE_MS;
	/** @brief 罗盘页每帧旋转角度（度）。 */
	static constexpr int32_t kHeadingStepDeg = 3;

	/**
	 * @brief 线程入口静态适配函数。
	 * @param p1 GalleryService 对象指针。
	 * @param p2 未使用。
	 * @param p3 未使用。
	 */
	static void threadEntry(void *p1, void *p2, void *p3);

	/**
	 * @brief 服务线程主循环。
	 */
	void threads() noexcept;

	/**
	 * @brief 刷新动态输入（时钟、航向）。
	 */
	void update_inputs() noexcept;

	/** @brief 日志接口。 */
	platform::ILogger &log_;
	/** @brief 服务独占的绘制器。 */
	screen::Screen screen_;
	/** @brief 页面输入数据。 */
	screen::gallery::Inputs inputs_{};
	/** @brief 当前页。 */
	size_t page_ = 0U;
	/** @brief 上一次绘制错误码，用于去重日志。 */
	int last_err_ = 0;
	/** @brief Zephyr 线程控制块。 */
	struct k_thread thread_;
	/** @brief Zephyr 线程栈。 */
	K_KERNEL_STACK_MEMBER(stack_, kStackSize);
	/** @brief 线程 ID，未运行时为 nullptr。 */
	k_tid_t thread_id_ = nullptr;
	/** @brief 运行状态标志：1 运行中，0 未运行。 */
	atomic_t running_ = ATOMIC_INIT(0);
	/** @brief 停止请求标志：1 请求停止，0 继续运行。 */
	atomic_t stop_requested_ = ATOMIC_INIT(0);
};

} // namespace servers
