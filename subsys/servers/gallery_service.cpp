/**
 * @file gallery_service.cpp
 * @brief 界面轮播服务实现：后台线程、帧循环、定时切页。
 */

#include "servers/gallery_service.hpp"

#include <zephyr/kernel.h>

#include "platform/platform_clock.hpp"

namespace servers {

/**
 * @brief 线程入口静态适配函数。
 * @param p1 GalleryService 对象指针。
 * @param p2 未使用。
 * @param p3 未使用。
 */
void GalleryService::threadEntry(void *p1, void *, void *)
{
	static_cast<GalleryService *>(p1)->threads();
}

void GalleryService::update_inputs() noexcept
{
	platform::TimeOfDay now;
	/* RTC 不可用时 clock_now 仍给出运行时间推算值，这里不视为错误。 */
	(void)platform::clock_now(now);
	inputs_.hours = now.hours;
	inputs_.minutes = now.minutes;
	inputs_.seconds = now.seconds;

	inputs_.heading_deg = (inputs_.heading_deg + kHeadingStepDeg) % 360;
}

/**
 * @brief 服务线程主循环。
 * @note 每帧重绘当前页；绘制失败只在错误码变化时记录，避免刷屏。
 */
void GalleryService::threads() noexcept
{
	log_.info("gallery service started");

	int64_t page_started_ms = k_uptime_get();
	log_.infof("gallery page: %s",
		   screen::gallery::page_name(static_cast<screen::gallery::Page>(page_)));

	while (atomic_get(&stop_requested_) == 0) {
		const int64_t now_ms = k_uptime_get();
		if (now_ms - page_started_ms >= kPagePeriodMs) {
			page_ = (page_ + 1U) % screen::gallery::kPageCount;
			page_started_ms = now_ms;
			log_.infof("gallery page: %s",
				   screen::gallery::page_name(static_cast<screen::gallery::Page>(page_)));
		}

		update_inputs();
		const int ret = screen::gallery::draw(
			screen_, static_cast<screen::gallery::Page>(page_), inputs_);
		if (ret < 0 && ret != last_err_) {
			log_.error("failed to draw gallery page", ret);
		}
		last_err_ = ret < 0 ? ret : 0;

		k_sleep(K_MSEC(kFramePeriodMs));
	}

	atomic_set(&running_, 0);
	thread_id_ = nullptr;
	log_.info("gallery service task stopped");
}

/**
 * @brief 请求停止服务线程。
 * @note 设置停止标志，并唤醒线程以缩短退出等待时间。
 */
void GalleryService::stop() noexcept
{
	if (atomic_get(&running_) == 0) {
		return;
	}

	atomic_set(&stop_requested_, 1);
	if (thread_id_ != nullptr) {
		k_wakeup(thread_id_);
	}
}

/**
 * @brief 启动服务线程（幂等）。
 * @return 0 表示成功或已在运行；-1 表示线程创建失败。
 */
int GalleryService::run() noexcept
{
	if (!atomic_cas(&running_, 0, 1)) {
		log_.info("gallery service task already running");
		return 0;
	}
	atomic_set(&stop_requested_, 0);
	thread_id_ = k_thread_create(&thread_, stack_, K_THREAD_STACK_SIZEOF(stack_), threadEntry, this,
				     nullptr, nullptr, kPriority, 0, K_NO_WAIT);
	if (thread_id_ == nullptr) {
		atomic_set(&running_, 0);
		log_.error("failed to create gallery service task", -1);
		return -1;
	}
	k_thread_name_set(thread_id_, "gallery_service");
	return 0;
}

} // namespace servers
