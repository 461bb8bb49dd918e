/*
 * Watchdog.hpp
 *
 *  Created on: 2026年10月14日
 */

#ifndef SRC_ENGINE_WATCHDOG_HPP_
#define SRC_ENGINE_WATCHDOG_HPP_

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

#include <sys/types.h>

#include <kerbal/utility/noncopyable.hpp>

#include "united_resource.hpp"

/**
 * @brief 墙上时间看门狗。与子进程并发启动, 独立于 OS 的 CPU 时间统计
 *
 * 到达截止时间时向整个进程组发送 SIGKILL; 取消请求成立时先发送 SIGTERM,
 * 宽限期过后仍未退出则发送 SIGKILL。在 disarm 之前会持续补发 SIGKILL,
 * 以清理在第一次信号之后才 fork 出来的进程。
 */
class Watchdog : kerbal::utility::noncopyable, kerbal::utility::nonassignable
{
	public:
		typedef std::chrono::steady_clock clock;
		typedef std::function<bool()> cancel_predicate;

	private:
		pid_t pgid;
		clock::time_point deadline;
		cancel_predicate cancel_requested;
		std::chrono::milliseconds cancel_grace;
		std::chrono::milliseconds poll_interval;

		mutable std::mutex mtx;
		std::condition_variable cond;
		bool armed;
		Termination fired_by;
		std::thread watcher;

		void watch() noexcept;

	public:
		/**
		 * @param pgid 要监视的进程组, 子进程须已调用 setpgid 成为组长
		 * @param deadline 截止时间点
		 * @param cancel_requested 取消谓词, 可以为空。在看门狗线程中每 poll_interval 调用一次
		 * @throws std::system_error 线程创建失败
		 */
		Watchdog(pid_t pgid, clock::time_point deadline, cancel_predicate cancel_requested,
				 std::chrono::milliseconds cancel_grace, std::chrono::milliseconds poll_interval = std::chrono::milliseconds(100));

		~Watchdog() noexcept;

		/**
		 * @brief 停止看门狗并等待其线程退出。返回后看门狗不会再发送任何信号
		 */
		void disarm() noexcept;

		/**
		 * @return 看门狗是否以及因何终止了进程组, 未触发时为 COMPLETED
		 */
		Termination fired() const noexcept;
};

#endif /* SRC_ENGINE_WATCHDOG_HPP_ */
