/*
 * Watchdog.cpp
 *
 *  Created on: 2026年10月14日
 */

#include "Watchdog.hpp"

#include <algorithm>
#include <system_error>

#include <signal.h>

#include <kerbal/compatibility/chrono_suffix.hpp>

#include "logger.hpp"

Watchdog::Watchdog(pid_t pgid, clock::time_point deadline, cancel_predicate cancel_requested,
				   std::chrono::milliseconds cancel_grace, std::chrono::milliseconds poll_interval) :
		pgid(pgid), deadline(deadline), cancel_requested(std::move(cancel_requested)),
		cancel_grace(cancel_grace), poll_interval(poll_interval), armed(true), fired_by(Termination::COMPLETED)
{
	watcher = std::thread(&Watchdog::watch, this);
}

Watchdog::~Watchdog() noexcept
{
	this->disarm();
}

void Watchdog::disarm() noexcept
{
	{
		std::lock_guard<std::mutex> lck(mtx);
		armed = false;
	}
	cond.notify_all();
	if (watcher.joinable()) {
		try {
			watcher.join();
		} catch (const std::system_error & e) {
			watcher.detach();
		}
	}
}

Termination Watchdog::fired() const noexcept
{
	std::lock_guard<std::mutex> lck(mtx);
	return fired_by;
}

void Watchdog::watch() noexcept
{
	using namespace kerbal::compatibility::chrono_suffix;

	bool term_sent = false;
	clock::time_point kill_at = clock::time_point::max();

	std::unique_lock<std::mutex> lck(mtx);
	while (armed) {
		clock::time_point now = clock::now();

		if (fired_by == Termination::COMPLETED && now >= deadline) {
			fired_by = Termination::TIMED_OUT;
		}

		if (fired_by == Termination::COMPLETED && cancel_requested) {
			// 谓词可能访问外部存储, 调用期间不持有锁
			lck.unlock();
			bool canceled = false;
			try {
				canceled = cancel_requested();
			} catch (const std::exception & e) {
				EXCEPT_WARNING(std::string(), "Query cancel flag failed, treat as not canceled.", e, " pgid: ", pgid);
			} catch (...) {
				UNKNOWN_EXCEPT_WARNING(std::string(), "Query cancel flag failed, treat as not canceled.", " pgid: ", pgid);
			}
			lck.lock();
			if (!armed) {
				break;
			}
			if (canceled) {
				fired_by = Termination::CANCELED;
				now = clock::now();
				kill_at = now + cancel_grace;
			}
		}

		switch (fired_by) {
			case Termination::COMPLETED:
				break;
			case Termination::TIMED_OUT:
				::killpg(pgid, SIGKILL);
				break;
			case Termination::CANCELED:
				if (!term_sent) {
					::killpg(pgid, SIGTERM);
					term_sent = true;
				} else if (now >= kill_at) {
					::killpg(pgid, SIGKILL);
				}
				break;
		}

		clock::time_point wake = now + poll_interval;
		if (fired_by == Termination::COMPLETED) {
			wake = std::min(wake, deadline);
		} else if (fired_by == Termination::CANCELED && kill_at > now) {
			wake = std::min(wake, kill_at);
		} else {
			wake = now + 20_ms;
		}
		cond.wait_until(lck, wake);
	}
}
