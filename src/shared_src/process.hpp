/*
 * process.hpp
 *
 *  Created on: 2026年10月14日
 */

#ifndef SRC_SHARED_SRC_PROCESS_HPP_
#define SRC_SHARED_SRC_PROCESS_HPP_

#include <utility>
#include <stdexcept>
#include <cerrno>
#include <cstring>
#include <string>

#include <signal.h>
#include <unistd.h>
#include <sys/resource.h>
#include <sys/wait.h>

#include <kerbal/utility/noncopyable.hpp>

/**
 * @brief fork 出的子进程的句柄。子进程是一个新进程组的组长, 组号等于其 pid
 *
 * 句柄在析构时若子进程仍未被回收, 则杀死整个进程组并回收组长, 不会留下僵尸进程。
 */
class process : virtual kerbal::utility::noncopyable, kerbal::utility::nonassignable
{
	public:
		typedef pid_t pid_type;

	protected:
		pid_type father_id;
		pid_type child_id;

		enum
		{
			none, joined, detached
		} status;

	public:
		process() noexcept :
				father_id(0), child_id(0), status(none)
		{
		}

		/**
		 * @brief fork 并在子进程中调用 func。func 返回后子进程以 127 退出
		 * @throws std::runtime_error fork 失败
		 */
		template <typename Callable, typename ... Args>
		explicit process(Callable && func, Args && ... args) :
				father_id(getpid()), child_id(-1), status(joined)
		{
			child_id = fork();
			if (child_id == -1) {
				status = none;
				throw std::runtime_error(std::string("fork failed: ") + std::strerror(errno));
			} else if (child_id == 0) {
				::setpgid(0, 0);
				{
					func(std::forward<Args>(args)...);
				}
				// 不能用 exit, 否则会在子进程中执行父进程注册的 atexit 与静态对象析构
				_exit(127);
			}
			// 父子进程都设置一次, 避免父进程在子进程 setpgid 之前就向进程组发信号
			::setpgid(child_id, child_id);
		}

		~process() noexcept
		{
			if (getpid() == father_id) {
				switch (status) {
					case none:
						break;
					case joined:
						::killpg(child_id, SIGKILL);
						::waitpid(child_id, nullptr, 0);
						break;
					case detached:
						break;
				}
			}
		}

		pid_type get_father_id() const noexcept
		{
			return this->father_id;
		}

		pid_type get_child_id() const noexcept
		{
			return this->child_id;
		}

		process(process && src) noexcept :
				father_id(src.father_id), child_id(src.child_id), status(src.status)
		{
			src.father_id = 0;
			src.child_id = 0;
			src.status = none;
		}

		void swap(process & with) noexcept
		{
			std::swap(this->father_id, with.father_id);
			std::swap(this->child_id, with.child_id);
			std::swap(this->status, with.status);
		}

		process& operator=(process&& src) noexcept
		{
			process tmp(std::move(src));
			this->swap(tmp);
			return *this;
		}

		bool joinable() const noexcept
		{
			return status == joined;
		}

		/**
		 * @brief 检查子进程是否已经结束, 但不回收它。
		 * 组长未被回收之前其进程组号不会被系统复用, 因此此后仍可以安全地向该进程组发信号
		 * @return 已结束返回 1, 仍在运行返回 0, 出错返回 -1
		 */
		int exited() const noexcept
		{
			if (status != joined) {
				return 1;
			}
			siginfo_t info;
			info.si_pid = 0;
			while (::waitid(P_PID, static_cast<id_t>(child_id), &info, WEXITED | WNOHANG | WNOWAIT) == -1) {
				if (errno != EINTR) {
					return -1;
				}
			}
			return info.si_pid == 0 ? 0 : 1;
		}

		/**
		 * @brief Wait for the process to exit. Put the status in *status_loc
		 * @param status_loc The location where the process status will be put.
		 * @param options If the WUNTRACED bit is set in OPTIONS, return status for stopped children; otherwise don't.
		 * @param usage If not nil, store information about the child's resource usage there.
		 * @return For errors return (pid_type) (-1); otherwise return the process ID.
		 */
		pid_type join(int * status_loc, int options, struct rusage * usage) noexcept
		{
			if (status == none) {
				return 0;
			}
			pid_type res;
			do {
				res = ::wait4(child_id, status_loc, options, usage);
			} while (res == -1 && errno == EINTR);
			if (res == child_id) {
				this->father_id = 0;
				this->status = none;
			}
			return res;
		}

		void detach() noexcept
		{
			status = detached;
		}

		/**
		 * @brief Send signal SIG to the whole process group.
		 * @param sig signal send to child process group.
		 * @return If success return 0, For errors, return other value.
		 */
		int kill_group(int sig) noexcept
		{
			if (status != joined) {
				return 0;
			}
			return ::killpg(child_id, sig);
		}

};

#endif /* SRC_SHARED_SRC_PROCESS_HPP_ */
