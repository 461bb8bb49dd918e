/*
 * ProtectedProcess.cpp
 *
 *  Created on: 2026年10月14日
 */

#include "ProtectedProcess.hpp"
#include "Watchdog.hpp"

#include "process.hpp"
#include "logger.hpp"
#include "runner_exceptions.hpp"

#include <cstring>
#include <memory>
#include <thread>
#include <vector>

#include <fcntl.h>
#include <grp.h>
#include <poll.h>
#include <unistd.h>
#include <sys/resource.h>
#include <sys/syscall.h>

#include <kerbal/compatibility/chrono_suffix.hpp>

namespace
{
	/**
	 * @brief 一个辅助类, 用于确保将打开的文件描述符关闭
	 */
	struct fd_guard
	{
			int fd;

			fd_guard() noexcept :
					fd(-1)
			{
			}

			~fd_guard() noexcept
			{
				this->close();
			}

			void close() noexcept
			{
				if (fd == -1) {
					return;
				}
				::close(fd);
				fd = -1;
			}

			bool is_open() const noexcept
			{
				return fd != -1;
			}
	};

	void make_pipe(fd_guard & read_end, fd_guard & write_end)
	{
		int fds[2];
		if (::pipe2(fds, O_CLOEXEC) != 0) {
			throw std::runtime_error(std::string("pipe failed: ") + std::strerror(errno));
		}
		read_end.fd = fds[0];
		write_end.fd = fds[1];
	}

	void set_nonblock(int fd)
	{
		int flags = ::fcntl(fd, F_GETFL);
		if (flags == -1 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1) {
			throw std::runtime_error(std::string("fcntl failed: ") + std::strerror(errno));
		}
	}

	/**
	 * @brief 子进程在 execve 之前失败的阶段, 经由 close-on-exec 管道报告给父进程
	 */
	enum class ChildStage
	{
		DUP2 = 0, CHDIR = 1, SETRLIMIT = 2, SETGROUPS = 3, SETGID = 4, SETUID = 5, SECCOMP = 6, SIGNAL = 7, EXEC = 8
	};

	const char * getChildStageName(ChildStage stage)
	{
		switch (stage) {
			case ChildStage::DUP2:
				return "dup2";
			case ChildStage::CHDIR:
				return "chdir";
			case ChildStage::SETRLIMIT:
				return "setrlimit";
			case ChildStage::SETGROUPS:
				return "setgroups";
			case ChildStage::SETGID:
				return "setgid";
			case ChildStage::SETUID:
				return "setuid";
			case ChildStage::SECCOMP:
				return "seccomp";
			case ChildStage::SIGNAL:
				return "signal";
			case ChildStage::EXEC:
				return "execve";
		}
		return "unknown";
	}

	struct child_error
	{
			int stage;
			int err;
	};

	struct rlimit_item
	{
			int resource;
			rlim_t value;
	};

	std::vector<rlimit_item> make_rlimits(const StepLimits & limits)
	{
		std::vector<rlimit_item> items;
		if (limits.address_space_bytes.has_value()) {
			items.push_back( { RLIMIT_AS, static_cast<rlim_t>(limits.address_space_bytes.value()) });
		}
		if (limits.cpu_seconds.has_value()) {
			items.push_back( { RLIMIT_CPU, static_cast<rlim_t>(limits.cpu_seconds.value()) });
		}
		if (limits.max_processes.has_value()) {
			items.push_back( { RLIMIT_NPROC, static_cast<rlim_t>(limits.max_processes.value()) });
		}
		if (limits.max_file_size_bytes.has_value()) {
			items.push_back( { RLIMIT_FSIZE, static_cast<rlim_t>(limits.max_file_size_bytes.value()) });
		}
		// 不产生 core 文件
		items.push_back( { RLIMIT_CORE, 0 });
		return items;
	}

	/**
	 * @brief 关闭除标准流与 keep 以外的所有描述符, 避免 worker 的日志文件, redis 连接等泄漏给子进程
	 */
	void close_inherited_fds(int keep) noexcept
	{
#ifdef SYS_close_range
		if (keep > 3 && ::syscall(SYS_close_range, 3u, static_cast<unsigned>(keep - 1), 0u) == 0 &&
				::syscall(SYS_close_range, static_cast<unsigned>(keep + 1), ~0u, 0u) == 0) {
			return;
		}
#endif
		struct rlimit nofile;
		long max_fd = 65536;
		if (::getrlimit(RLIMIT_NOFILE, &nofile) == 0 && nofile.rlim_cur != RLIM_INFINITY && nofile.rlim_cur < 65536) {
			max_fd = static_cast<long>(nofile.rlim_cur);
		}
		for (long fd = 3; fd < max_fd; ++fd) {
			if (fd != keep) {
				::close(static_cast<int>(fd));
			}
		}
	}

	[[noreturn]] void report_child_error(int status_fd, ChildStage stage, int err) noexcept
	{
		child_error e = { static_cast<int>(stage), err };
		ssize_t n;
		do {
			n = ::write(status_fd, &e, sizeof(e));
		} while (n == -1 && errno == EINTR);
		_exit(127);
	}

	/**
	 * @brief fork 之后 execve 之前在子进程中执行, 只做系统调用级别的操作
	 */
	void child_main(const ProtectedProcessConfig & config, const std::vector<rlimit_item> & rlimits,
					const SeccompProgram & seccomp, char * const * argv, char * const * envp,
					int stdin_fd, int stdout_fd, int stderr_fd, int status_fd) noexcept
	{
		if (::dup2(stdin_fd, STDIN_FILENO) == -1 || ::dup2(stdout_fd, STDOUT_FILENO) == -1 || ::dup2(stderr_fd, STDERR_FILENO) == -1) {
			report_child_error(status_fd, ChildStage::DUP2, errno);
		}
		close_inherited_fds(status_fd);

		if (!config.working_dir.empty() && ::chdir(config.working_dir.c_str()) != 0) {
			report_child_error(status_fd, ChildStage::CHDIR, errno);
		}

		for (const rlimit_item & item : rlimits) {
			struct rlimit lim;
			lim.rlim_cur = item.value;
			lim.rlim_max = item.value;
			if (::setrlimit(item.resource, &lim) != 0) {
				report_child_error(status_fd, ChildStage::SETRLIMIT, errno);
			}
		}

		if (config.gid.has_value()) {
			if (::setgroups(0, nullptr) != 0) {
				report_child_error(status_fd, ChildStage::SETGROUPS, errno);
			}
			if (::setgid(config.gid.value()) != 0) {
				report_child_error(status_fd, ChildStage::SETGID, errno);
			}
		}
		if (config.uid.has_value()) {
			if (::setuid(config.uid.value()) != 0) {
				report_child_error(status_fd, ChildStage::SETUID, errno);
			}
		}

		int seccomp_err = seccomp.load();
		if (seccomp_err != 0) {
			report_child_error(status_fd, ChildStage::SECCOMP, seccomp_err);
		}

		// 被忽略的信号处置会穿过 execve 继承下去, 需要恢复默认
		sigset_t empty_mask;
		sigemptyset(&empty_mask);
		if (::signal(SIGPIPE, SIG_DFL) == SIG_ERR || ::sigprocmask(SIG_SETMASK, &empty_mask, nullptr) != 0) {
			report_child_error(status_fd, ChildStage::SIGNAL, errno);
		}

		::execve(argv[0], argv, envp);
		report_child_error(status_fd, ChildStage::EXEC, errno);
	}

	void append_limited(std::string & dst, const char * buf, size_t n, size_t limit, bool & truncated)
	{
		if (dst.size() >= limit) {
			truncated = truncated || n > 0;
			return;
		}
		size_t room = limit - dst.size();
		if (n > room) {
			dst.append(buf, room);
			truncated = true;
		} else {
			dst.append(buf, n);
		}
	}

	/**
	 * @return 读到 EOF 或出错返回 false
	 */
	bool drain_once(int fd, std::string & dst, size_t limit, bool & truncated)
	{
		char buf[65536];
		while (true) {
			ssize_t n = ::read(fd, buf, sizeof(buf));
			if (n > 0) {
				append_limited(dst, buf, static_cast<size_t>(n), limit, truncated);
				continue;
			}
			if (n == 0) {
				return false;
			}
			if (errno == EINTR) {
				continue;
			}
			return errno == EAGAIN || errno == EWOULDBLOCK;
		}
	}

} /* namespace */

ProtectedProcessDetails
protected_process(const ExecuteArgs & execute_args, const ProtectedProcessConfig & config, const ExecuteArgs & env)
{
	using namespace std::chrono;
	using namespace kerbal::compatibility::chrono_suffix;

	if (execute_args.empty()) {
		throw std::invalid_argument("empty argv");
	}

	// 写入已关闭的 stdin 管道时不能让 worker 被 SIGPIPE 杀死
	static const bool sigpipe_ignored = ::signal(SIGPIPE, SIG_IGN) != SIG_ERR;
	(void) sigpipe_ignored;

	fd_guard stdin_r, stdin_w, stdout_r, stdout_w, stderr_r, stderr_w, status_r, status_w;
	make_pipe(stdin_r, stdin_w);
	make_pipe(stdout_r, stdout_w);
	make_pipe(stderr_r, stderr_w);
	make_pipe(status_r, status_w);

	// fork 之后子进程只做系统调用, 所有需要分配内存的准备工作 (包括生成 seccomp 的 BPF 程序) 都在这里完成
	std::unique_ptr<char*[]> argv = execute_args.getArgs();
	std::unique_ptr<char*[]> envp = env.getArgs();
	const std::vector<rlimit_item> rlimits = make_rlimits(config.limits);
	const SeccompProgram & seccomp = SeccompProgram::for_policy(config.seccomp_policy);

	// 此处创建了一个运行子进程, 该进程内先加载保护策略, 然后使用 execve 函数用 execute_args 替换自身
	process child_process([&]() noexcept {
		child_main(config, rlimits, seccomp, argv.get(), envp.get(), stdin_r.fd, stdout_w.fd, stderr_w.fd, status_w.fd);
	});

	stdin_r.close();
	stdout_w.close();
	stderr_w.close();
	status_w.close();

	{
		child_error e;
		ssize_t n;
		do {
			n = ::read(status_r.fd, &e, sizeof(e));
		} while (n == -1 && errno == EINTR);
		status_r.close();

		if (n == static_cast<ssize_t>(sizeof(e))) {
			child_process.join(nullptr, 0, nullptr);
			ChildStage stage = static_cast<ChildStage>(e.stage);
			if (stage == ChildStage::EXEC && (e.err == ENOENT || e.err == EACCES || e.err == ENOEXEC)) {
				throw InfrastructureException("Required executable is not available: " + execute_args[0]);
			}
			throw ChildSetupException(getChildStageName(stage), e.err);
		}
	}

	// record current time
	auto process_start_time_point = steady_clock::now();

	std::unique_ptr<Watchdog> watchdog;
	if (config.deadline.has_value() || config.cancel_requested) {
		ProtectedProcessConfig::clock::time_point deadline = config.deadline.has_value() ?
				config.deadline.value() : ProtectedProcessConfig::clock::time_point::max();
		watchdog.reset(new Watchdog(child_process.get_child_id(), deadline, config.cancel_requested, config.cancel_grace));
	}

	set_nonblock(stdout_r.fd);
	set_nonblock(stderr_r.fd);
	set_nonblock(stdin_w.fd);

	ProtectedProcessDetails details;
	size_t input_written = 0;
	if (config.input_data.empty()) {
		stdin_w.close();
	}

	bool child_done = false;
	steady_clock::time_point drain_deadline;
	while (true) {
		if (!child_done) {
			int exited = child_process.exited();
			if (exited != 0) {
				child_done = true;
				// 组长退出后, 先停止看门狗再清理组内残留的后代进程, 组长尚未回收, 组号不会被复用
				if (watchdog) {
					watchdog->disarm();
				}
				child_process.kill_group(SIGKILL);
				drain_deadline = steady_clock::now() + 1_s;
			}
		}

		if (!stdout_r.is_open() && !stderr_r.is_open()) {
			if (child_done) {
				break;
			}
		}
		if (child_done && steady_clock::now() >= drain_deadline) {
			// 逃出进程组的后代仍持有管道, 不再等待
			LOG_WARNING(std::string(), "Output pipes are still held after the process exited, stop draining. pid: ", child_process.get_child_id());
			break;
		}

		pollfd fds[3];
		nfds_t nfds = 0;
		int stdout_idx = -1, stderr_idx = -1, stdin_idx = -1;
		if (stdout_r.is_open()) {
			stdout_idx = nfds;
			fds[nfds++] = { stdout_r.fd, POLLIN, 0 };
		}
		if (stderr_r.is_open()) {
			stderr_idx = nfds;
			fds[nfds++] = { stderr_r.fd, POLLIN, 0 };
		}
		if (stdin_w.is_open()) {
			stdin_idx = nfds;
			fds[nfds++] = { stdin_w.fd, POLLOUT, 0 };
		}

		int ready = nfds == 0 ? 0 : ::poll(fds, nfds, 20);
		if (nfds == 0) {
			std::this_thread::sleep_for(20_ms);
		}
		if (ready == -1) {
			if (errno == EINTR) {
				continue;
			}
			throw std::runtime_error(std::string("poll failed: ") + std::strerror(errno));
		}

		if (stdout_idx != -1 && fds[stdout_idx].revents != 0) {
			if (!drain_once(stdout_r.fd, details.output, config.max_output_size, details.truncated)) {
				stdout_r.close();
			}
		}
		if (stderr_idx != -1 && fds[stderr_idx].revents != 0) {
			if (!drain_once(stderr_r.fd, details.error, config.max_output_size, details.truncated)) {
				stderr_r.close();
			}
		}
		if (stdin_idx != -1 && fds[stdin_idx].revents != 0) {
			if (fds[stdin_idx].revents & (POLLERR | POLLHUP)) {
				stdin_w.close();
			} else {
				ssize_t n = ::write(stdin_w.fd, config.input_data.data() + input_written, config.input_data.size() - input_written);
				if (n > 0) {
					input_written += static_cast<size_t>(n);
					if (input_written == config.input_data.size()) {
						stdin_w.close();
					}
				} else if (n == -1 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
					// EPIPE: 子进程不再读取 stdin
					stdin_w.close();
				}
			}
		}
	}

	stdin_w.close();
	if (watchdog) {
		watchdog->disarm();
	}

	int status = 0;
	struct rusage resource_usage;
	{
		// wait for child process to terminate
		// on success, returns the process ID of the child whose state has changed;
		// On error, -1 is returned.
		if (child_process.join(&status, 0, &resource_usage) == -1) {
			throw std::runtime_error(std::string("wait failed: ") + std::strerror(errno));
		}
	}

	details.real_time = duration_cast<milliseconds>(steady_clock::now() - process_start_time_point);

	constexpr auto timevalToChrono = [](const timeval & val) -> std::chrono::milliseconds
	{
		using namespace std::chrono;
		return duration_cast<milliseconds>(seconds(val.tv_sec) + microseconds(val.tv_usec));
	};
	details.cpu_time = timevalToChrono(resource_usage.ru_utime) + timevalToChrono(resource_usage.ru_stime);

	if (WIFSIGNALED(status) != 0) {
		details.running_result = ProtectedProcessResult::SIGNALED;
		details.term_signal = WTERMSIG(status);
		details.exit_code = 128 + details.term_signal;
	} else {
		details.running_result = ProtectedProcessResult::EXITED;
		details.exit_code = WEXITSTATUS(status);
	}

	if (watchdog) {
		switch (watchdog->fired()) {
			case Termination::COMPLETED:
				break;
			case Termination::TIMED_OUT:
				details.running_result = ProtectedProcessResult::REAL_TIME_LIMIT_EXCEEDED;
				break;
			case Termination::CANCELED:
				details.running_result = ProtectedProcessResult::CANCELED;
				break;
		}
	}
	return details;
}
