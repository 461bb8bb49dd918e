/*
 * ProtectedProcess.hpp
 *
 *  Created on: 2026年10月14日
 */

#ifndef SRC_ENGINE_PROTECTEDPROCESS_HPP_
#define SRC_ENGINE_PROTECTEDPROCESS_HPP_

#include <chrono>
#include <functional>
#include <ostream>
#include <string>

#include <sys/types.h>

#include <boost/filesystem.hpp>
#include <kerbal/data_struct/optional/optional.hpp>

#include "CommandPlan.hpp"
#include "ExecuteArgs.hpp"
#include "seccomp_rules.hpp"
#include "united_resource.hpp"

class ProtectedProcessConfig
{
	public:
		template <typename Type>
		using optional = kerbal::data_struct::optional<Type>;

		typedef std::chrono::steady_clock clock;

		boost::filesystem::path working_dir; ///< 子进程的工作目录
		std::string input_data; ///< 写入子进程 stdin 的数据, 写完后关闭

		StepLimits limits; ///< OS 级资源上限

		using deadline_type = optional<clock::time_point>;
		deadline_type deadline; ///< 墙上时间截止点, 到达后整个进程组被杀死

		using cancel_predicate_type = std::function<bool()>;
		cancel_predicate_type cancel_requested; ///< 取消谓词, 成立后整个进程组被终止

		std::chrono::milliseconds cancel_grace = std::chrono::milliseconds(500); ///< SIGTERM 与 SIGKILL 之间的宽限期

		size_t max_output_size = 1024 * 1024; ///< stdout 与 stderr 各自的最大捕获字节数, 超出部分被丢弃

		SeccompPolicy seccomp_policy = SeccompPolicy::NONE;

		optional<uid_t> uid; ///< 以该用户身份执行
		optional<gid_t> gid;

		ProtectedProcessConfig() = default;

		explicit ProtectedProcessConfig(const boost::filesystem::path & working_dir) :
				working_dir(working_dir)
		{
		}

		ProtectedProcessConfig& set_input_data(const std::string & input_data)
		{
			this->input_data = input_data;
			return *this;
		}

		ProtectedProcessConfig& set_limits(const StepLimits & limits)
		{
			this->limits = limits;
			return *this;
		}

		/// set wall clock deadline
		ProtectedProcessConfig& set_deadline(const clock::time_point & deadline)
		{
			this->deadline = deadline;
			return *this;
		}

		ProtectedProcessConfig& set_cancel_predicate(cancel_predicate_type cancel_requested)
		{
			this->cancel_requested = std::move(cancel_requested);
			return *this;
		}

		ProtectedProcessConfig& set_cancel_grace(std::chrono::milliseconds cancel_grace)
		{
			this->cancel_grace = cancel_grace;
			return *this;
		}

		/// set max output size
		ProtectedProcessConfig& set_max_output_size(size_t max_output_size)
		{
			this->max_output_size = max_output_size;
			return *this;
		}

		ProtectedProcessConfig& set_seccomp_policy(SeccompPolicy seccomp_policy)
		{
			this->seccomp_policy = seccomp_policy;
			return *this;
		}

		ProtectedProcessConfig& set_credentials(const optional<uid_t> & uid, const optional<gid_t> & gid)
		{
			this->uid = uid;
			this->gid = gid;
			return *this;
		}

};

enum class ProtectedProcessResult
{
	EXITED = 0, ///< 自行退出
	SIGNALED = 1, ///< 被信号杀死 (包括超过 RLIMIT_CPU 的 SIGXCPU/SIGKILL)
	REAL_TIME_LIMIT_EXCEEDED = 2, ///< 墙上时间超时, 被看门狗杀死
	CANCELED = 3, ///< 被取消请求终止
};

inline std::ostream& operator<<(std::ostream& out, ProtectedProcessResult result)
{
	switch (result) {
		case ProtectedProcessResult::EXITED:
			return out << "EXITED";
		case ProtectedProcessResult::SIGNALED:
			return out << "SIGNALED";
		case ProtectedProcessResult::REAL_TIME_LIMIT_EXCEEDED:
			return out << "REAL_TIME_LIMIT_EXCEEDED";
		case ProtectedProcessResult::CANCELED:
			return out << "CANCELED";
	}
	return out;
}

struct ProtectedProcessDetails
{
		ProtectedProcessResult running_result = ProtectedProcessResult::EXITED;
		std::chrono::milliseconds real_time { 0 };
		std::chrono::milliseconds cpu_time { 0 };
		int exit_code = 0; ///< 被信号杀死时为 128 + 信号值
		int term_signal = 0;
		std::string output;
		std::string error;
		bool truncated = false; ///< stdout 或 stderr 超过了 max_output_size
};

/**
 * @brief 在新的进程组中执行 args, 捕获其 stdout 与 stderr
 * @param args argv, args[0] 必须是可执行文件的路径 (不做 PATH 查找)
 * @param config 保护策略
 * @param env 完整的环境变量列表, 每个元素形如 KEY=VALUE
 * @throws InfrastructureException execve 因可执行文件不存在或不可执行而失败
 * @throws ChildSetupException 子进程在 execve 之前的准备阶段失败
 * @throws std::runtime_error fork, pipe 等系统调用失败
 */
ProtectedProcessDetails
protected_process(const ExecuteArgs & args, const ProtectedProcessConfig & config, const ExecuteArgs & env);

#endif /* SRC_ENGINE_PROTECTEDPROCESS_HPP_ */
