#ifndef RUNNER_SECCOMP_RULES_H
#define RUNNER_SECCOMP_RULES_H

#include <string>
#include <vector>

#include <linux/filter.h>

/**
 * @brief 宿主机后端子进程的系统调用过滤策略
 */
enum class SeccompPolicy
{
	NONE = 0, ///< 不加载过滤规则
	NO_NETWORK = 1, ///< 禁止创建非 AF_UNIX 的 socket, 禁止 ptrace, mount, 命名空间操作等
};

const char * getSeccompPolicyName(SeccompPolicy policy);

SeccompPolicy parseSeccompPolicy(const std::string & name);

/**
 * @brief 预先生成好的 BPF 过滤程序
 *
 * 规则的构建与 BPF 的生成需要分配内存, 在 fork 之前的父进程中完成;
 * 子进程中的 load 只做 prctl 系统调用。
 */
class SeccompProgram
{
	private:
		std::vector<struct sock_filter> instructions;

		SeccompProgram() = default;

		static SeccompProgram compile(SeccompPolicy policy);

	public:
		/**
		 * @brief 取得对应策略的过滤程序, 每种策略只生成一次
		 * @throws std::runtime_error libseccomp 生成规则失败
		 */
		static const SeccompProgram & for_policy(SeccompPolicy policy);

		bool empty() const noexcept
		{
			return instructions.empty();
		}

		size_t size() const noexcept
		{
			return instructions.size();
		}

		/**
		 * @brief 在当前进程中加载过滤程序, 只应在 fork 之后 execve 之前的子进程中调用
		 * @return 成功返回 0, 失败返回对应的 errno
		 */
		int load() const noexcept;
};

#endif //RUNNER_SECCOMP_RULES_H
