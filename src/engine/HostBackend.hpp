/*
 * HostBackend.hpp
 *
 *  Created on: 2026年10月15日
 */

#ifndef SRC_ENGINE_HOSTBACKEND_HPP_
#define SRC_ENGINE_HOSTBACKEND_HPP_

#include <memory>
#include <string>

#include <sys/types.h>

#include <kerbal/data_struct/optional/optional.hpp>

#include "ProcessLauncher.hpp"
#include "SandboxBackend.hpp"
#include "seccomp_rules.hpp"

struct HostBackendSettings
{
		template <typename Type>
		using optional = kerbal::data_struct::optional<Type>;

		std::string search_path = "/usr/local/bin:/usr/bin:/bin"; ///< 子进程的 PATH, 也用于查找解释器与编译器
		SeccompPolicy seccomp_policy = SeccompPolicy::NO_NETWORK;
		optional<uid_t> uid; ///< 非空时子进程降权到该用户 (需要 worker 以 root 运行)
		optional<gid_t> gid;
		std::chrono::milliseconds cancel_grace = std::chrono::milliseconds(500);
};

/**
 * @brief 宿主机后端: 以 worker 的直接子进程执行各步骤, 工作目录为工作区
 */
class HostBackend : public SandboxBackend
{
	private:
		HostBackendSettings settings;
		std::shared_ptr<ProcessLauncher> launcher;

		ExecuteArgs make_environment(const BoundedCommandPlan & plan, const PathLayout & layout) const;

		/**
		 * @brief 将 argv[0] 解析为绝对路径, 编译产物 (含 '/' 的路径) 原样保留
		 * @throws InfrastructureException 找不到所需的工具
		 */
		ExecuteArgs resolve(const ExecuteArgs & argv) const;

	public:
		HostBackend(const HostBackendSettings & settings, std::shared_ptr<ProcessLauncher> launcher);

		virtual const char * name() const noexcept override
		{
			return "host";
		}

		virtual PathLayout layout_for(const Workspace & workspace, const LanguageSpec & spec) const override;

		virtual ExecutionResult execute(const BoundedCommandPlan & plan, const LanguageSpec & spec, const Workspace & workspace,
										const std::string & stdin_data, const cancel_predicate & cancel_requested) override;
};

#endif /* SRC_ENGINE_HOSTBACKEND_HPP_ */
