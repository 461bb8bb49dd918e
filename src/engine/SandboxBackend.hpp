/*
 * SandboxBackend.hpp
 *
 *  Created on: 2026年10月15日
 */

#ifndef SRC_ENGINE_SANDBOXBACKEND_HPP_
#define SRC_ENGINE_SANDBOXBACKEND_HPP_

#include <chrono>
#include <functional>
#include <string>

#include "CommandPlan.hpp"
#include "ExecutionResult.hpp"
#include "LanguageRegistry.hpp"
#include "ProtectedProcess.hpp"
#include "Workspace.hpp"

/**
 * @brief 沙箱后端的统一契约。后端在部署时选定, 不随 job 变化, 任务队列不感知具体后端
 */
class SandboxBackend
{
	public:
		typedef std::function<bool()> cancel_predicate;

		virtual const char * name() const noexcept = 0;

		/**
		 * @brief 命令在该后端中执行时看到的路径
		 */
		virtual PathLayout layout_for(const Workspace & workspace, const LanguageSpec & spec) const = 0;

		/**
		 * @brief 执行命令计划。编译失败, 非零退出, 超时与取消都作为数据返回
		 * @throws InfrastructureException 执行环境缺少所需的工具或镜像
		 * @throws std::exception 其他内部错误
		 */
		virtual ExecutionResult execute(const BoundedCommandPlan & plan, const LanguageSpec & spec, const Workspace & workspace,
										const std::string & stdin_data, const cancel_predicate & cancel_requested) = 0;

		virtual ~SandboxBackend() noexcept = default;

	protected:
		typedef std::chrono::steady_clock clock;

		/**
		 * @brief 执行单个步骤。参数依次为: 步骤, 是否为运行步骤, 共享的截止时间
		 */
		typedef std::function<ProtectedProcessDetails(const BoundedStep &, bool, clock::time_point)> step_executor;

		/**
		 * @brief 按 compile -> run 的顺序执行, 两个步骤共享同一个墙上时间预算;
		 * 编译退出码非零时不执行运行步骤
		 */
		static ExecutionResult run_plan(const BoundedCommandPlan & plan, const step_executor & execute_step);

		static std::string timeout_message(const BoundedCommandPlan & plan);
};

#endif /* SRC_ENGINE_SANDBOXBACKEND_HPP_ */
