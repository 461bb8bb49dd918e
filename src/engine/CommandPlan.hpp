/*
 * CommandPlan.hpp
 *
 *  Created on: 2026年10月13日
 */

#ifndef SRC_ENGINE_COMMANDPLAN_HPP_
#define SRC_ENGINE_COMMANDPLAN_HPP_

#include <chrono>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include <kerbal/data_struct/optional/optional.hpp>

#include "ExecuteArgs.hpp"

typedef std::vector<std::pair<std::string, std::string>> Environment;

/**
 * @brief 单个 job 的资源限制
 */
struct ResourceLimits
{
		std::chrono::seconds timeout; ///< 墙上时间, 编译与运行共享
		int memory_mb;
};

/**
 * @brief 执行端看到的路径布局。宿主机后端是工作区的真实路径, 容器后端是容器内的挂载点
 */
struct PathLayout
{
		std::string workdir;
		std::string source;
		std::string builddir;
		std::string tmpdir;
};

/**
 * @brief 命令合成的结果: 解释型语言只有 run, 编译型语言先 compile, 编译成功 (退出码为 0) 后才 run
 */
struct CommandPlan
{
		template <typename Type>
		using optional = kerbal::data_struct::optional<Type>;

		optional<ExecuteArgs> compile;
		ExecuteArgs run;
		Environment environment; ///< 语言相关的运行时调优, 以显式的环境变量覆盖给出

		bool is_two_phase() const noexcept
		{
			return compile.has_value();
		}
};

/**
 * @brief 作用于单个步骤的 OS 级上限, 为空表示不限制
 */
struct StepLimits
{
		template <typename Type>
		using optional = kerbal::data_struct::optional<Type>;

		optional<std::uint64_t> address_space_bytes; ///< RLIMIT_AS
		optional<std::uint64_t> cpu_seconds; ///< RLIMIT_CPU
		optional<std::uint64_t> max_processes; ///< RLIMIT_NPROC
		optional<std::uint64_t> max_file_size_bytes; ///< RLIMIT_FSIZE

		bool empty() const noexcept
		{
			return !address_space_bytes.has_value() && !cpu_seconds.has_value() &&
					!max_processes.has_value() && !max_file_size_bytes.has_value();
		}
};

struct BoundedStep
{
		ExecuteArgs argv;
		StepLimits limits;
};

/**
 * @brief 施加了资源限制的命令计划。看门狗的墙上时间对所有后端都生效
 */
struct BoundedCommandPlan
{
		template <typename Type>
		using optional = kerbal::data_struct::optional<Type>;

		optional<BoundedStep> compile;
		BoundedStep run;
		Environment environment;

		std::chrono::milliseconds wall_timeout;
		int memory_mb;
		std::uint64_t max_processes; ///< 容器级的进程数配额
		size_t max_output_bytes; ///< stdout 与 stderr 各自的捕获上限

		bool is_two_phase() const noexcept
		{
			return compile.has_value();
		}
};

#endif /* SRC_ENGINE_COMMANDPLAN_HPP_ */
