/*
 * ResourceLimiter.hpp
 *
 *  Created on: 2026年10月14日
 */

#ifndef SRC_ENGINE_RESOURCELIMITER_HPP_
#define SRC_ENGINE_RESOURCELIMITER_HPP_

#include <cstdint>

#include "CommandPlan.hpp"
#include "LanguageRegistry.hpp"

struct LimiterSettings
{
		/// 宿主机是否支持 setrlimit 形式的 OS 级限制
		bool os_limits_supported = true;

		/**
		 * @brief RLIMIT_NPROC 按真实 uid 统计全部进程, 只有沙箱以专用 uid 运行时才能安全施加
		 */
		bool process_cap_supported = false;

		std::uint64_t max_processes = 64;
		std::uint64_t max_file_size_mb = 32;
		size_t max_output_bytes = 1024 * 1024;
};

/**
 * @brief 将命令计划包装上 OS 级资源上限与墙上时间
 *
 * 上限只作用于运行步骤, 编译器需要更多余量。地址空间上限为内存上限的两倍,
 * CPU 秒数为墙上时间加一秒。语言描述中未标记可限制的项目不会施加。
 */
class ResourceLimiter
{
	private:
		LimiterSettings settings;

	public:
		explicit ResourceLimiter(const LimiterSettings & settings);

		BoundedCommandPlan apply(const CommandPlan & plan, const LanguageSpec & spec, const ResourceLimits & limits) const;

		const LimiterSettings & get_settings() const noexcept
		{
			return settings;
		}
};

#endif /* SRC_ENGINE_RESOURCELIMITER_HPP_ */
