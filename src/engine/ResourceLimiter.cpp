/*
 * ResourceLimiter.cpp
 *
 *  Created on: 2026年10月14日
 */

#include "ResourceLimiter.hpp"

#include <kerbal/compatibility/chrono_suffix.hpp>

ResourceLimiter::ResourceLimiter(const LimiterSettings & settings) :
		settings(settings)
{
}

BoundedCommandPlan ResourceLimiter::apply(const CommandPlan & plan, const LanguageSpec & spec, const ResourceLimits & limits) const
{
	using namespace std::chrono;
	using namespace kerbal::compatibility::chrono_suffix;

	BoundedCommandPlan bounded;
	bounded.environment = plan.environment;
	bounded.wall_timeout = duration_cast<milliseconds>(limits.timeout);
	bounded.memory_mb = limits.memory_mb;
	bounded.max_processes = settings.max_processes;
	bounded.max_output_bytes = settings.max_output_bytes;

	if (plan.compile.has_value()) {
		BoundedStep compile;
		compile.argv = plan.compile.value();
		bounded.compile = compile;
	}

	bounded.run.argv = plan.run;
	if (!settings.os_limits_supported) {
		return bounded;
	}

	StepLimits & run_limits = bounded.run.limits;
	if (spec.cap_address_space) {
		run_limits.address_space_bytes = static_cast<std::uint64_t>(limits.memory_mb) * 1024 * 1024 * 2;
	}
	if (spec.cap_cpu_and_processes) {
		run_limits.cpu_seconds = static_cast<std::uint64_t>(duration_cast<seconds>(limits.timeout + 1_s).count());
		if (settings.process_cap_supported) {
			run_limits.max_processes = settings.max_processes;
		}
	}
	run_limits.max_file_size_bytes = settings.max_file_size_mb * 1024 * 1024;
	return bounded;
}
