/*
 * SandboxBackend.cpp
 *
 *  Created on: 2026年10月15日
 */

#include "SandboxBackend.hpp"

#include <boost/format.hpp>

namespace
{
	constexpr int timeout_exit_code = 124;

	void absorb(ExecutionResult & result, ProtectedProcessDetails && details)
	{
		result.stdout_text = std::move(details.output);
		result.stderr_text = std::move(details.error);
		result.exit_code = details.exit_code;
		result.truncated = result.truncated || details.truncated;
		result.duration += details.real_time;
	}

} /* namespace */

std::string SandboxBackend::timeout_message(const BoundedCommandPlan & plan)
{
	using namespace std::chrono;
	long long limit = duration_cast<seconds>(plan.wall_timeout + milliseconds(999)).count();
	return (boost::format("Execution timed out (%d seconds limit)") % limit).str();
}

ExecutionResult SandboxBackend::run_plan(const BoundedCommandPlan & plan, const step_executor & execute_step)
{
	const clock::time_point deadline = clock::now() + plan.wall_timeout;

	ExecutionResult result;
	auto finish_interrupted = [&plan, &result](ProtectedProcessResult running_result) {
		switch (running_result) {
			case ProtectedProcessResult::REAL_TIME_LIMIT_EXCEEDED:
				result.termination = Termination::TIMED_OUT;
				result.exit_code = timeout_exit_code;
				if (!result.stderr_text.empty() && result.stderr_text.back() != '\n') {
					result.stderr_text += '\n';
				}
				result.stderr_text += timeout_message(plan);
				result.success = false;
				return true;
			case ProtectedProcessResult::CANCELED:
				result.termination = Termination::CANCELED;
				result.success = false;
				return true;
			case ProtectedProcessResult::EXITED:
			case ProtectedProcessResult::SIGNALED:
				return false;
		}
		return false;
	};

	if (plan.compile.has_value()) {
		ProtectedProcessDetails compile = execute_step(plan.compile.value(), false, deadline);
		ProtectedProcessResult running_result = compile.running_result;
		absorb(result, std::move(compile));
		if (finish_interrupted(running_result)) {
			return result;
		}
		if (running_result != ProtectedProcessResult::EXITED || result.exit_code != 0) {
			// 编译失败属于用户代码的正常结果
			result.success = false;
			result.termination = Termination::COMPLETED;
			return result;
		}
	}

	std::chrono::milliseconds compile_duration = result.duration;
	ProtectedProcessDetails run = execute_step(plan.run, true, deadline);
	ProtectedProcessResult running_result = run.running_result;
	bool compile_truncated = result.truncated;
	result = ExecutionResult();
	result.duration = compile_duration;
	result.truncated = compile_truncated;
	absorb(result, std::move(run));
	if (finish_interrupted(running_result)) {
		return result;
	}
	result.termination = Termination::COMPLETED;
	result.success = running_result == ProtectedProcessResult::EXITED && result.exit_code == 0;
	return result;
}
