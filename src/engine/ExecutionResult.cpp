/*
 * ExecutionResult.cpp
 *
 *  Created on: 2026年10月14日
 */

#include "ExecutionResult.hpp"

nlohmann::json ExecutionResult::to_json() const
{
	return nlohmann::json {
		{ "stdout", stdout_text },
		{ "stderr", stderr_text },
		{ "exitCode", exit_code },
		{ "durationMs", duration.count() },
		{ "truncated", truncated },
		{ "success", success },
		{ "termination", getTerminationName(termination) },
	};
}

ExecutionResult ExecutionResult::from_json(const nlohmann::json & j)
{
	ExecutionResult result;
	result.stdout_text = j.at("stdout").get<std::string>();
	result.stderr_text = j.at("stderr").get<std::string>();
	result.exit_code = j.at("exitCode").get<int>();
	result.duration = std::chrono::milliseconds(j.at("durationMs").get<long long>());
	result.truncated = j.at("truncated").get<bool>();
	result.success = j.at("success").get<bool>();
	result.termination = parseTermination(j.value("termination", std::string("completed")));
	return result;
}
