/*
 * ExecutionResult.hpp
 *
 *  Created on: 2026年10月14日
 */

#ifndef SRC_ENGINE_EXECUTIONRESULT_HPP_
#define SRC_ENGINE_EXECUTIONRESULT_HPP_

#include <chrono>
#include <string>

#include <nlohmann/json.hpp>

#include "united_resource.hpp"

/**
 * @brief 一次执行的产出。生成后不再修改, 归属于对应的 job
 */
struct ExecutionResult
{
		std::string stdout_text;
		std::string stderr_text;
		int exit_code = 0;
		std::chrono::milliseconds duration { 0 }; ///< 墙上时间, 编译与运行之和
		bool truncated = false; ///< 输出超过上限被截断
		bool success = false; ///< 程序正常结束且退出码为 0; 编译失败与非零退出是 false, 但不是系统错误
		Termination termination = Termination::COMPLETED;

		nlohmann::json to_json() const;

		static ExecutionResult from_json(const nlohmann::json & j);
};

#endif /* SRC_ENGINE_EXECUTIONRESULT_HPP_ */
