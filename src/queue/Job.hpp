/*
 * Job.hpp
 *
 *  Created on: 2026年10月16日
 */

#ifndef SRC_QUEUE_JOB_HPP_
#define SRC_QUEUE_JOB_HPP_

#include <chrono>
#include <map>
#include <string>

#include <kerbal/data_struct/optional/optional.hpp>
#include <nlohmann/json.hpp>

#include "CommandPlan.hpp"
#include "ExecutionResult.hpp"
#include "united_resource.hpp"

/**
 * @brief 一次执行请求的完整记录。
 * 创建后只由持有它的 worker 修改 (或被取消请求修改), 终态后保留一段时间然后过期
 */
struct Job
{
		template <typename Type>
		using optional = kerbal::data_struct::optional<Type>;

		typedef std::chrono::system_clock clock;

		std::string id;
		std::string language; ///< 规范化后的语言标识
		std::string code;
		std::string stdin_data;
		ResourceLimits limits;

		JobState state = JobState::QUEUED;
		clock::time_point enqueued_at;
		optional<clock::time_point> started_at;
		optional<clock::time_point> ended_at;

		optional<ExecutionResult> result; ///< 未结束, 或在执行前失败时为空
		ErrorCategory error_category = ErrorCategory::NONE;
		std::string error; ///< 面向调用者的错误信息, 已脱敏

		std::string worker; ///< 处理该 job 的 worker, 仅用于诊断

		/**
		 * @brief 状态查询的输出: state 与各时间戳, 以及语言, worker, 错误类别等诊断信息
		 */
		nlohmann::json status_json() const;

		/**
		 * @brief 转换为存储用的字段表, 时间戳以 epoch 毫秒存储, 结果以 json 存储
		 */
		std::map<std::string, std::string> to_fields() const;

		/**
		 * @throws std::invalid_argument 缺少必要字段或字段格式错误
		 */
		static Job from_fields(const std::map<std::string, std::string> & fields);

		/**
		 * @return 随机生成的 job id (UUID 字符串)
		 */
		static std::string generate_id();
};

/**
 * @brief 状态迁移时写入的内容
 */
struct JobTransition
{
		template <typename Type>
		using optional = kerbal::data_struct::optional<Type>;

		JobState to;
		Job::clock::time_point at = Job::clock::now();
		optional<ExecutionResult> result;
		ErrorCategory error_category = ErrorCategory::NONE;
		std::string error;
		std::string worker;

		explicit JobTransition(JobState to) :
				to(to)
		{
		}
};

/**
 * @brief 将 job 的状态按迁移内容更新, 不检查迁移是否合法
 */
void apply_transition(Job & job, const JobTransition & transition);

/**
 * @return ISO 8601 格式的 UTC 时间, 精确到毫秒, 如 2026-10-16T08:00:00.123Z
 */
std::string format_timestamp(Job::clock::time_point time);

long long to_epoch_ms(Job::clock::time_point time);

Job::clock::time_point from_epoch_ms(long long ms);

#endif /* SRC_QUEUE_JOB_HPP_ */
