/*
 * united_resource.hpp
 *
 *  Created on: 2026年10月12日
 */

#ifndef SRC_SHARED_SRC_UNITED_RESOURCE_HPP_
#define SRC_SHARED_SRC_UNITED_RESOURCE_HPP_

#include <iostream>
#include <stdexcept>
#include <string>

/**
 * @brief 枚举类，标识 job 的生命周期状态
 * @note 状态只会单调前进: QUEUED -> STARTED -> {FINISHED | FAILED | CANCELED},
 *       QUEUED 也可以直接进入 CANCELED
 */
enum class JobState
{
	QUEUED = 0, STARTED = 1, FINISHED = 2, FAILED = 3, CANCELED = 4
};

/*
 * 对于枚举中未定义的量不在 switch 的 default 分支处理, 而在函数末尾处理,
 * 这样新增枚举值而忘了加上描述时编译器会给出警告
 */
inline const char * getJobStateName(JobState state)
{
	switch (state) {
		case JobState::QUEUED:
			return "queued";
		case JobState::STARTED:
			return "started";
		case JobState::FINISHED:
			return "finished";
		case JobState::FAILED:
			return "failed";
		case JobState::CANCELED:
			return "canceled";
	}
	return "unknown";
}

inline JobState parseJobState(const std::string & name)
{
	for (JobState state : { JobState::QUEUED, JobState::STARTED, JobState::FINISHED, JobState::FAILED, JobState::CANCELED }) {
		if (name == getJobStateName(state)) {
			return state;
		}
	}
	throw std::invalid_argument("Undefined job state: " + name);
}

inline bool is_terminal(JobState state) noexcept
{
	return state == JobState::FINISHED || state == JobState::FAILED || state == JobState::CANCELED;
}

inline std::ostream& operator<<(std::ostream & out, JobState state)
{
	return out << getJobStateName(state);
}

/**
 * @brief 枚举类，标识失败 job 的错误类别
 */
enum class ErrorCategory
{
	NONE = 0,
	INFRASTRUCTURE = 1, ///< 执行环境缺少解释器/编译器等工具
	TIMEOUT = 2, ///< 墙上时间超时
	INTERNAL = 3, ///< 引擎内部错误
};

inline const char * getErrorCategoryName(ErrorCategory category)
{
	switch (category) {
		case ErrorCategory::NONE:
			return "none";
		case ErrorCategory::INFRASTRUCTURE:
			return "infrastructure";
		case ErrorCategory::TIMEOUT:
			return "timeout";
		case ErrorCategory::INTERNAL:
			return "internal";
	}
	return "unknown";
}

inline ErrorCategory parseErrorCategory(const std::string & name)
{
	for (ErrorCategory category : { ErrorCategory::NONE, ErrorCategory::INFRASTRUCTURE, ErrorCategory::TIMEOUT, ErrorCategory::INTERNAL }) {
		if (name == getErrorCategoryName(category)) {
			return category;
		}
	}
	throw std::invalid_argument("Undefined error category: " + name);
}

inline std::ostream& operator<<(std::ostream & out, ErrorCategory category)
{
	return out << getErrorCategoryName(category);
}

/**
 * @brief 枚举类，标识用户所用的语言
 */
enum class Language
{
	PYTHON = 0, JAVASCRIPT = 1, R = 2, BASH = 3, JULIA = 4, C = 5, CPP = 6, JAVA = 7, GO = 8
};

/**
 * @brief 默认超时时间的分类。解释型语言与需要编译的语言使用不同的默认值
 */
enum class TimeoutClass
{
	INTERPRETED = 0, COMPILED = 1
};

inline const char * getTimeoutClassName(TimeoutClass timeout_class)
{
	switch (timeout_class) {
		case TimeoutClass::INTERPRETED:
			return "interpreted";
		case TimeoutClass::COMPILED:
			return "compiled";
	}
	return "unknown";
}

/**
 * @brief 一次执行的结束方式
 */
enum class Termination
{
	COMPLETED = 0, ///< 程序自行结束 (包括非零退出与编译失败)
	TIMED_OUT = 1, ///< 被墙上时间看门狗终止
	CANCELED = 2, ///< 被取消请求终止
};

inline const char * getTerminationName(Termination termination)
{
	switch (termination) {
		case Termination::COMPLETED:
			return "completed";
		case Termination::TIMED_OUT:
			return "timed_out";
		case Termination::CANCELED:
			return "canceled";
	}
	return "unknown";
}

inline Termination parseTermination(const std::string & name)
{
	for (Termination termination : { Termination::COMPLETED, Termination::TIMED_OUT, Termination::CANCELED }) {
		if (name == getTerminationName(termination)) {
			return termination;
		}
	}
	throw std::invalid_argument("Undefined termination: " + name);
}

inline std::ostream& operator<<(std::ostream & out, Termination termination)
{
	return out << getTerminationName(termination);
}

#endif /* SRC_SHARED_SRC_UNITED_RESOURCE_HPP_ */
