/*
 * runner_exceptions.hpp
 *
 *  Created on: 2026年10月13日
 */

#ifndef SRC_SHARED_SRC_RUNNER_EXCEPTIONS_HPP_
#define SRC_SHARED_SRC_RUNNER_EXCEPTIONS_HPP_

#include <stdexcept>
#include <string>

#include "united_resource.hpp"

/**
 * @brief 提交参数不合法 (代码为空, 代码过长, 资源限制越界等)。在提交时同步抛出, job 不会被创建
 */
class ValidationException : public std::runtime_error
{
	public:
		using std::runtime_error::runtime_error;
};

class UnsupportedLanguageException : public ValidationException
{
	public:
		const std::string language;

		explicit UnsupportedLanguageException(const std::string & language) :
				ValidationException("Unsupported language: " + language), language(language)
		{
		}
};

/**
 * @brief 执行环境缺少所需的解释器或编译器, 消息中包含缺失工具的名字。不会自动重试
 */
class InfrastructureException : public std::runtime_error
{
	public:
		using std::runtime_error::runtime_error;
};

class JobNotFoundException : public std::runtime_error
{
	public:
		const std::string job_id;

		explicit JobNotFoundException(const std::string & job_id) :
				std::runtime_error("Job not found: " + job_id), job_id(job_id)
		{
		}
};

class JobNotReadyException : public std::runtime_error
{
	public:
		const std::string job_id;
		const JobState state;

		JobNotReadyException(const std::string & job_id, JobState state) :
				std::runtime_error("Job " + job_id + " is not ready, current state: " + getJobStateName(state)),
				job_id(job_id), state(state)
		{
		}
};

/**
 * @brief 读取一个 failed 状态的 job 的结果时抛出, 携带错误类别与 (已脱敏的) 错误信息
 */
class JobExecutionFailedException : public std::runtime_error
{
	public:
		const std::string job_id;
		const ErrorCategory category;

		JobExecutionFailedException(const std::string & job_id, ErrorCategory category, const std::string & message) :
				std::runtime_error(message), job_id(job_id), category(category)
		{
		}
};

/**
 * @brief 子进程在 execve 之前的准备阶段失败 (dup2, setrlimit, seccomp, chdir 等)
 */
class ChildSetupException : public std::runtime_error
{
	public:
		const std::string stage;
		const int err;

		ChildSetupException(const std::string & stage, int err) :
				std::runtime_error("child setup failed at " + stage + ", errno: " + std::to_string(err)), stage(stage), err(err)
		{
		}
};

#endif /* SRC_SHARED_SRC_RUNNER_EXCEPTIONS_HPP_ */
