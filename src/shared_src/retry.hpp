/*
 * retry.hpp
 *
 *  Created on: 2026年10月13日
 */

#ifndef SRC_SHARED_SRC_RETRY_HPP_
#define SRC_SHARED_SRC_RETRY_HPP_

#include <chrono>
#include <thread>
#include <utility>

/**
 * @brief 有限次数的重试策略。每次失败后等待 backoff, 之后 backoff 翻倍
 */
struct RetryPolicy
{
		int max_attempts = 5;
		std::chrono::milliseconds initial_backoff = std::chrono::milliseconds(50);

		RetryPolicy() = default;

		RetryPolicy(int max_attempts, std::chrono::milliseconds initial_backoff) :
				max_attempts(max_attempts), initial_backoff(initial_backoff)
		{
		}
};

/**
 * @brief 对一个幂等操作进行有限次重试
 * @param policy 重试策略
 * @param operation 返回 bool 的幂等操作, 返回 true 表示成功
 * @param on_failure 每次失败后被调用, 参数为已尝试的次数
 * @return 在重试预算内成功则返回 true, 预算耗尽返回 false
 * @note operation 抛出的异常不会被吞掉, 由调用者决定是否将其视作瞬时错误
 */
template <typename Operation, typename OnFailure>
bool retry_idempotent(const RetryPolicy & policy, Operation && operation, OnFailure && on_failure)
{
	std::chrono::milliseconds backoff = policy.initial_backoff;
	for (int attempt = 1; attempt <= policy.max_attempts; ++attempt) {
		if (operation()) {
			return true;
		}
		on_failure(attempt);
		if (attempt < policy.max_attempts) {
			std::this_thread::sleep_for(backoff);
			backoff *= 2;
		}
	}
	return false;
}

template <typename Operation>
bool retry_idempotent(const RetryPolicy & policy, Operation && operation)
{
	return retry_idempotent(policy, std::forward<Operation>(operation), [](int) {});
}

#endif /* SRC_SHARED_SRC_RETRY_HPP_ */
