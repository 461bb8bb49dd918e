/*
 * JobStore.hpp
 *
 *  Created on: 2026年10月16日
 */

#ifndef SRC_QUEUE_JOBSTORE_HPP_
#define SRC_QUEUE_JOBSTORE_HPP_

#include <chrono>
#include <string>

#include <kerbal/data_struct/optional/optional.hpp>

#include "Job.hpp"

/**
 * @brief job 记录与 FIFO 队列的存储。所有 worker 共享的唯一资源
 *
 * 状态迁移以 compare-and-set 的方式进行: 只有当前状态等于预期状态时才写入,
 * 以此保证一个 job 不会被启动两次, 也不会被结束两次。
 * 进入终态的记录在保留期结束后过期, 过期后视同不存在。
 */
class JobStore
{
	public:
		template <typename Type>
		using optional = kerbal::data_struct::optional<Type>;

		/**
		 * @brief 写入 job 记录并将其追加到队尾
		 */
		virtual void create(const Job & job) = 0;

		/**
		 * @brief 弹出队首的 job id, 队列为空时最多等待 wait
		 * @return 等待超时或存储已关闭时返回空
		 */
		virtual optional<std::string> dequeue(std::chrono::milliseconds wait) = 0;

		/**
		 * @brief 从队列中移除指定的 job id
		 * @return 该 id 确实在队列中时返回 true
		 */
		virtual bool remove_from_queue(const std::string & job_id) = 0;

		/**
		 * @brief 将已取出但未能开始的 job id 放回队首, 使其下一个被取出
		 */
		virtual void requeue(const std::string & job_id) = 0;

		/**
		 * @return job 不存在或已过期时返回空
		 */
		virtual optional<Job> load(const std::string & job_id) = 0;

		/**
		 * @brief 当且仅当 job 的当前状态为 from 时, 按 transition 更新记录。
		 * 迁移到终态时开始计算保留期
		 * @return 迁移成功返回 true
		 */
		virtual bool transition(const std::string & job_id, JobState from, const JobTransition & transition) = 0;

		/**
		 * @brief 记录一个针对运行中 job 的取消请求, 持有该 job 的 worker (可能在另一个进程) 会轮询它
		 */
		virtual void request_cancel(const std::string & job_id) = 0;

		virtual bool cancel_requested(const std::string & job_id) = 0;

		virtual size_t queued_count() = 0;

		/**
		 * @brief 唤醒所有阻塞在 dequeue 上的调用者, 之后的 dequeue 立即返回空
		 */
		virtual void close() = 0;

		virtual ~JobStore() noexcept = default;
};

#endif /* SRC_QUEUE_JOBSTORE_HPP_ */
