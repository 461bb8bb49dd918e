/*
 * MemoryJobStore.hpp
 *
 *  Created on: 2026年10月16日
 */

#ifndef SRC_QUEUE_MEMORYJOBSTORE_HPP_
#define SRC_QUEUE_MEMORYJOBSTORE_HPP_

#include <condition_variable>
#include <deque>
#include <mutex>
#include <unordered_map>

#include <kerbal/utility/noncopyable.hpp>

#include "JobStore.hpp"

/**
 * @brief 进程内的 job 存储, 只能被同一进程中的 worker 使用
 */
class MemoryJobStore : public JobStore, kerbal::utility::noncopyable, kerbal::utility::nonassignable
{
	private:
		typedef std::chrono::steady_clock clock;

		struct Entry
		{
				Job job;
				bool cancel_requested = false;
				optional<clock::time_point> expires_at;
		};

		std::chrono::seconds retention;
		std::mutex mtx;
		std::condition_variable queue_cond;
		std::deque<std::string> queue;
		std::unordered_map<std::string, Entry> jobs;
		bool closed = false;

		/**
		 * @brief 删除已过期的记录, 调用者需持有 mtx
		 */
		void purge_expired_locked(clock::time_point now);

	public:
		explicit MemoryJobStore(std::chrono::seconds retention);

		virtual void create(const Job & job) override;

		virtual optional<std::string> dequeue(std::chrono::milliseconds wait) override;

		virtual bool remove_from_queue(const std::string & job_id) override;

		virtual void requeue(const std::string & job_id) override;

		virtual optional<Job> load(const std::string & job_id) override;

		virtual bool transition(const std::string & job_id, JobState from, const JobTransition & transition) override;

		virtual void request_cancel(const std::string & job_id) override;

		virtual bool cancel_requested(const std::string & job_id) override;

		virtual size_t queued_count() override;

		virtual void close() override;

		/**
		 * @return 未过期的记录个数
		 */
		size_t size();
};

#endif /* SRC_QUEUE_MEMORYJOBSTORE_HPP_ */
