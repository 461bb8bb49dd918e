/*
 * RedisJobStore.hpp
 *
 *  Created on: 2026年10月16日
 */

#ifndef SRC_QUEUE_REDISJOBSTORE_HPP_
#define SRC_QUEUE_REDISJOBSTORE_HPP_

#include <atomic>
#include <memory>
#include <string>
#include <vector>

#include <kerbal/redis_v2/connection.hpp>
#include <kerbal/redis_v2/reply.hpp>
#include <kerbal/utility/noncopyable.hpp>

#include "JobStore.hpp"
#include "sync_nonsingle_instance_pool.hpp"

/**
 * @brief redis 服务端的地址, 由 redis://[:password@]host[:port][/db] 形式的 URL 解析得到
 */
struct RedisEndpoint
{
		std::string host = "127.0.0.1";
		int port = 6379;
		std::string password;
		int db = 0;

		/**
		 * @throws std::invalid_argument URL 格式错误
		 */
		static RedisEndpoint parse(const std::string & url);
};

/**
 * @brief 基于 redis 的 job 存储, 可以被多个进程中的 worker 与客户端共享
 *
 * 键的布局 (以队列名 exec 为例):
 * - exec:job:<id>     hash, job 记录
 * - exec:queue        list, 等待执行的 job id, 队尾入队, 队首出队
 * - exec:cancel:<id>  string, 运行中 job 的取消请求
 *
 * 创建与状态迁移都由 lua 脚本在服务端原子地完成。
 */
class RedisJobStore : public JobStore, kerbal::utility::noncopyable, kerbal::utility::nonassignable
{
	private:
		typedef sync_nonsingle_instance_pool<kerbal::redis_v2::connection> connection_pool;

		RedisEndpoint endpoint;
		std::string queue_name;
		std::chrono::seconds retention;
		std::chrono::milliseconds fetch_timeout;
		connection_pool pool;
		std::atomic<bool> closed;

		std::string job_key(const std::string & job_id) const;
		std::string queue_key() const;
		std::string cancel_key(const std::string & job_id) const;

		std::unique_ptr<kerbal::redis_v2::connection> connect() const;

		/**
		 * @brief 从连接池借出一个连接执行命令, 失效的连接会被丢弃并重建
		 * @throws std::runtime_error 连接失败或服务端返回错误
		 */
		kerbal::redis_v2::reply execute(const std::vector<std::string> & argv);

	public:
		/**
		 * @param pool_size 连接池容量。每个阻塞在 dequeue 上的 worker 占用一个连接
		 */
		RedisJobStore(const RedisEndpoint & endpoint, const std::string & queue_name, std::chrono::seconds retention, size_t pool_size);

		virtual void create(const Job & job) override;

		/**
		 * @brief 以 BLPOP 等待, 等待时间向上取整到秒
		 */
		virtual optional<std::string> dequeue(std::chrono::milliseconds wait) override;

		virtual bool remove_from_queue(const std::string & job_id) override;

		virtual void requeue(const std::string & job_id) override;

		virtual optional<Job> load(const std::string & job_id) override;

		virtual bool transition(const std::string & job_id, JobState from, const JobTransition & transition) override;

		virtual void request_cancel(const std::string & job_id) override;

		virtual bool cancel_requested(const std::string & job_id) override;

		virtual size_t queued_count() override;

		virtual void close() override;
};

#endif /* SRC_QUEUE_REDISJOBSTORE_HPP_ */
