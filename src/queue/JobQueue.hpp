/*
 * JobQueue.hpp
 *
 *  Created on: 2026年10月17日
 */

#ifndef SRC_QUEUE_JOBQUEUE_HPP_
#define SRC_QUEUE_JOBQUEUE_HPP_

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <kerbal/data_struct/optional/optional.hpp>
#include <kerbal/utility/noncopyable.hpp>
#include <nlohmann/json.hpp>

#include "CommandSynthesizer.hpp"
#include "JobStore.hpp"
#include "LanguageRegistry.hpp"
#include "ResourceLimiter.hpp"
#include "SandboxBackend.hpp"
#include "Workspace.hpp"
#include "retry.hpp"

struct JobQueueSettings
{
		size_t workers = 2;

		std::chrono::seconds timeout_interpreted = std::chrono::seconds(8); ///< 解释型语言的默认超时
		std::chrono::seconds timeout_compiled = std::chrono::seconds(20); ///< 编译型语言的默认超时 (含编译)
		int memory_mb = 256;

		std::chrono::seconds max_timeout = std::chrono::seconds(60);
		int max_memory_mb = 1024;
		size_t max_code_bytes = 64 * 1024;

		std::chrono::milliseconds dequeue_wait = std::chrono::milliseconds(1000); ///< worker 每次等待队列的时长, 也是响应 stop 的粒度
		std::chrono::milliseconds poll_interval = std::chrono::milliseconds(50); ///< execute 与 cancel 轮询状态的间隔
		std::chrono::milliseconds cancel_check_interval = std::chrono::milliseconds(250); ///< worker 查询存储中取消请求的最小间隔
		std::chrono::milliseconds cancel_ack_wait = std::chrono::milliseconds(3000); ///< cancel 等待运行中的 job 结束的上限
		std::chrono::seconds execute_wait_margin = std::chrono::seconds(30); ///< execute 在 job 超时之外额外等待的时长
		std::chrono::seconds execute_queue_wait = std::chrono::seconds(300); ///< execute 等待 job 被 worker 取走的上限, 不占用 job 的执行时长

		RetryPolicy store_retry; ///< worker 写入状态迁移, 读取与放回 job 时的重试策略
};

/**
 * @brief 一次提交的参数, 对应 {language, code, stdin?, timeoutSeconds?, memoryLimitMb?}
 */
struct SubmitRequest
{
		template <typename Type>
		using optional = kerbal::data_struct::optional<Type>;

		std::string language;
		std::string code;
		optional<std::string> stdin_data;
		optional<int> timeout_seconds;
		optional<int> memory_limit_mb;

		/**
		 * @throws ValidationException 缺少字段或字段类型错误
		 */
		static SubmitRequest from_json(const nlohmann::json & j);
};

/**
 * @brief 任务队列与 worker 池
 *
 * 提交立即返回 job id; 固定数目的 worker 线程按 FIFO 顺序取出 job,
 * 每个 worker 依次完成 获取工作区 -> 合成命令 -> 施加限制 -> 由后端执行 -> 释放工作区 -> 保存结果,
 * 之后才取下一个 job。
 *
 * 只用于提交与查询的客户端可以不提供后端与工作区管理器, 此时不能 start。
 */
class JobQueue : kerbal::utility::noncopyable, kerbal::utility::nonassignable
{
	private:
		std::shared_ptr<const LanguageRegistry> registry;
		std::shared_ptr<JobStore> store;
		std::shared_ptr<SandboxBackend> backend;
		std::shared_ptr<WorkspaceManager> workspaces;
		CommandSynthesizer synthesizer;
		ResourceLimiter limiter;
		JobQueueSettings settings;

		std::vector<std::thread> workers;
		std::atomic<bool> running;
		std::atomic<size_t> busy_workers;

		std::mutex cancel_tokens_mtx;
		std::map<std::string, std::shared_ptr<std::atomic<bool>>> cancel_tokens; ///< 本进程中正在运行的 job 的取消标志

		ResourceLimits resolve_limits(const SubmitRequest & request, const LanguageSpec & spec) const;

		void worker_loop(const std::string & worker_name) noexcept;

		/**
		 * @brief 完整地处理一个 job, 所有异常都转换为 failed 终态, 不向外抛出
		 */
		void process(const std::string & job_id, const std::string & worker_name) noexcept;

		std::shared_ptr<std::atomic<bool>> register_cancel_token(const std::string & job_id);

		void unregister_cancel_token(const std::string & job_id) noexcept;

		/**
		 * @brief 按 store_retry 重试一次状态迁移
		 *
		 * 迁移可能已在存储中生效而应答丢失, 此时重试会因状态不符而返回 false。
		 * 因此比较失败后重新读取 job, 若它已处于目标状态且属于同一个 worker, 视为迁移成功
		 * @return 迁移生效返回 true, job 已被其他参与者改变返回 false
		 * @throws std::runtime_error 重试预算耗尽
		 */
		bool transition_with_retry(const std::string & job_id, JobState from, const JobTransition & transition);

		/**
		 * @brief 把未能开始的 job 放回队首
		 */
		void requeue(const std::string & job_id) noexcept;

		/**
		 * @brief 写入终态。重试耗尽时再尝试一次写入 failed/internal, 避免 job 永远停留在 started
		 */
		void finish(const std::string & job_id, const JobTransition & transition) noexcept;

		/**
		 * @brief 轮询 job 状态, 直到进入终态或超过 max_wait
		 * @return 最后一次观察到的 job
		 */
		Job wait_for_terminal(const std::string & job_id, std::chrono::milliseconds max_wait);

	public:
		JobQueue(std::shared_ptr<const LanguageRegistry> registry, std::shared_ptr<JobStore> store,
				 std::shared_ptr<SandboxBackend> backend, std::shared_ptr<WorkspaceManager> workspaces,
				 const LimiterSettings & limiter_settings, const JobQueueSettings & settings);

		~JobQueue() noexcept;

		/**
		 * @brief 校验并创建一个 queued 状态的 job, 不等待执行
		 * @throws ValidationException 代码为空或过长, 资源限制越界
		 * @throws UnsupportedLanguageException 不支持的语言
		 */
		std::string submit(const SubmitRequest & request);

		/**
		 * @throws JobNotFoundException id 不存在或已过期
		 */
		Job status(const std::string & job_id);

		/**
		 * @throws JobNotFoundException id 不存在或已过期
		 * @throws JobNotReadyException job 尚未结束
		 * @throws JobExecutionFailedException job 处于 failed 状态, 携带错误类别与信息
		 */
		ExecutionResult result(const std::string & job_id);

		/**
		 * @brief 取消一个 job。queued 的 job 被移出队列并直接进入 canceled, 不会被执行;
		 * started 的 job 由持有它的 worker 终止进程树, 本函数最多等待 cancel_ack_wait;
		 * 已结束的 job 保持原状态
		 * @return 取消后观察到的状态。job 抢先自然结束时返回该终态
		 * @throws JobNotFoundException
		 */
		JobState cancel(const std::string & job_id);

		/**
		 * @brief 一次性执行: submit, 轮询至终态, 再取 result
		 *
		 * 排队时间单独计算, 最多 execute_queue_wait; job 开始后再等待 timeout + execute_wait_margin
		 * @throws JobNotReadyException 等待期限内 job 未结束, 携带最后观察到的状态
		 */
		ExecutionResult execute(const SubmitRequest & request);

		/**
		 * @brief 启动 worker 线程
		 * @throws std::logic_error 未提供后端或工作区管理器, 或已经启动
		 */
		void start();

		/**
		 * @brief 停止取新 job, 等待正在处理的 job 完成后返回
		 */
		void stop() noexcept;

		size_t busy_worker_count() const noexcept
		{
			return busy_workers;
		}

		const JobQueueSettings & get_settings() const noexcept
		{
			return settings;
		}
};

#endif /* SRC_QUEUE_JOBQUEUE_HPP_ */
