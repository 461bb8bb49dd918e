/*
 * JobQueue.cpp
 *
 *  Created on: 2026年10月17日
 */

#include "JobQueue.hpp"
#include "logger.hpp"
#include "runner_exceptions.hpp"

#include <unistd.h>

#include <boost/algorithm/string/trim.hpp>
#include <boost/format.hpp>

namespace
{
	const char internal_error_message[] = "Internal error while executing the job";

	/**
	 * @brief 按 policy 重试一次存储操作, 存储抛出的异常视为瞬时错误
	 * @throws std::runtime_error 重试预算耗尽, 携带最后一次的错误信息
	 */
	template <typename Operation>
	auto with_retry(const RetryPolicy & policy, const std::string & job_id, const char * what, Operation && operation)
		-> decltype(operation())
	{
		decltype(operation()) result {};
		std::string last_error;
		auto attempt_once = [&]() {
			try {
				result = operation();
				return true;
			} catch (const std::exception & e) {
				last_error = e.what();
				return false;
			}
		};
		auto on_failure = [&](int attempt) {
			LOG_WARNING(job_id, what, " failed, attempt: ", attempt, " error: ", last_error);
		};
		if (!retry_idempotent(policy, attempt_once, on_failure)) {
			throw std::runtime_error(std::string(what) + " failed after all retries: " + last_error);
		}
		return result;
	}

	/**
	 * @brief 一个辅助类, 离开作用域时执行给定的动作
	 */
	template <typename Callback>
	struct scope_exit
	{
			Callback callback;

			explicit scope_exit(Callback callback) :
					callback(std::move(callback))
			{
			}

			~scope_exit() noexcept
			{
				callback();
			}
	};

	std::string local_worker_prefix()
	{
		char host_name[256] = { 0 };
		if (gethostname(host_name, sizeof(host_name) - 1) != 0) {
			return (boost::format("pid%d") % getpid()).str();
		}
		return (boost::format("%s:%d") % host_name % getpid()).str();
	}

	template <typename Type>
	Type json_field(const nlohmann::json & j, const char * name)
	{
		try {
			return j.at(name).get<Type>();
		} catch (const nlohmann::json::exception & e) {
			throw ValidationException(std::string("Invalid field ") + name + ": " + e.what());
		}
	}

} /* namespace */

SubmitRequest SubmitRequest::from_json(const nlohmann::json & j)
{
	if (!j.is_object()) {
		throw ValidationException("Submission must be a json object");
	}
	SubmitRequest request;
	request.language = json_field<std::string>(j, "language");
	request.code = json_field<std::string>(j, "code");
	if (j.contains("stdin") && !j.at("stdin").is_null()) {
		request.stdin_data = optional<std::string>(json_field<std::string>(j, "stdin"));
	}
	if (j.contains("timeoutSeconds") && !j.at("timeoutSeconds").is_null()) {
		request.timeout_seconds = optional<int>(json_field<int>(j, "timeoutSeconds"));
	}
	if (j.contains("memoryLimitMb") && !j.at("memoryLimitMb").is_null()) {
		request.memory_limit_mb = optional<int>(json_field<int>(j, "memoryLimitMb"));
	}
	return request;
}

JobQueue::JobQueue(std::shared_ptr<const LanguageRegistry> registry, std::shared_ptr<JobStore> store,
				   std::shared_ptr<SandboxBackend> backend, std::shared_ptr<WorkspaceManager> workspaces,
				   const LimiterSettings & limiter_settings, const JobQueueSettings & settings) :
		registry(std::move(registry)), store(std::move(store)), backend(std::move(backend)), workspaces(std::move(workspaces)),
		limiter(limiter_settings), settings(settings), running(false), busy_workers(0)
{
	if (this->registry == nullptr || this->store == nullptr) {
		throw std::invalid_argument("language registry and job store are required");
	}
	if (settings.workers == 0) {
		throw std::invalid_argument("worker count must be positive");
	}
	if (settings.timeout_interpreted.count() <= 0 || settings.timeout_compiled.count() <= 0 || settings.memory_mb <= 0) {
		throw std::invalid_argument("default limits must be positive");
	}
	if (settings.timeout_interpreted > settings.max_timeout || settings.timeout_compiled > settings.max_timeout ||
		settings.memory_mb > settings.max_memory_mb) {
		throw std::invalid_argument("default limits exceed the maximum limits");
	}
	if (settings.store_retry.max_attempts <= 0 || settings.store_retry.initial_backoff.count() < 0) {
		throw std::invalid_argument("store retry policy is invalid");
	}
}

JobQueue::~JobQueue() noexcept
{
	this->stop();
}

ResourceLimits JobQueue::resolve_limits(const SubmitRequest & request, const LanguageSpec & spec) const
{
	ResourceLimits limits;
	if (request.timeout_seconds.has_value()) {
		const int timeout = request.timeout_seconds.value();
		if (timeout <= 0 || timeout > settings.max_timeout.count()) {
			throw ValidationException((boost::format("timeoutSeconds must be between 1 and %d") % settings.max_timeout.count()).str());
		}
		limits.timeout = std::chrono::seconds(timeout);
	} else {
		limits.timeout = spec.timeout_class == TimeoutClass::COMPILED ? settings.timeout_compiled : settings.timeout_interpreted;
	}

	if (request.memory_limit_mb.has_value()) {
		const int memory = request.memory_limit_mb.value();
		if (memory <= 0 || memory > settings.max_memory_mb) {
			throw ValidationException((boost::format("memoryLimitMb must be between 1 and %d") % settings.max_memory_mb).str());
		}
		limits.memory_mb = memory;
	} else {
		limits.memory_mb = settings.memory_mb;
	}
	return limits;
}

std::string JobQueue::submit(const SubmitRequest & request)
{
	if (boost::algorithm::trim_copy(request.code).empty()) {
		throw ValidationException("Code cannot be empty");
	}
	if (request.code.size() > settings.max_code_bytes) {
		throw ValidationException((boost::format("Code exceeds the maximum size of %d bytes") % settings.max_code_bytes).str());
	}
	const LanguageSpec & spec = registry->lookup(request.language);

	Job job;
	job.id = Job::generate_id();
	job.language = spec.id;
	job.code = request.code;
	if (request.stdin_data.has_value()) {
		job.stdin_data = request.stdin_data.value();
	}
	job.limits = this->resolve_limits(request, spec);
	job.state = JobState::QUEUED;
	job.enqueued_at = Job::clock::now();

	store->create(job);
	LOG_INFO(job.id, "Job submitted, language: ", job.language, " timeout: ", job.limits.timeout.count(),
			 " s, memory: ", job.limits.memory_mb, " MB");
	return job.id;
}

Job JobQueue::status(const std::string & job_id)
{
	JobStore::optional<Job> job = store->load(job_id);
	if (!job.has_value()) {
		throw JobNotFoundException(job_id);
	}
	return job.value();
}

ExecutionResult JobQueue::result(const std::string & job_id)
{
	Job job = this->status(job_id);
	switch (job.state) {
		case JobState::QUEUED:
		case JobState::STARTED:
			throw JobNotReadyException(job_id, job.state);
		case JobState::FINISHED:
			if (!job.result.has_value()) {
				throw std::runtime_error("finished job has no result: " + job_id);
			}
			return job.result.value();
		case JobState::FAILED:
			throw JobExecutionFailedException(job_id, job.error_category, job.error);
		case JobState::CANCELED:
			break;
	}
	// 已取消的 job 返回被终止前捕获的输出, 在执行前就被取消的 job 返回空结果
	if (job.result.has_value()) {
		return job.result.value();
	}
	ExecutionResult empty;
	empty.exit_code = -1;
	empty.success = false;
	empty.termination = Termination::CANCELED;
	return empty;
}

Job JobQueue::wait_for_terminal(const std::string & job_id, std::chrono::milliseconds max_wait)
{
	const auto deadline = std::chrono::steady_clock::now() + max_wait;
	Job job = this->status(job_id);
	while (!is_terminal(job.state) && std::chrono::steady_clock::now() < deadline) {
		std::this_thread::sleep_for(settings.poll_interval);
		job = this->status(job_id);
	}
	return job;
}

JobState JobQueue::cancel(const std::string & job_id)
{
	while (true) {
		Job job = this->status(job_id);
		switch (job.state) {
			case JobState::QUEUED: {
				if (store->transition(job_id, JobState::QUEUED, JobTransition(JobState::CANCELED))) {
					store->remove_from_queue(job_id);
					LOG_INFO(job_id, "Job canceled while queued");
					return JobState::CANCELED;
				}
				// 状态在读取之后被改变 (通常是被 worker 取走), 重新读取
				continue;
			}
			case JobState::STARTED: {
				store->request_cancel(job_id);
				{
					std::lock_guard<std::mutex> lck(cancel_tokens_mtx);
					auto it = cancel_tokens.find(job_id);
					if (it != cancel_tokens.end()) {
						*it->second = true;
					}
				}
				LOG_INFO(job_id, "Cancel requested for running job");
				return this->wait_for_terminal(job_id, settings.cancel_ack_wait).state;
			}
			case JobState::FINISHED:
			case JobState::FAILED:
			case JobState::CANCELED:
				return job.state;
		}
		return job.state;
	}
}

ExecutionResult JobQueue::execute(const SubmitRequest & request)
{
	const std::string job_id = this->submit(request);

	// 排队的时间不计入 job 自身的期限
	const auto queue_deadline = std::chrono::steady_clock::now() + settings.execute_queue_wait;
	Job job = this->status(job_id);
	while (job.state == JobState::QUEUED && std::chrono::steady_clock::now() < queue_deadline) {
		std::this_thread::sleep_for(settings.poll_interval);
		job = this->status(job_id);
	}
	if (job.state == JobState::QUEUED) {
		LOG_WARNING(job_id, "Gave up waiting for job to start, queued jobs: ", store->queued_count());
		throw JobNotReadyException(job_id, job.state);
	}

	if (!is_terminal(job.state)) {
		job = this->wait_for_terminal(job_id, job.limits.timeout + settings.execute_wait_margin);
		if (!is_terminal(job.state)) {
			LOG_WARNING(job_id, "Gave up waiting for job, state: ", job.state);
			throw JobNotReadyException(job_id, job.state);
		}
	}
	return this->result(job_id);
}

std::shared_ptr<std::atomic<bool>> JobQueue::register_cancel_token(const std::string & job_id)
{
	std::shared_ptr<std::atomic<bool>> token = std::make_shared<std::atomic<bool>>(false);
	std::lock_guard<std::mutex> lck(cancel_tokens_mtx);
	cancel_tokens[job_id] = token;
	return token;
}

void JobQueue::unregister_cancel_token(const std::string & job_id) noexcept
{
	std::lock_guard<std::mutex> lck(cancel_tokens_mtx);
	cancel_tokens.erase(job_id);
}

bool JobQueue::transition_with_retry(const std::string & job_id, JobState from, const JobTransition & transition)
{
	return with_retry(settings.store_retry, job_id, "Store transition", [&]() {
		if (store->transition(job_id, from, transition)) {
			return true;
		}
		JobStore::optional<Job> current = store->load(job_id);
		return current.has_value() && current.value().state == transition.to && current.value().worker == transition.worker;
	});
}

void JobQueue::requeue(const std::string & job_id) noexcept try
{
	with_retry(settings.store_retry, job_id, "Requeue job", [&]() {
		store->requeue(job_id);
		return true;
	});
	LOG_WARNING(job_id, "Job returned to the queue");
} catch (const std::exception & e) {
	EXCEPT_FATAL(job_id, "Requeue job failed, job is stranded in queued state.", e);
} catch (...) {
	UNKNOWN_EXCEPT_FATAL(job_id, "Requeue job failed, job is stranded in queued state.");
}

void JobQueue::finish(const std::string & job_id, const JobTransition & transition) noexcept try
{
	bool applied = false;
	try {
		applied = this->transition_with_retry(job_id, JobState::STARTED, transition);
	} catch (const std::exception & e) {
		EXCEPT_FATAL(job_id, "Store terminal state failed, record an internal error instead.", e, " state: ", transition.to);
		JobTransition fallback(JobState::FAILED);
		fallback.worker = transition.worker;
		fallback.at = transition.at;
		fallback.error_category = ErrorCategory::INTERNAL;
		fallback.error = internal_error_message;
		if (!this->transition_with_retry(job_id, JobState::STARTED, fallback)) {
			LOG_FATAL(job_id, "Store internal error failed, job is no longer started");
			return;
		}
		LOG_INFO(job_id, "Job ", fallback.to, ", category: ", fallback.error_category, " error: ", fallback.error);
		return;
	}
	if (!applied) {
		LOG_FATAL(job_id, "Store terminal state failed, job is no longer started. Expected state: ", transition.to);
		return;
	}
	if (transition.error_category != ErrorCategory::NONE) {
		LOG_INFO(job_id, "Job ", transition.to, ", category: ", transition.error_category, " error: ", transition.error);
	} else {
		LOG_INFO(job_id, "Job ", transition.to);
	}
} catch (const std::exception & e) {
	EXCEPT_FATAL(job_id, "Store terminal state failed.", e, " state: ", transition.to);
} catch (...) {
	UNKNOWN_EXCEPT_FATAL(job_id, "Store terminal state failed.", " state: ", transition.to);
}

void JobQueue::process(const std::string & job_id, const std::string & worker_name) noexcept try
{
	JobStore::optional<Job> loaded;
	try {
		loaded = with_retry(settings.store_retry, job_id, "Load job", [&]() {
			return store->load(job_id);
		});
	} catch (const std::exception & e) {
		EXCEPT_WARNING(job_id, "Load dequeued job failed.", e, " worker: ", worker_name);
		this->requeue(job_id);
		return;
	}
	if (!loaded.has_value()) {
		LOG_WARNING(job_id, "Dequeued job no longer exists");
		return;
	}
	const Job job = loaded.value();
	if (job.state != JobState::QUEUED) {
		LOG_INFO(job_id, "Skip dequeued job in state: ", job.state);
		return;
	}

	JobTransition started(JobState::STARTED);
	started.worker = worker_name;
	bool started_here = false;
	try {
		started_here = this->transition_with_retry(job_id, JobState::QUEUED, started);
	} catch (const std::exception & e) {
		EXCEPT_WARNING(job_id, "Start job failed.", e, " worker: ", worker_name);
		this->requeue(job_id);
		return;
	}
	if (!started_here) {
		LOG_INFO(job_id, "Job left queued state before it could be started");
		return;
	}
	LOG_INFO(job_id, "<<<<<<<<<<<<<<<<<<<<<<<<<<<<<<");
	LOG_INFO(job_id, worker_name, " started job, language: ", job.language);

	std::shared_ptr<std::atomic<bool>> token = this->register_cancel_token(job_id);
	auto unregister = [this, &job_id]() noexcept {
		this->unregister_cancel_token(job_id);
	};
	scope_exit<decltype(unregister)> token_guard(unregister);

	// 本地的取消标志随时生效, 存储中的取消请求按 cancel_check_interval 限频查询
	const std::chrono::milliseconds check_interval = settings.cancel_check_interval;
	std::shared_ptr<JobStore> shared_store = store;
	auto last_check = std::chrono::steady_clock::now() - check_interval;
	SandboxBackend::cancel_predicate cancel_requested = [token, shared_store, job_id, check_interval, last_check]() mutable {
		if (*token) {
			return true;
		}
		const auto now = std::chrono::steady_clock::now();
		if (now - last_check >= check_interval) {
			last_check = now;
			if (shared_store->cancel_requested(job_id)) {
				*token = true;
			}
		}
		return token->load();
	};

	JobTransition outcome(JobState::FINISHED);
	outcome.worker = worker_name;
	try {
		if (cancel_requested()) {
			outcome.to = JobState::CANCELED;
			LOG_INFO(job_id, "Job canceled before execution");
		} else {
			const LanguageSpec & spec = registry->lookup(job.language);
			Workspace workspace = workspaces->acquire(job_id, spec, job.code);
			LOG_INFO(job_id, "Workspace: ", workspace.path().string());

			const PathLayout layout = backend->layout_for(workspace, spec);
			const CommandPlan plan = synthesizer.build(spec, layout, job.limits);
			const BoundedCommandPlan bounded = limiter.apply(plan, spec, job.limits);

			ExecutionResult result = backend->execute(bounded, spec, workspace, job.stdin_data, cancel_requested);
			workspace.release();

			LOG_INFO(job_id, "Execution ", result.termination, ", exit code: ", result.exit_code, " duration: ",
					 result.duration.count(), " ms, truncated: ", result.truncated);
			switch (result.termination) {
				case Termination::COMPLETED:
					outcome.to = JobState::FINISHED;
					break;
				case Termination::TIMED_OUT:
					outcome.to = JobState::FAILED;
					outcome.error_category = ErrorCategory::TIMEOUT;
					outcome.error = (boost::format("Execution timed out (%d seconds limit)") % job.limits.timeout.count()).str();
					break;
				case Termination::CANCELED:
					outcome.to = JobState::CANCELED;
					break;
			}
			outcome.result = JobTransition::optional<ExecutionResult>(result);
		}
	} catch (const InfrastructureException & e) {
		EXCEPT_WARNING(job_id, "Execution environment is incomplete.", e);
		outcome.to = JobState::FAILED;
		outcome.error_category = ErrorCategory::INFRASTRUCTURE;
		outcome.error = e.what();
	} catch (const std::exception & e) {
		EXCEPT_FATAL(job_id, "Execute job failed.", e, " worker: ", worker_name);
		outcome.to = JobState::FAILED;
		outcome.error_category = ErrorCategory::INTERNAL;
		outcome.error = internal_error_message;
	} catch (...) {
		UNKNOWN_EXCEPT_FATAL(job_id, "Execute job failed.", " worker: ", worker_name);
		outcome.to = JobState::FAILED;
		outcome.error_category = ErrorCategory::INTERNAL;
		outcome.error = internal_error_message;
	}

	outcome.at = Job::clock::now();
	this->finish(job_id, outcome);
	LOG_INFO(job_id, ">>>>>>>>>>>>>>>>>>>>>>>>>>>>>>");
} catch (const std::exception & e) {
	EXCEPT_FATAL(job_id, "Process job failed.", e, " worker: ", worker_name);
} catch (...) {
	UNKNOWN_EXCEPT_FATAL(job_id, "Process job failed.", " worker: ", worker_name);
}

void JobQueue::worker_loop(const std::string & worker_name) noexcept
{
	LOG_INFO("", worker_name, " started");
	while (running) {
		JobStore::optional<std::string> job_id;
		try {
			job_id = store->dequeue(settings.dequeue_wait);
		} catch (const std::exception & e) {
			EXCEPT_WARNING("", "Fetch job failed.", e, " worker: ", worker_name);
			std::this_thread::sleep_for(settings.dequeue_wait);
			continue;
		} catch (...) {
			UNKNOWN_EXCEPT_WARNING("", "Fetch job failed.", " worker: ", worker_name);
			std::this_thread::sleep_for(settings.dequeue_wait);
			continue;
		}
		if (!job_id.has_value()) {
			continue;
		}
		LOG_INFO(job_id.value(), worker_name, " get job");
		++busy_workers;
		this->process(job_id.value(), worker_name);
		--busy_workers;
	}
	LOG_INFO("", worker_name, " exit");
}

void JobQueue::start()
{
	if (backend == nullptr || workspaces == nullptr) {
		throw std::logic_error("sandbox backend and workspace manager are required to run workers");
	}
	if (running.exchange(true)) {
		throw std::logic_error("job queue is already started");
	}
	const std::string prefix = local_worker_prefix();
	try {
		for (size_t i = 0; i < settings.workers; ++i) {
			const std::string worker_name = (boost::format("%s:worker-%d") % prefix % i).str();
			workers.emplace_back(&JobQueue::worker_loop, this, worker_name);
		}
	} catch (...) {
		this->stop();
		throw;
	}
	LOG_INFO("", "Job queue started, backend: ", backend->name(), " workers: ", settings.workers);
}

void JobQueue::stop() noexcept
{
	running = false;
	for (std::thread & worker : workers) {
		if (worker.joinable()) {
			worker.join();
		}
	}
	workers.clear();
}
