/*
 * JobQueueTest.cpp
 *
 *  Created on: 2026年10月18日
 */

#define BOOST_TEST_MODULE JobQueueTest
#include <boost/test/unit_test.hpp>

#include <algorithm>
#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

#include <boost/algorithm/string/predicate.hpp>
#include <kerbal/compatibility/chrono_suffix.hpp>

#include "HostBackend.hpp"
#include "JobQueue.hpp"
#include "MemoryJobStore.hpp"
#include "logger.hpp"
#include "runner_exceptions.hpp"

using namespace kerbal::compatibility::chrono_suffix;

namespace fs = boost::filesystem;

namespace
{
	/**
	 * @brief 不启动任何进程的后端。可以让 job 阻塞在执行中, 以观察并发度, 顺序与取消
	 */
	class ScriptedBackend : public SandboxBackend
	{
		public:
			typedef std::function<ExecutionResult(const Workspace &)> outcome_type;

		private:
			std::mutex mtx;
			std::condition_variable cond;
			bool blocking = false;
			size_t running = 0;
			size_t max_running = 0;
			std::vector<std::string> order;
			outcome_type outcome;

		public:
			ScriptedBackend() :
					outcome(&ScriptedBackend::succeed)
			{
			}

			static ExecutionResult succeed(const Workspace & workspace)
			{
				ExecutionResult result;
				result.stdout_text = "done " + workspace.get_job_id() + "\n";
				result.exit_code = 0;
				result.success = true;
				result.duration = std::chrono::milliseconds(5);
				return result;
			}

			void set_outcome(outcome_type outcome)
			{
				std::lock_guard<std::mutex> lck(mtx);
				this->outcome = std::move(outcome);
			}

			void block()
			{
				std::lock_guard<std::mutex> lck(mtx);
				blocking = true;
			}

			void release()
			{
				{
					std::lock_guard<std::mutex> lck(mtx);
					blocking = false;
				}
				cond.notify_all();
			}

			bool wait_running(size_t n, std::chrono::milliseconds timeout)
			{
				std::unique_lock<std::mutex> lck(mtx);
				return cond.wait_for(lck, timeout, [this, n]() {
					return running >= n;
				});
			}

			size_t max_concurrency()
			{
				std::lock_guard<std::mutex> lck(mtx);
				return max_running;
			}

			std::vector<std::string> execution_order()
			{
				std::lock_guard<std::mutex> lck(mtx);
				return order;
			}

			virtual const char * name() const noexcept override
			{
				return "scripted";
			}

			virtual PathLayout layout_for(const Workspace & workspace, const LanguageSpec & spec) const override
			{
				PathLayout layout;
				layout.workdir = workspace.path().string();
				layout.source = workspace.source_file().string();
				layout.builddir = workspace.build_dir().string();
				layout.tmpdir = workspace.tmp_dir().string();
				return layout;
			}

			virtual ExecutionResult execute(const BoundedCommandPlan & plan, const LanguageSpec & spec, const Workspace & workspace,
											const std::string & stdin_data, const cancel_predicate & cancel_requested) override
			{
				outcome_type current;
				{
					std::unique_lock<std::mutex> lck(mtx);
					order.push_back(workspace.get_job_id());
					++running;
					max_running = std::max(max_running, running);
					cond.notify_all();

					const auto give_up = std::chrono::steady_clock::now() + std::chrono::seconds(10);
					while (blocking && std::chrono::steady_clock::now() < give_up) {
						if (cancel_requested && cancel_requested()) {
							--running;
							ExecutionResult canceled;
							canceled.stdout_text = "partial\n";
							canceled.exit_code = 128 + 15;
							canceled.termination = Termination::CANCELED;
							return canceled;
						}
						cond.wait_for(lck, 20_ms);
					}
					--running;
					current = outcome;
				}
				return current(workspace);
			}
	};

	/**
	 * @brief 包装 MemoryJobStore, 可以让指定目标状态的迁移抛出异常, 模拟存储连接中断
	 */
	class FlakyStore : public JobStore
	{
		private:
			std::shared_ptr<MemoryJobStore> inner;

			std::mutex mtx;
			std::map<JobState, int> pending_failures;
			std::set<JobState> broken_targets;
			bool write_before_failure = false;
			size_t requeued = 0;

		public:
			explicit FlakyStore(std::shared_ptr<MemoryJobStore> inner) :
					inner(std::move(inner))
			{
			}

			/**
			 * @brief 接下来 times 次迁移到 to 的请求失败。after_write 为 true 时先写入再失败, 即应答丢失
			 */
			void fail_transitions_to(JobState to, int times, bool after_write = false)
			{
				std::lock_guard<std::mutex> lck(mtx);
				pending_failures[to] = times;
				write_before_failure = after_write;
			}

			void break_transitions_to(JobState to)
			{
				std::lock_guard<std::mutex> lck(mtx);
				broken_targets.insert(to);
			}

			void heal()
			{
				std::lock_guard<std::mutex> lck(mtx);
				pending_failures.clear();
				broken_targets.clear();
			}

			size_t requeue_count()
			{
				std::lock_guard<std::mutex> lck(mtx);
				return requeued;
			}

			virtual void create(const Job & job) override
			{
				inner->create(job);
			}

			virtual optional<std::string> dequeue(std::chrono::milliseconds wait) override
			{
				return inner->dequeue(wait);
			}

			virtual bool remove_from_queue(const std::string & job_id) override
			{
				return inner->remove_from_queue(job_id);
			}

			virtual void requeue(const std::string & job_id) override
			{
				inner->requeue(job_id);
				std::lock_guard<std::mutex> lck(mtx);
				++requeued;
			}

			virtual optional<Job> load(const std::string & job_id) override
			{
				return inner->load(job_id);
			}

			virtual bool transition(const std::string & job_id, JobState from, const JobTransition & transition) override
			{
				bool fail = false;
				bool write_first = false;
				{
					std::lock_guard<std::mutex> lck(mtx);
					if (broken_targets.count(transition.to) != 0) {
						fail = true;
					} else {
						auto it = pending_failures.find(transition.to);
						if (it != pending_failures.end() && it->second > 0) {
							--it->second;
							fail = true;
							write_first = write_before_failure;
						}
					}
				}
				if (!fail) {
					return inner->transition(job_id, from, transition);
				}
				if (write_first) {
					inner->transition(job_id, from, transition);
				}
				throw std::runtime_error("connection reset by peer");
			}

			virtual void request_cancel(const std::string & job_id) override
			{
				inner->request_cancel(job_id);
			}

			virtual bool cancel_requested(const std::string & job_id) override
			{
				return inner->cancel_requested(job_id);
			}

			virtual size_t queued_count() override
			{
				return inner->queued_count();
			}

			virtual void close() override
			{
				inner->close();
			}
	};

	struct QueueFixture
	{
			fs::path root;
			std::shared_ptr<const LanguageRegistry> registry;
			std::shared_ptr<MemoryJobStore> store;
			std::shared_ptr<FlakyStore> flaky;
			std::shared_ptr<JobStore> job_store; ///< 交给 JobQueue 的存储, 默认即 store
			std::shared_ptr<ScriptedBackend> backend;
			std::shared_ptr<WorkspaceManager> workspaces;
			JobQueueSettings settings;

			QueueFixture() :
					root(fs::temp_directory_path() / fs::unique_path("ts_runner_queue_test_%%%%%%%%")),
					registry(std::shared_ptr<const LanguageRegistry>(std::make_shared<LanguageRegistry>(LanguageRegistry::builtin()))),
					store(std::make_shared<MemoryJobStore>(std::chrono::seconds(60))),
					flaky(std::make_shared<FlakyStore>(store)),
					job_store(store),
					backend(std::make_shared<ScriptedBackend>())
			{
				ts_runner::log::set_console_echo(false);
				WorkspaceSettings ws_settings;
				ws_settings.root = root;
				workspaces = std::make_shared<WorkspaceManager>(ws_settings);

				settings.workers = 2;
				settings.dequeue_wait = 50_ms;
				settings.poll_interval = 10_ms;
				settings.cancel_check_interval = 20_ms;
				settings.cancel_ack_wait = 3000_ms;
				settings.store_retry = RetryPolicy(3, 10_ms);
			}

			~QueueFixture()
			{
				backend->release();
				boost::system::error_code ec;
				fs::remove_all(root, ec);
			}

			std::unique_ptr<JobQueue> make_queue(std::shared_ptr<SandboxBackend> sandbox = nullptr)
			{
				if (sandbox == nullptr) {
					sandbox = backend;
				}
				return std::unique_ptr<JobQueue>(new JobQueue(registry, job_store, sandbox, workspaces, LimiterSettings(), settings));
			}

			static SubmitRequest request(const std::string & language, const std::string & code)
			{
				SubmitRequest req;
				req.language = language;
				req.code = code;
				return req;
			}

			static JobState wait_terminal(JobQueue & queue, const std::string & job_id)
			{
				const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(15);
				JobState state = queue.status(job_id).state;
				while (!is_terminal(state) && std::chrono::steady_clock::now() < deadline) {
					std::this_thread::sleep_for(10_ms);
					state = queue.status(job_id).state;
				}
				return state;
			}
	};

} /* namespace */

BOOST_FIXTURE_TEST_SUITE(job_queue, QueueFixture)

BOOST_AUTO_TEST_CASE(invalid_submissions_are_rejected_synchronously)
{
	std::unique_ptr<JobQueue> queue = make_queue();

	try {
		queue->submit(request("python", "  \n\t"));
		BOOST_FAIL("empty code should be rejected");
	} catch (const ValidationException & e) {
		BOOST_CHECK_EQUAL(std::string(e.what()), "Code cannot be empty");
	}
	BOOST_CHECK_THROW(queue->submit(request("cobol", "DISPLAY 'HI'.")), UnsupportedLanguageException);
	BOOST_CHECK_THROW(queue->submit(request("python", std::string(settings.max_code_bytes + 1, 'x'))), ValidationException);

	SubmitRequest too_long = request("python", "print(1)");
	too_long.timeout_seconds = SubmitRequest::optional<int>(static_cast<int>(settings.max_timeout.count()) + 1);
	BOOST_CHECK_THROW(queue->submit(too_long), ValidationException);

	SubmitRequest zero_timeout = request("python", "print(1)");
	zero_timeout.timeout_seconds = SubmitRequest::optional<int>(0);
	BOOST_CHECK_THROW(queue->submit(zero_timeout), ValidationException);

	SubmitRequest too_much_memory = request("python", "print(1)");
	too_much_memory.memory_limit_mb = SubmitRequest::optional<int>(settings.max_memory_mb + 1);
	BOOST_CHECK_THROW(queue->submit(too_much_memory), ValidationException);

	BOOST_CHECK_EQUAL(store->size(), 0u);
}

BOOST_AUTO_TEST_CASE(submit_applies_default_limits_per_timeout_class)
{
	std::unique_ptr<JobQueue> queue = make_queue();

	const Job python = queue->status(queue->submit(request("PYTHON", "print(1)")));
	BOOST_CHECK(python.state == JobState::QUEUED);
	BOOST_CHECK_EQUAL(python.language, "python");
	BOOST_CHECK(python.limits.timeout == settings.timeout_interpreted);
	BOOST_CHECK_EQUAL(python.limits.memory_mb, settings.memory_mb);

	const Job c = queue->status(queue->submit(request("c", "int main(void) { return 0; }")));
	BOOST_CHECK(c.limits.timeout == settings.timeout_compiled);

	SubmitRequest custom = request("bash", "echo hi");
	custom.timeout_seconds = SubmitRequest::optional<int>(3);
	custom.memory_limit_mb = SubmitRequest::optional<int>(128);
	const Job bash = queue->status(queue->submit(custom));
	BOOST_CHECK(bash.limits.timeout == std::chrono::seconds(3));
	BOOST_CHECK_EQUAL(bash.limits.memory_mb, 128);
}

BOOST_AUTO_TEST_CASE(unknown_and_unfinished_jobs)
{
	std::unique_ptr<JobQueue> queue = make_queue();

	BOOST_CHECK_THROW(queue->status("00000000-0000-0000-0000-000000000000"), JobNotFoundException);
	BOOST_CHECK_THROW(queue->result("00000000-0000-0000-0000-000000000000"), JobNotFoundException);
	BOOST_CHECK_THROW(queue->cancel("00000000-0000-0000-0000-000000000000"), JobNotFoundException);

	const std::string job_id = queue->submit(request("python", "print(1)"));
	try {
		queue->result(job_id);
		BOOST_FAIL("queued job has no result");
	} catch (const JobNotReadyException & e) {
		BOOST_CHECK(e.state == JobState::QUEUED);
	}
}

BOOST_AUTO_TEST_CASE(finished_job_exposes_result_and_timestamps)
{
	std::unique_ptr<JobQueue> queue = make_queue();
	queue->start();

	const std::string job_id = queue->submit(request("python", "print(1)"));
	BOOST_REQUIRE(wait_terminal(*queue, job_id) == JobState::FINISHED);

	const Job job = queue->status(job_id);
	BOOST_CHECK(job.started_at.has_value());
	BOOST_CHECK(job.ended_at.has_value());
	BOOST_CHECK(boost::algorithm::contains(job.worker, "worker-"));

	ExecutionResult result = queue->result(job_id);
	BOOST_CHECK_EQUAL(result.stdout_text, "done " + job_id + "\n");
	BOOST_CHECK(result.success);
	BOOST_CHECK_EQUAL(workspaces->live_count(), 0u);
}

BOOST_AUTO_TEST_CASE(at_most_n_jobs_run_concurrently)
{
	settings.workers = 2;
	std::unique_ptr<JobQueue> queue = make_queue();
	backend->block();
	queue->start();

	std::vector<std::string> ids;
	for (int i = 0; i < 4; ++i) {
		ids.push_back(queue->submit(request("bash", "echo " + std::to_string(i))));
	}

	BOOST_REQUIRE(backend->wait_running(2, 5000_ms));
	std::this_thread::sleep_for(200_ms);
	BOOST_CHECK_EQUAL(backend->max_concurrency(), 2u);
	BOOST_CHECK_EQUAL(queue->busy_worker_count(), 2u);
	BOOST_CHECK_EQUAL(store->queued_count(), 2u);

	size_t started = 0;
	for (const std::string & id : ids) {
		if (queue->status(id).state == JobState::STARTED) {
			++started;
		}
	}
	BOOST_CHECK_EQUAL(started, 2u);

	backend->release();
	for (const std::string & id : ids) {
		BOOST_CHECK(wait_terminal(*queue, id) == JobState::FINISHED);
	}
	BOOST_CHECK_EQUAL(backend->max_concurrency(), 2u);
	BOOST_CHECK_EQUAL(workspaces->live_count(), 0u);
}

BOOST_AUTO_TEST_CASE(single_worker_runs_jobs_in_submission_order)
{
	settings.workers = 1;
	std::unique_ptr<JobQueue> queue = make_queue();

	std::vector<std::string> ids;
	for (int i = 0; i < 5; ++i) {
		ids.push_back(queue->submit(request("python", "print(" + std::to_string(i) + ")")));
	}
	queue->start();
	for (const std::string & id : ids) {
		BOOST_REQUIRE(wait_terminal(*queue, id) == JobState::FINISHED);
	}

	BOOST_CHECK(backend->execution_order() == ids);
}

BOOST_AUTO_TEST_CASE(canceled_queued_job_is_never_executed)
{
	settings.workers = 1;
	std::unique_ptr<JobQueue> queue = make_queue();
	backend->block();
	queue->start();

	const std::string running_id = queue->submit(request("bash", "sleep 1"));
	BOOST_REQUIRE(backend->wait_running(1, 5000_ms));
	const std::string queued_id = queue->submit(request("bash", "echo never"));

	BOOST_CHECK(queue->cancel(queued_id) == JobState::CANCELED);
	BOOST_CHECK(queue->status(queued_id).state == JobState::CANCELED);
	BOOST_CHECK_EQUAL(store->queued_count(), 0u);

	ExecutionResult result = queue->result(queued_id);
	BOOST_CHECK(result.termination == Termination::CANCELED);
	BOOST_CHECK_EQUAL(result.exit_code, -1);
	BOOST_CHECK_EQUAL(result.stdout_text, "");
	BOOST_CHECK(!result.success);

	backend->release();
	BOOST_CHECK(wait_terminal(*queue, running_id) == JobState::FINISHED);
	std::this_thread::sleep_for(200_ms);

	const std::vector<std::string> order = backend->execution_order();
	BOOST_CHECK(std::find(order.begin(), order.end(), queued_id) == order.end());
	// 再次取消已结束的 job 不改变其状态
	BOOST_CHECK(queue->cancel(queued_id) == JobState::CANCELED);
	BOOST_CHECK(queue->cancel(running_id) == JobState::FINISHED);
}

BOOST_AUTO_TEST_CASE(canceled_running_job_keeps_partial_output)
{
	std::unique_ptr<JobQueue> queue = make_queue();
	backend->block();
	queue->start();

	const std::string job_id = queue->submit(request("python", "while True: pass"));
	BOOST_REQUIRE(backend->wait_running(1, 5000_ms));
	BOOST_REQUIRE(queue->status(job_id).state == JobState::STARTED);

	BOOST_CHECK(queue->cancel(job_id) == JobState::CANCELED);

	ExecutionResult result = queue->result(job_id);
	BOOST_CHECK(result.termination == Termination::CANCELED);
	BOOST_CHECK_EQUAL(result.stdout_text, "partial\n");
	BOOST_CHECK_EQUAL(workspaces->live_count(), 0u);
}

BOOST_AUTO_TEST_CASE(cancel_request_in_store_reaches_the_worker)
{
	std::unique_ptr<JobQueue> queue = make_queue();
	backend->block();
	queue->start();

	const std::string job_id = queue->submit(request("python", "while True: pass"));
	BOOST_REQUIRE(backend->wait_running(1, 5000_ms));

	// 只写入存储, 不经过本进程的取消标志, 模拟另一个进程中的客户端
	store->request_cancel(job_id);
	BOOST_CHECK(wait_terminal(*queue, job_id) == JobState::CANCELED);
}

BOOST_AUTO_TEST_CASE(timeout_becomes_failed_job)
{
	std::unique_ptr<JobQueue> queue = make_queue();
	backend->set_outcome([](const Workspace & workspace) {
		ExecutionResult result;
		result.stdout_text = "tick\n";
		result.stderr_text = "Execution timed out (2 seconds limit)";
		result.exit_code = 124;
		result.termination = Termination::TIMED_OUT;
		return result;
	});
	queue->start();

	SubmitRequest req = request("python", "while True: pass");
	req.timeout_seconds = SubmitRequest::optional<int>(2);
	const std::string job_id = queue->submit(req);
	BOOST_REQUIRE(wait_terminal(*queue, job_id) == JobState::FAILED);

	try {
		queue->result(job_id);
		BOOST_FAIL("timed out job should report failure");
	} catch (const JobExecutionFailedException & e) {
		BOOST_CHECK(e.category == ErrorCategory::TIMEOUT);
		BOOST_CHECK_EQUAL(std::string(e.what()), "Execution timed out (2 seconds limit)");
	}
	BOOST_CHECK_EQUAL(queue->status(job_id).status_json().at("errorCategory").get<std::string>(), "timeout");
}

BOOST_AUTO_TEST_CASE(backend_errors_are_categorized)
{
	std::unique_ptr<JobQueue> queue = make_queue();
	queue->start();

	backend->set_outcome([](const Workspace &) -> ExecutionResult {
		throw InfrastructureException("Required tool not found: Rscript");
	});
	const std::string infra_id = queue->submit(request("r", "print(1)"));
	BOOST_REQUIRE(wait_terminal(*queue, infra_id) == JobState::FAILED);
	try {
		queue->result(infra_id);
		BOOST_FAIL("infrastructure failure should be reported");
	} catch (const JobExecutionFailedException & e) {
		BOOST_CHECK(e.category == ErrorCategory::INFRASTRUCTURE);
		BOOST_CHECK(boost::algorithm::contains(e.what(), "Rscript"));
	}

	backend->set_outcome([](const Workspace &) -> ExecutionResult {
		throw std::runtime_error("/var/lib/secret/path exploded");
	});
	const std::string internal_id = queue->submit(request("python", "print(1)"));
	BOOST_REQUIRE(wait_terminal(*queue, internal_id) == JobState::FAILED);
	try {
		queue->result(internal_id);
		BOOST_FAIL("internal failure should be reported");
	} catch (const JobExecutionFailedException & e) {
		BOOST_CHECK(e.category == ErrorCategory::INTERNAL);
		BOOST_CHECK(!boost::algorithm::contains(e.what(), "/var/lib/secret"));
	}

	// 失败的 job 不影响后续的 job
	backend->set_outcome(&ScriptedBackend::succeed);
	const std::string ok_id = queue->submit(request("python", "print(1)"));
	BOOST_CHECK(wait_terminal(*queue, ok_id) == JobState::FINISHED);
	BOOST_CHECK_EQUAL(workspaces->live_count(), 0u);
}

BOOST_AUTO_TEST_CASE(workers_require_backend_and_single_start)
{
	JobQueue client(registry, store, nullptr, nullptr, LimiterSettings(), settings);
	BOOST_CHECK_THROW(client.start(), std::logic_error);
	BOOST_CHECK_NO_THROW(client.submit(request("python", "print(1)")));

	std::unique_ptr<JobQueue> queue = make_queue();
	queue->start();
	BOOST_CHECK_THROW(queue->start(), std::logic_error);
	queue->stop();
}

BOOST_AUTO_TEST_CASE(invalid_queue_settings_are_rejected)
{
	settings.workers = 0;
	BOOST_CHECK_THROW(make_queue(), std::invalid_argument);

	settings.workers = 1;
	settings.memory_mb = settings.max_memory_mb + 1;
	BOOST_CHECK_THROW(make_queue(), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(submission_parsed_from_json)
{
	SubmitRequest req = SubmitRequest::from_json(nlohmann::json::parse(
			R"({"language": "python", "code": "print(input())", "stdin": "hi", "timeoutSeconds": 5})"));
	BOOST_CHECK_EQUAL(req.language, "python");
	BOOST_CHECK_EQUAL(req.stdin_data.value(), "hi");
	BOOST_CHECK_EQUAL(req.timeout_seconds.value(), 5);
	BOOST_CHECK(!req.memory_limit_mb.has_value());

	BOOST_CHECK_THROW(SubmitRequest::from_json(nlohmann::json::parse(R"({"code": "print(1)"})")), ValidationException);
	BOOST_CHECK_THROW(SubmitRequest::from_json(nlohmann::json::parse(R"({"language": 3, "code": "x"})")), ValidationException);
	BOOST_CHECK_THROW(SubmitRequest::from_json(nlohmann::json::parse("[1, 2]")), ValidationException);
}

BOOST_AUTO_TEST_CASE(start_transition_failing_once_is_retried)
{
	job_store = flaky;
	flaky->fail_transitions_to(JobState::STARTED, 1);
	std::unique_ptr<JobQueue> queue = make_queue();
	queue->start();

	const std::string job_id = queue->submit(request("python", "print(1)"));
	BOOST_REQUIRE(wait_terminal(*queue, job_id) == JobState::FINISHED);
	BOOST_CHECK_EQUAL(queue->result(job_id).stdout_text, "done " + job_id + "\n");
	BOOST_CHECK_EQUAL(backend->execution_order().size(), 1u);
	BOOST_CHECK_EQUAL(flaky->requeue_count(), 0u);
}

BOOST_AUTO_TEST_CASE(lost_start_reply_does_not_strand_the_job)
{
	job_store = flaky;
	// 迁移已写入存储, 但调用方只看到了异常
	flaky->fail_transitions_to(JobState::STARTED, 1, true);
	std::unique_ptr<JobQueue> queue = make_queue();
	queue->start();

	const std::string job_id = queue->submit(request("python", "print(1)"));
	BOOST_REQUIRE(wait_terminal(*queue, job_id) == JobState::FINISHED);
	BOOST_CHECK(boost::algorithm::contains(queue->status(job_id).worker, "worker-"));
	BOOST_CHECK_EQUAL(backend->execution_order().size(), 1u);
}

BOOST_AUTO_TEST_CASE(terminal_transition_failing_once_is_retried)
{
	job_store = flaky;
	settings.workers = 1;
	std::unique_ptr<JobQueue> queue = make_queue();
	queue->start();

	flaky->fail_transitions_to(JobState::FINISHED, 1);
	const std::string failed_once = queue->submit(request("python", "print(1)"));
	BOOST_REQUIRE(wait_terminal(*queue, failed_once) == JobState::FINISHED);
	BOOST_CHECK_EQUAL(queue->result(failed_once).stdout_text, "done " + failed_once + "\n");

	flaky->fail_transitions_to(JobState::FINISHED, 1, true);
	const std::string lost_reply = queue->submit(request("python", "print(2)"));
	BOOST_REQUIRE(wait_terminal(*queue, lost_reply) == JobState::FINISHED);
	BOOST_CHECK_EQUAL(queue->result(lost_reply).stdout_text, "done " + lost_reply + "\n");
	BOOST_CHECK_EQUAL(workspaces->live_count(), 0u);
}

BOOST_AUTO_TEST_CASE(unwritable_result_becomes_internal_failure)
{
	job_store = flaky;
	flaky->break_transitions_to(JobState::FINISHED);
	std::unique_ptr<JobQueue> queue = make_queue();
	queue->start();

	const std::string job_id = queue->submit(request("python", "print(1)"));
	BOOST_REQUIRE(wait_terminal(*queue, job_id) == JobState::FAILED);
	try {
		queue->result(job_id);
		BOOST_FAIL("job whose result could not be stored should fail");
	} catch (const JobExecutionFailedException & e) {
		BOOST_CHECK(e.category == ErrorCategory::INTERNAL);
		BOOST_CHECK_EQUAL(std::string(e.what()), "Internal error while executing the job");
	}

	flaky->heal();
	const std::string next = queue->submit(request("python", "print(2)"));
	BOOST_CHECK(wait_terminal(*queue, next) == JobState::FINISHED);
}

BOOST_AUTO_TEST_CASE(job_that_cannot_start_returns_to_the_queue)
{
	job_store = flaky;
	settings.workers = 1;
	flaky->break_transitions_to(JobState::STARTED);
	std::unique_ptr<JobQueue> queue = make_queue();
	queue->start();

	const std::string job_id = queue->submit(request("python", "print(1)"));
	const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
	while (flaky->requeue_count() == 0 && std::chrono::steady_clock::now() < deadline) {
		std::this_thread::sleep_for(10_ms);
	}
	BOOST_REQUIRE_GE(flaky->requeue_count(), 1u);
	BOOST_CHECK(queue->status(job_id).state == JobState::QUEUED);
	BOOST_CHECK(backend->execution_order().empty());

	flaky->heal();
	BOOST_REQUIRE(wait_terminal(*queue, job_id) == JobState::FINISHED);
	BOOST_CHECK_EQUAL(backend->execution_order().size(), 1u);
	BOOST_CHECK_EQUAL(queue->result(job_id).stdout_text, "done " + job_id + "\n");
}

BOOST_AUTO_TEST_CASE(execute_reports_job_that_never_starts)
{
	settings.workers = 1;
	settings.execute_queue_wait = std::chrono::seconds(1);
	std::unique_ptr<JobQueue> queue = make_queue();
	backend->block();
	queue->start();

	const std::string blocker = queue->submit(request("bash", "sleep 1"));
	BOOST_REQUIRE(backend->wait_running(1, 5000_ms));

	try {
		queue->execute(request("bash", "echo later"));
		BOOST_FAIL("job stuck behind a busy worker should not be reported as finished");
	} catch (const JobNotReadyException & e) {
		BOOST_CHECK(e.state == JobState::QUEUED);
	}

	backend->release();
	BOOST_CHECK(wait_terminal(*queue, blocker) == JobState::FINISHED);
}

BOOST_AUTO_TEST_CASE(queue_time_does_not_count_against_execute)
{
	settings.workers = 1;
	settings.execute_wait_margin = std::chrono::seconds(0);
	std::unique_ptr<JobQueue> queue = make_queue();
	backend->block();
	queue->start();

	const std::string blocker = queue->submit(request("bash", "sleep 1"));
	BOOST_REQUIRE(backend->wait_running(1, 5000_ms));

	// 等待的时间超过第二个 job 自身的超时
	std::thread releaser([this]() {
		std::this_thread::sleep_for(1500_ms);
		backend->release();
	});

	SubmitRequest quick = request("bash", "echo quick");
	quick.timeout_seconds = SubmitRequest::optional<int>(1);
	ExecutionResult result;
	BOOST_CHECK_NO_THROW(result = queue->execute(quick));
	releaser.join();

	BOOST_CHECK(result.success);
	BOOST_CHECK(boost::algorithm::starts_with(result.stdout_text, "done "));
	BOOST_CHECK(wait_terminal(*queue, blocker) == JobState::FINISHED);
}

BOOST_AUTO_TEST_CASE(invalid_store_retry_is_rejected)
{
	settings.store_retry = RetryPolicy(0, 10_ms);
	BOOST_CHECK_THROW(make_queue(), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(host_backend_end_to_end)
{
	HostBackendSettings host_settings;
	host_settings.cancel_grace = 200_ms;
	std::unique_ptr<JobQueue> queue = make_queue(std::make_shared<HostBackend>(host_settings, std::make_shared<PosixProcessLauncher>()));
	queue->start();

	ExecutionResult hello = queue->execute(request("bash", "echo hello from bash"));
	BOOST_CHECK_EQUAL(hello.stdout_text, "hello from bash\n");
	BOOST_CHECK_EQUAL(hello.exit_code, 0);
	BOOST_CHECK(hello.success);

	SubmitRequest slow = request("bash", "echo start; sleep 30");
	slow.timeout_seconds = SubmitRequest::optional<int>(1);
	try {
		queue->execute(slow);
		BOOST_FAIL("slow job should time out");
	} catch (const JobExecutionFailedException & e) {
		BOOST_CHECK(e.category == ErrorCategory::TIMEOUT);
		BOOST_CHECK_EQUAL(std::string(e.what()), "Execution timed out (1 seconds limit)");
	}

	BOOST_CHECK_EQUAL(workspaces->live_count(), 0u);
}

BOOST_AUTO_TEST_SUITE_END()
