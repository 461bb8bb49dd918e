/*
 * runner.cpp
 *
 *  Created on: 2026年10月17日
 */

#include "runner_settings.hpp"
#include "logger.hpp"
#include "runner_exceptions.hpp"
#include "ContainerBackend.hpp"
#include "HostBackend.hpp"
#include "JobQueue.hpp"
#include "MemoryJobStore.hpp"
#include "ProcessLauncher.hpp"
#include "RedisJobStore.hpp"

#include <csignal>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <thread>

#include <cmdline.h>

#include <boost/filesystem.hpp>
#include <kerbal/compatibility/chrono_suffix.hpp>
#include <kerbal/utility/costream.hpp>

namespace
{
	volatile std::sig_atomic_t loop = 1;

	constexpr const char * default_config_file = "/etc/ts_runner/runner_conf.json";

	/**
	 * @brief SIGTERM 与 SIGINT 的处理函数, 令 serve 模式的主循环结束。worker 完成手头的 job 后退出
	 */
	void regist_SIGTERM_handler(int signum) noexcept
	{
		if (signum == SIGTERM || signum == SIGINT) {
			loop = 0;
		}
	}

	const char * process_getenv(const char * name)
	{
		return std::getenv(name);
	}

	std::shared_ptr<JobStore> make_store(const Settings & settings)
	{
		switch (settings.queue.store) {
			case StoreKind::MEMORY:
				return std::make_shared<MemoryJobStore>(settings.queue.result_ttl);
			case StoreKind::REDIS:
				return std::make_shared<RedisJobStore>(RedisEndpoint::parse(settings.queue.redis_url), settings.queue.name,
													   settings.queue.result_ttl, settings.queue.redis_pool_size);
		}
		throw std::invalid_argument("Unknown queue backend");
	}

	std::shared_ptr<SandboxBackend> make_backend(const Settings & settings)
	{
		std::shared_ptr<ProcessLauncher> launcher = std::make_shared<PosixProcessLauncher>();
		switch (settings.backend) {
			case BackendKind::HOST:
				return std::make_shared<HostBackend>(settings.host, launcher);
			case BackendKind::CONTAINER:
				return std::make_shared<ContainerBackend>(settings.container, launcher);
		}
		throw std::invalid_argument("Unknown sandbox backend");
	}

	std::shared_ptr<const LanguageRegistry> make_registry()
	{
		return std::shared_ptr<const LanguageRegistry>(std::make_shared<LanguageRegistry>(LanguageRegistry::builtin()));
	}

	std::string read_all(std::istream & in)
	{
		return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
	}

	/**
	 * @brief 从 --file 指定的文件读入源代码, 未指定或为 "-" 时从标准输入读入
	 */
	std::string read_code(const cmdline::parser & parser)
	{
		const std::string file = parser.get<std::string>("file");
		if (file.empty() || file == "-") {
			return read_all(std::cin);
		}
		std::ifstream fin(file);
		if (!fin) {
			throw std::runtime_error("Open source file failed: " + file);
		}
		return read_all(fin);
	}

	SubmitRequest make_request(const cmdline::parser & parser)
	{
		SubmitRequest request;
		request.language = parser.get<std::string>("language");
		request.code = read_code(parser);
		if (parser.exist("stdin")) {
			request.stdin_data = SubmitRequest::optional<std::string>(parser.get<std::string>("stdin"));
		}
		if (parser.get<int>("timeout") > 0) {
			request.timeout_seconds = SubmitRequest::optional<int>(parser.get<int>("timeout"));
		}
		if (parser.get<int>("memory") > 0) {
			request.memory_limit_mb = SubmitRequest::optional<int>(parser.get<int>("memory"));
		}
		return request;
	}

	void print(const nlohmann::json & j)
	{
		std::cout << j.dump(2) << std::endl;
	}

	nlohmann::json failed_payload(const JobExecutionFailedException & e)
	{
		return nlohmann::json {
			{ "state", getJobStateName(JobState::FAILED) },
			{ "error", e.what() },
			{ "errorCategory", getErrorCategoryName(e.category) },
		};
	}

	/**
	 * @brief 一次性执行: 使用进程内的存储与单个 worker, 执行完毕后打印结果
	 */
	int run_once(const Settings & settings, const cmdline::parser & parser)
	{
		JobQueueSettings queue_settings = settings.job_queue;
		queue_settings.workers = 1;

		JobQueue queue(make_registry(), std::make_shared<MemoryJobStore>(settings.queue.result_ttl), make_backend(settings),
					   std::make_shared<WorkspaceManager>(settings.workspace), settings.limiter, queue_settings);
		queue.start();
		try {
			print(queue.execute(make_request(parser)).to_json());
		} catch (const JobExecutionFailedException & e) {
			print(failed_payload(e));
			return 3;
		}
		return 0;
	}

	int serve(const Settings & settings)
	{
		using namespace kerbal::compatibility::chrono_suffix;

		JobQueue queue(make_registry(), make_store(settings), make_backend(settings),
					   std::make_shared<WorkspaceManager>(settings.workspace), settings.limiter, settings.job_queue);

		signal(SIGTERM, regist_SIGTERM_handler);
		signal(SIGINT, regist_SIGTERM_handler);

		queue.start();
		LOG_INFO("", "Runner serving, backend: ", getBackendKindName(settings.backend), " store: ", getStoreKindName(settings.queue.store),
				 " queue: ", settings.queue.name);
		while (loop) {
			std::this_thread::sleep_for(200_ms);
		}
		LOG_WARNING("", "Runner has received a stop signal and will exit after the running jobs are finished!");
		queue.stop();
		LOG_INFO("", "Runner exit.");
		return 0;
	}

	/**
	 * @brief submit, status, result, cancel 等客户端操作, 需要与 worker 共享的 redis 存储
	 */
	int client(const Settings & settings, const std::string & mode, const cmdline::parser & parser)
	{
		if (settings.queue.store != StoreKind::REDIS) {
			throw std::invalid_argument("Mode " + mode + " requires the redis queue backend");
		}
		JobQueue queue(make_registry(), make_store(settings), nullptr, nullptr, settings.limiter, settings.job_queue);

		if (mode == "submit") {
			print(nlohmann::json { { "jobId", queue.submit(make_request(parser)) } });
			return 0;
		}

		if (parser.rest().size() < 2) {
			throw std::invalid_argument("Mode " + mode + " requires a job id");
		}
		const std::string & job_id = parser.rest()[1];

		if (mode == "status") {
			print(queue.status(job_id).status_json());
			return 0;
		}
		if (mode == "result") {
			try {
				print(queue.result(job_id).to_json());
			} catch (const JobExecutionFailedException & e) {
				print(failed_payload(e));
				return 3;
			}
			return 0;
		}
		if (mode == "cancel") {
			print(nlohmann::json { { "state", getJobStateName(queue.cancel(job_id)) } });
			return 0;
		}
		throw std::invalid_argument("Unknown mode: " + mode);
	}

} /* namespace */

/**
 * @brief ts_runner 主程序
 * 用法: ts_runner [options] run|serve|submit|status <id>|result <id>|cancel <id>
 */
int main(int argc, char * argv[]) try
{
	cmdline::parser parser;
	parser.add<std::string>("conf", 'c', "Specify configure description file path.", false, default_config_file);
	parser.add<std::string>("log", '\0', "Specify log file path, overrides the configuration.", false, "");
	parser.add<std::string>("language", 'l', "Language of the submitted code.", false, "python");
	parser.add<std::string>("file", 'f', "Source file to submit, \"-\" for standard input.", false, "-");
	parser.add<std::string>("stdin", 'i', "Data fed to the program's standard input.", false, "");
	parser.add<int>("timeout", 't', "Wall clock timeout in seconds, 0 for the language default.", false, 0);
	parser.add<int>("memory", 'm', "Memory limit in MB, 0 for the default.", false, 0);
	parser.add("version", 'v', "Display the version information.");
	parser.footer("run|serve|submit|status <job id>|result <job id>|cancel <job id>");

	parser.parse_check(argc, argv);

	if (parser.exist("version")) {
		std::cout << "Compiled at: " __DATE__ " " __TIME__ << std::endl;
		return 0;
	}

	using namespace kerbal::utility::costream;
	const auto & ccerr = costream<std::cerr>(LIGHT_RED);

	if (parser.rest().empty()) {
		ccerr << parser.usage() << std::endl;
		return 1;
	}
	const std::string mode = parser.rest()[0];

	// 未显式指定且默认位置不存在配置文件时, 只使用默认值与环境变量
	boost::filesystem::path config_file = parser.get<std::string>("conf");
	if (!parser.exist("conf") && !boost::filesystem::exists(config_file)) {
		config_file.clear();
	}
	Settings settings = Settings::load(config_file, process_getenv);

	const std::string log_file = parser.get<std::string>("log");
	if (!log_file.empty()) {
		settings.runtime.log_file_path = log_file;
	}
	if (!settings.runtime.log_file_path.empty()) {
		ts_runner::log::open_log_file(settings.runtime.log_file_path.string());
	}
	ts_runner::log::set_log_level(settings.runtime.log_level);
	LOG_DEBUG("", "Configuration load finished!");

	try {
		if (mode == "run") {
			return run_once(settings, parser);
		}
		if (mode == "serve") {
			return serve(settings);
		}
		return client(settings, mode, parser);
	} catch (const ValidationException & e) {
		print(nlohmann::json { { "error", e.what() } });
		return 1;
	} catch (const JobNotFoundException & e) {
		print(nlohmann::json { { "error", e.what() } });
		return 2;
	} catch (const JobNotReadyException & e) {
		print(nlohmann::json { { "state", getJobStateName(e.state) }, { "error", e.what() } });
		return 2;
	}

} catch (const std::exception & e) {
	EXCEPT_FATAL("", "An uncaught exception caught by main.", e);
	return 2;
} catch (...) {
	UNKNOWN_EXCEPT_FATAL("", "An uncaught exception caught by main.");
	return 2;
}
