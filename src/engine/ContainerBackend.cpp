/*
 * ContainerBackend.cpp
 *
 *  Created on: 2026年10月15日
 */

#include "ContainerBackend.hpp"
#include "logger.hpp"
#include "runner_exceptions.hpp"

#include <cstdlib>

#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/lexical_cast.hpp>


namespace
{
	constexpr size_t docker_output_limit = 64 * 1024;

	/**
	 * @brief docker 命令行工具自身需要的环境变量, 从 worker 的环境中透传
	 */
	ExecuteArgs docker_client_environment(const std::string & search_path)
	{
		ExecuteArgs env = { "PATH=" + search_path };
		for (const char * name : { "HOME", "DOCKER_HOST", "DOCKER_CONFIG", "DOCKER_CONTEXT", "DOCKER_CERT_PATH", "DOCKER_TLS_VERIFY" }) {
			const char * value = std::getenv(name);
			if (value != nullptr) {
				env.push_back(std::string(name) + "=" + value);
			}
		}
		return env;
	}

	bool image_missing(const std::string & docker_error)
	{
		return boost::algorithm::icontains(docker_error, "No such image") ||
				boost::algorithm::icontains(docker_error, "Unable to find image") ||
				boost::algorithm::icontains(docker_error, "pull access denied");
	}

	bool executable_missing(const ProtectedProcessDetails & details)
	{
		if (details.running_result != ProtectedProcessResult::EXITED) {
			return false;
		}
		if (details.exit_code != 126 && details.exit_code != 127) {
			return false;
		}
		return boost::algorithm::contains(details.error, "OCI runtime exec failed") ||
				boost::algorithm::contains(details.error, "executable file not found");
	}

	/**
	 * @brief 一个辅助类, 用于确保容器被删除
	 */
	template <typename Remover>
	struct container_guard
	{
			Remover remover;

			explicit container_guard(Remover remover) :
					remover(std::move(remover))
			{
			}

			~container_guard() noexcept
			{
				remover();
			}
	};

} /* namespace */

ContainerBackend::ContainerBackend(const ContainerBackendSettings & settings, std::shared_ptr<ProcessLauncher> launcher) :
		settings(settings), launcher(std::move(launcher))
{
	if (this->launcher == nullptr) {
		throw std::invalid_argument("process launcher is null");
	}
}

const char * ContainerBackend::default_image(Language language)
{
	switch (language) {
		case Language::PYTHON:
			return "python:3.11-alpine";
		case Language::JAVASCRIPT:
			return "node:20-alpine";
		case Language::R:
			return "r-base:4.3.1";
		case Language::BASH:
			return "bash:5.2";
		case Language::JULIA:
			return "julia:1.10";
		case Language::C:
		case Language::CPP:
			return "gcc:13";
		case Language::JAVA:
			return "eclipse-temurin:21-jdk";
		case Language::GO:
			return "golang:1.22-alpine";
	}
	return "alpine:3.20";
}

std::string ContainerBackend::image_for(const LanguageSpec & spec) const
{
	auto it = settings.images.find(spec.id);
	if (it != settings.images.end() && !it->second.empty()) {
		return it->second;
	}
	return default_image(spec.language);
}

PathLayout ContainerBackend::layout_for(const Workspace & workspace, const LanguageSpec & spec) const
{
	PathLayout layout;
	layout.workdir = container_workdir;
	layout.source = std::string(container_workdir) + "/" + spec.source_filename;
	layout.builddir = container_builddir;
	layout.tmpdir = container_tmpdir;
	return layout;
}

std::string ContainerBackend::docker_executable() const
{
	ProcessLauncher::optional<std::string> path = launcher->resolve_executable(settings.docker_path, settings.search_path);
	if (!path.has_value()) {
		throw InfrastructureException("Required tool not found: " + settings.docker_path);
	}
	return path.value();
}

ExecuteArgs ContainerBackend::make_run_args(const std::string & docker, const std::string & container_name, const std::string & image,
											const BoundedCommandPlan & plan, const LanguageSpec & spec, const Workspace & workspace) const
{
	using namespace std::chrono;

	const std::string memory = boost::lexical_cast<std::string>(plan.memory_mb) + "m";
	const std::string tmpfs_size = "size=" + boost::lexical_cast<std::string>(settings.tmpfs_size_mb) + "m";
	const long long keep_alive = duration_cast<seconds>(plan.wall_timeout).count() + settings.start_timeout.count() + 5;

	ExecuteArgs args = {
		docker, "run", "-d", "--rm", "--pull=never",
		"--name", container_name,
		"--label", "ts_runner.job=" + workspace.get_job_id(),
		"--network", "none",
		"--memory", memory,
		"--memory-swap", memory,
		"--cpus", settings.cpus,
		"--pids-limit", boost::lexical_cast<std::string>(plan.max_processes),
		"--security-opt", "no-new-privileges:true",
		"--cap-drop", "ALL",
		"--read-only",
		"--ulimit", "core=0",
	};

	const StepLimits & run_limits = plan.run.limits;
	if (run_limits.cpu_seconds.has_value()) {
		const std::string cpu = boost::lexical_cast<std::string>(run_limits.cpu_seconds.value());
		args.push_back("--ulimit").push_back("cpu=" + cpu + ":" + cpu);
	}
	if (run_limits.max_file_size_bytes.has_value()) {
		const std::string fsize = boost::lexical_cast<std::string>(run_limits.max_file_size_bytes.value());
		args.push_back("--ulimit").push_back("fsize=" + fsize + ":" + fsize);
	}

	args.push_back("--tmpfs").push_back(std::string(container_tmpdir) + ":rw,noexec,nosuid," + tmpfs_size);
	args.push_back("--tmpfs").push_back(std::string(container_workdir) + ":rw,noexec,nosuid," + tmpfs_size);
	// 只有运行编译产出的本地程序时, 编译产物目录才允许执行
	args.push_back("--tmpfs").push_back(std::string(container_builddir) + (spec.runs_native_binary ? ":rw,exec,nosuid," : ":rw,noexec,nosuid,") + tmpfs_size);

	args.push_back("--user").push_back(settings.user);
	args.push_back("--workdir").push_back(container_workdir);
	args.push_back("-v").push_back(workspace.source_file().string() + ":" + container_workdir + "/" + spec.source_filename + ":ro");
	args.push_back("--entrypoint").push_back("sleep");
	args.push_back(image);
	args.push_back(boost::lexical_cast<std::string>(keep_alive));
	return args;
}

ExecuteArgs ContainerBackend::make_exec_args(const std::string & docker, const std::string & container_name, const BoundedCommandPlan & plan,
											 const BoundedStep & step, bool with_stdin) const
{
	ExecuteArgs args = { docker, "exec" };
	if (with_stdin) {
		args.push_back("-i");
	}
	args.push_back("-w").push_back(container_workdir);
	args.push_back("-e").push_back(std::string("HOME=") + container_tmpdir);
	for (const auto & [name, value] : plan.environment) {
		args.push_back("-e").push_back(name + "=" + value);
	}
	args.push_back(container_name);
	args.append(step.argv);
	return args;
}

ProtectedProcessDetails ContainerBackend::run_docker(const std::string & job_id, const ExecuteArgs & args, std::chrono::seconds timeout) const
{
	ProtectedProcessConfig config;
	config.set_deadline(ProtectedProcessConfig::clock::now() + timeout)
			.set_max_output_size(docker_output_limit)
			.set_cancel_grace(settings.cancel_grace);
	LOG_DEBUG(job_id, "docker: ", args);
	return launcher->launch(args, config, docker_client_environment(settings.search_path));
}

void ContainerBackend::remove_container(const std::string & job_id, const std::string & docker, const std::string & container_name) const noexcept
{
	auto remove_once = [&]() {
		ProtectedProcessDetails details = this->run_docker(job_id, { docker, "rm", "-f", container_name }, settings.start_timeout);
		if (details.running_result != ProtectedProcessResult::EXITED) {
			return false;
		}
		return details.exit_code == 0 || boost::algorithm::contains(details.error, "No such container");
	};
	auto on_failure = [&job_id, &container_name](int attempt) noexcept {
		LOG_WARNING(job_id, "Remove container failed, attempt: ", attempt, " container: ", container_name);
	};

	try {
		if (!retry_idempotent(settings.remove_retry, remove_once, on_failure)) {
			LOG_FATAL(job_id, "Remove container failed after all retries, container: ", container_name);
		}
	} catch (const std::exception & e) {
		EXCEPT_FATAL(job_id, "Remove container failed.", e, " container: ", container_name);
	} catch (...) {
		UNKNOWN_EXCEPT_FATAL(job_id, "Remove container failed.", " container: ", container_name);
	}
}

ExecutionResult ContainerBackend::execute(const BoundedCommandPlan & plan, const LanguageSpec & spec, const Workspace & workspace,
										  const std::string & stdin_data, const cancel_predicate & cancel_requested)
{
	const std::string & job_id = workspace.get_job_id();
	const std::string docker = this->docker_executable();
	const std::string image = this->image_for(spec);
	const std::string container_name = "tsrun-" + workspace.path().filename().string();

	LOG_INFO(job_id, "Start container: ", container_name, " image: ", image);

	// 从这里开始, 无论以何种方式退出都要删除容器, 包括 docker run 本身失败的情况
	auto remover = [this, &job_id, &docker, &container_name]() noexcept {
		this->remove_container(job_id, docker, container_name);
	};
	container_guard<decltype(remover)> guard(remover);

	ProtectedProcessDetails started = this->run_docker(job_id, this->make_run_args(docker, container_name, image, plan, spec, workspace), settings.start_timeout);
	if (started.running_result != ProtectedProcessResult::EXITED || started.exit_code != 0) {
		std::string message = boost::algorithm::trim_copy(started.error);
		if (image_missing(message)) {
			throw InfrastructureException("Container image is not available: " + image);
		}
		throw std::runtime_error("docker run failed, result: " + boost::lexical_cast<std::string>(started.running_result) +
								 " exit code: " + boost::lexical_cast<std::string>(started.exit_code) + " error: " + message);
	}

	const ExecuteArgs env = docker_client_environment(settings.search_path);

	auto execute_step = [&](const BoundedStep & step, bool is_run, clock::time_point deadline) {
		const bool with_stdin = is_run && !stdin_data.empty();
		ExecuteArgs args = this->make_exec_args(docker, container_name, plan, step, with_stdin);

		ProtectedProcessConfig config;
		config.set_deadline(deadline)
				.set_cancel_predicate(cancel_requested)
				.set_cancel_grace(settings.cancel_grace)
				.set_max_output_size(plan.max_output_bytes);
		if (with_stdin) {
			config.set_input_data(stdin_data);
		}

		LOG_INFO(job_id, is_run ? "Run in container: " : "Compile in container: ", step.argv);
		ProtectedProcessDetails details = launcher->launch(args, config, env);
		if (executable_missing(details)) {
			throw InfrastructureException("Required tool not found in image " + image + ": " + step.argv[0]);
		}
		LOG_INFO(job_id, "Step finished, result: ", details.running_result, " exit code: ", details.exit_code,
				 " real time: ", details.real_time.count(), " ms");
		return details;
	};

	// 超时或取消时看门狗只杀死了 docker exec 客户端, 容器内的进程随 guard 删除容器而结束
	return run_plan(plan, execute_step);
}
