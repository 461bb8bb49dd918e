/*
 * HostBackend.cpp
 *
 *  Created on: 2026年10月15日
 */

#include "HostBackend.hpp"
#include "logger.hpp"
#include "runner_exceptions.hpp"

HostBackend::HostBackend(const HostBackendSettings & settings, std::shared_ptr<ProcessLauncher> launcher) :
		settings(settings), launcher(std::move(launcher))
{
	if (this->launcher == nullptr) {
		throw std::invalid_argument("process launcher is null");
	}
}

PathLayout HostBackend::layout_for(const Workspace & workspace, const LanguageSpec & spec) const
{
	PathLayout layout;
	layout.workdir = workspace.path().string();
	layout.source = workspace.source_file().string();
	layout.builddir = workspace.build_dir().string();
	layout.tmpdir = workspace.tmp_dir().string();
	return layout;
}

ExecuteArgs HostBackend::make_environment(const BoundedCommandPlan & plan, const PathLayout & layout) const
{
	ExecuteArgs env = {
		"PATH=" + settings.search_path,
		"HOME=" + layout.tmpdir,
		"LANG=C.UTF-8",
		"LC_ALL=C.UTF-8",
	};
	for (const auto & [name, value] : plan.environment) {
		env.push_back(name + "=" + value);
	}
	return env;
}

ExecuteArgs HostBackend::resolve(const ExecuteArgs & argv) const
{
	ExecuteArgs resolved = argv;
	if (argv[0].find('/') != std::string::npos) {
		return resolved;
	}
	ProcessLauncher::optional<std::string> path = launcher->resolve_executable(argv[0], settings.search_path);
	if (!path.has_value()) {
		throw InfrastructureException("Required tool not found: " + argv[0]);
	}
	resolved[0] = path.value();
	return resolved;
}

ExecutionResult HostBackend::execute(const BoundedCommandPlan & plan, const LanguageSpec & spec, const Workspace & workspace,
									 const std::string & stdin_data, const cancel_predicate & cancel_requested)
{
	const std::string & job_id = workspace.get_job_id();
	const PathLayout layout = this->layout_for(workspace, spec);
	const ExecuteArgs env = this->make_environment(plan, layout);

	// 在执行任何步骤之前确认所需的工具都存在
	ExecuteArgs compile_argv;
	if (plan.compile.has_value()) {
		compile_argv = this->resolve(plan.compile.value().argv);
	}
	ExecuteArgs run_argv = this->resolve(plan.run.argv);

	auto execute_step = [&](const BoundedStep & step, bool is_run, clock::time_point deadline) {
		ProtectedProcessConfig config(workspace.path());
		config.set_limits(step.limits)
				.set_deadline(deadline)
				.set_cancel_predicate(cancel_requested)
				.set_cancel_grace(settings.cancel_grace)
				.set_max_output_size(plan.max_output_bytes)
				.set_seccomp_policy(settings.seccomp_policy)
				.set_credentials(settings.uid, settings.gid);
		if (is_run) {
			config.set_input_data(stdin_data);
		}
		const ExecuteArgs & argv = is_run ? run_argv : compile_argv;
		LOG_INFO(job_id, is_run ? "Run: " : "Compile: ", argv);
		ProtectedProcessDetails details = launcher->launch(argv, config, env);
		LOG_INFO(job_id, "Step finished, result: ", details.running_result, " exit code: ", details.exit_code,
				 " real time: ", details.real_time.count(), " ms, cpu time: ", details.cpu_time.count(), " ms");
		return details;
	};

	return run_plan(plan, execute_step);
}
