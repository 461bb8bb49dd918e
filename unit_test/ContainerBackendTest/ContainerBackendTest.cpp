/*
 * ContainerBackendTest.cpp
 *
 *  Created on: 2026年10月18日
 */

#define BOOST_TEST_MODULE ContainerBackendTest
#include <boost/test/unit_test.hpp>

#include <algorithm>
#include <functional>
#include <mutex>
#include <vector>

#include <boost/algorithm/string/predicate.hpp>

#include "CommandSynthesizer.hpp"
#include "ContainerBackend.hpp"
#include "LanguageRegistry.hpp"
#include "ResourceLimiter.hpp"
#include "Workspace.hpp"
#include "logger.hpp"
#include "runner_exceptions.hpp"

namespace fs = boost::filesystem;

namespace
{
	/**
	 * @brief 记录每次调用的 docker 命令行, 按子命令返回预设的结果
	 */
	class RecordingLauncher : public ProcessLauncher
	{
		public:
			struct Call
			{
					ExecuteArgs args;
					std::string input_data;
					bool has_cancel_predicate;
			};

			typedef std::function<ProtectedProcessDetails(const std::string & subcommand, const ExecuteArgs & args)> responder;

			std::vector<Call> calls;
			responder respond;
			bool docker_installed = true;

			RecordingLauncher() :
					respond(&RecordingLauncher::succeed)
			{
			}

			static ProtectedProcessDetails succeed(const std::string & subcommand, const ExecuteArgs & args)
			{
				ProtectedProcessDetails details;
				if (subcommand == "run") {
					details.output = "0123456789abcdef\n";
				} else if (subcommand == "exec") {
					details.output = "hello from container\n";
					details.real_time = std::chrono::milliseconds(15);
				}
				return details;
			}

			virtual ProtectedProcessDetails launch(const ExecuteArgs & args, const ProtectedProcessConfig & config, const ExecuteArgs & env) override
			{
				calls.push_back(Call { args, config.input_data, static_cast<bool>(config.cancel_requested) });
				return respond(args.size() > 1 ? args[1] : std::string(), args);
			}

			virtual optional<std::string> resolve_executable(const std::string & program, const std::string & search_path) const override
			{
				if (docker_installed && program == "docker") {
					return optional<std::string>("/usr/bin/docker");
				}
				return optional<std::string>();
			}

			std::vector<Call> calls_of(const std::string & subcommand) const
			{
				std::vector<Call> res;
				for (const Call & call : calls) {
					if (call.args.size() > 1 && call.args[1] == subcommand) {
						res.push_back(call);
					}
				}
				return res;
			}
	};

	bool contains_arg(const ExecuteArgs & args, const std::string & arg)
	{
		return std::find(args.begin(), args.end(), arg) != args.end();
	}

	std::string value_after(const ExecuteArgs & args, const std::string & flag)
	{
		auto it = std::find(args.begin(), args.end(), flag);
		if (it == args.end() || it + 1 == args.end()) {
			return std::string();
		}
		return *(it + 1);
	}

	std::vector<std::string> values_after(const ExecuteArgs & args, const std::string & flag)
	{
		std::vector<std::string> res;
		for (size_t i = 0; i + 1 < args.size(); ++i) {
			if (args[i] == flag) {
				res.push_back(args[i + 1]);
			}
		}
		return res;
	}

	struct ContainerFixture
	{
			fs::path root;
			std::shared_ptr<RecordingLauncher> launcher;
			ContainerBackendSettings container_settings;
			std::unique_ptr<WorkspaceManager> workspaces;
			CommandSynthesizer synthesizer;
			ResourceLimiter limiter;

			ContainerFixture() :
					root(fs::temp_directory_path() / fs::unique_path("ts_runner_container_test_%%%%%%%%")),
					launcher(std::make_shared<RecordingLauncher>()),
					limiter(LimiterSettings())
			{
				ts_runner::log::set_console_echo(false);
				WorkspaceSettings ws_settings;
				ws_settings.root = root;
				ws_settings.shared_with_container = true;
				workspaces.reset(new WorkspaceManager(ws_settings));
				container_settings.remove_retry = RetryPolicy(2, std::chrono::milliseconds(1));
			}

			~ContainerFixture()
			{
				boost::system::error_code ec;
				fs::remove_all(root, ec);
			}

			ExecutionResult run(const std::string & language, const std::string & code, const std::string & stdin_data = "")
			{
				ContainerBackend backend(container_settings, launcher);
				const LanguageSpec & spec = LanguageRegistry::builtin().lookup(language);
				ResourceLimits limits;
				limits.timeout = std::chrono::seconds(8);
				limits.memory_mb = 256;

				Workspace ws = workspaces->acquire("container-test", spec, code);
				const CommandPlan plan = synthesizer.build(spec, backend.layout_for(ws, spec), limits);
				const BoundedCommandPlan bounded = limiter.apply(plan, spec, limits);
				return backend.execute(bounded, spec, ws, stdin_data, nullptr);
			}
	};

} /* namespace */

BOOST_FIXTURE_TEST_SUITE(container_backend, ContainerFixture)

BOOST_AUTO_TEST_CASE(disposable_container_is_hardened)
{
	ExecutionResult result = run("python", "print('hello from container')");

	BOOST_CHECK_EQUAL(result.stdout_text, "hello from container\n");
	BOOST_CHECK(result.success);

	std::vector<RecordingLauncher::Call> runs = launcher->calls_of("run");
	BOOST_REQUIRE_EQUAL(runs.size(), 1u);
	const ExecuteArgs & args = runs[0].args;

	BOOST_CHECK_EQUAL(args[0], "/usr/bin/docker");
	BOOST_CHECK_EQUAL(value_after(args, "--network"), "none");
	BOOST_CHECK_EQUAL(value_after(args, "--cap-drop"), "ALL");
	BOOST_CHECK_EQUAL(value_after(args, "--memory"), "256m");
	BOOST_CHECK_EQUAL(value_after(args, "--memory-swap"), "256m");
	BOOST_CHECK_EQUAL(value_after(args, "--pids-limit"), "64");
	BOOST_CHECK_EQUAL(value_after(args, "--user"), "1000:1000");
	BOOST_CHECK_EQUAL(value_after(args, "--security-opt"), "no-new-privileges:true");
	BOOST_CHECK(contains_arg(args, "--read-only"));
	BOOST_CHECK(contains_arg(args, "--pull=never"));
	BOOST_CHECK(contains_arg(args, "python:3.11-alpine"));

	const std::string mount = value_after(args, "-v");
	BOOST_CHECK(boost::algorithm::ends_with(mount, ":/work/main.py:ro"));

	for (const std::string & tmpfs : values_after(args, "--tmpfs")) {
		BOOST_CHECK_MESSAGE(boost::algorithm::contains(tmpfs, "noexec"), "writable mount must not be executable: " << tmpfs);
	}
}

BOOST_AUTO_TEST_CASE(program_runs_with_container_paths)
{
	run("python", "print(1)", "input data");

	std::vector<RecordingLauncher::Call> execs = launcher->calls_of("exec");
	BOOST_REQUIRE_EQUAL(execs.size(), 1u);
	const ExecuteArgs & args = execs[0].args;

	BOOST_CHECK(contains_arg(args, "-i"));
	BOOST_CHECK_EQUAL(value_after(args, "-w"), "/work");
	BOOST_CHECK_EQUAL(args[args.size() - 2], "python3");
	BOOST_CHECK_EQUAL(args[args.size() - 1], "/work/main.py");
	BOOST_CHECK_EQUAL(execs[0].input_data, "input data");
	BOOST_CHECK(execs[0].has_cancel_predicate == false);
}

BOOST_AUTO_TEST_CASE(native_binaries_get_executable_build_dir)
{
	run("c", "int main(void) { return 0; }");

	std::vector<RecordingLauncher::Call> runs = launcher->calls_of("run");
	BOOST_REQUIRE_EQUAL(runs.size(), 1u);
	bool build_exec = false;
	for (const std::string & tmpfs : values_after(runs[0].args, "--tmpfs")) {
		if (boost::algorithm::starts_with(tmpfs, "/build:")) {
			build_exec = boost::algorithm::contains(tmpfs, ":rw,exec,");
		} else {
			BOOST_CHECK(boost::algorithm::contains(tmpfs, "noexec"));
		}
	}
	BOOST_CHECK(build_exec);

	std::vector<RecordingLauncher::Call> execs = launcher->calls_of("exec");
	BOOST_REQUIRE_EQUAL(execs.size(), 2u);
	BOOST_CHECK(contains_arg(execs[0].args, "gcc"));
	BOOST_CHECK_EQUAL(execs[1].args[execs[1].args.size() - 1], "/build/main");
	BOOST_CHECK(!contains_arg(execs[1].args, "-i"));
}

BOOST_AUTO_TEST_CASE(container_is_removed_after_success)
{
	run("bash", "echo hi");

	BOOST_REQUIRE(!launcher->calls.empty());
	const ExecuteArgs & last = launcher->calls.back().args;
	BOOST_CHECK_EQUAL(last[1], "rm");
	BOOST_CHECK_EQUAL(last[2], "-f");
	BOOST_CHECK_EQUAL(last[3], value_after(launcher->calls_of("run")[0].args, "--name"));
}

BOOST_AUTO_TEST_CASE(compile_failure_skips_run_and_removes_container)
{
	launcher->respond = [](const std::string & subcommand, const ExecuteArgs & args) {
		ProtectedProcessDetails details = RecordingLauncher::succeed(subcommand, args);
		if (subcommand == "exec") {
			details.output.clear();
			details.error = "main.cpp:1:1: error: expected unqualified-id\n";
			details.exit_code = 1;
		}
		return details;
	};

	ExecutionResult result = run("cpp", "this is not c++");

	BOOST_CHECK(!result.success);
	BOOST_CHECK_EQUAL(result.exit_code, 1);
	BOOST_CHECK(boost::algorithm::contains(result.stderr_text, "expected unqualified-id"));
	BOOST_CHECK(result.termination == Termination::COMPLETED);
	BOOST_CHECK_EQUAL(launcher->calls_of("exec").size(), 1u);
	BOOST_CHECK_EQUAL(launcher->calls_of("rm").size(), 1u);
}

BOOST_AUTO_TEST_CASE(timeout_is_reported_and_container_removed)
{
	launcher->respond = [](const std::string & subcommand, const ExecuteArgs & args) {
		ProtectedProcessDetails details = RecordingLauncher::succeed(subcommand, args);
		if (subcommand == "exec") {
			details.output = "partial\n";
			details.running_result = ProtectedProcessResult::REAL_TIME_LIMIT_EXCEEDED;
			details.exit_code = 128 + 9;
		}
		return details;
	};

	ExecutionResult result = run("python", "while True: pass");

	BOOST_CHECK(result.termination == Termination::TIMED_OUT);
	BOOST_CHECK_EQUAL(result.exit_code, 124);
	BOOST_CHECK_EQUAL(result.stdout_text, "partial\n");
	BOOST_CHECK(boost::algorithm::contains(result.stderr_text, "Execution timed out (8 seconds limit)"));
	BOOST_CHECK_EQUAL(launcher->calls_of("rm").size(), 1u);
}

BOOST_AUTO_TEST_CASE(missing_image_is_infrastructure_error)
{
	launcher->respond = [](const std::string & subcommand, const ExecuteArgs & args) {
		ProtectedProcessDetails details = RecordingLauncher::succeed(subcommand, args);
		if (subcommand == "run") {
			details.output.clear();
			details.error = "Unable to find image 'python:3.11-alpine' locally\n";
			details.exit_code = 125;
		}
		return details;
	};

	BOOST_CHECK_THROW(run("python", "print(1)"), InfrastructureException);
	BOOST_CHECK(launcher->calls_of("exec").empty());
	BOOST_CHECK_EQUAL(launcher->calls_of("rm").size(), 1u);
	BOOST_CHECK_EQUAL(workspaces->live_count(), 0u);
}

BOOST_AUTO_TEST_CASE(missing_tool_in_image_is_infrastructure_error)
{
	launcher->respond = [](const std::string & subcommand, const ExecuteArgs & args) {
		ProtectedProcessDetails details = RecordingLauncher::succeed(subcommand, args);
		if (subcommand == "exec") {
			details.output.clear();
			details.error = "OCI runtime exec failed: exec failed: unable to start container process: "
					"exec: \"Rscript\": executable file not found in $PATH: unknown\n";
			details.exit_code = 127;
		}
		return details;
	};

	try {
		run("r", "print(1)");
		BOOST_FAIL("missing tool should throw");
	} catch (const InfrastructureException & e) {
		BOOST_CHECK(boost::algorithm::contains(e.what(), "Rscript"));
	}
	BOOST_CHECK_EQUAL(launcher->calls_of("rm").size(), 1u);
}

BOOST_AUTO_TEST_CASE(missing_docker_cli_is_infrastructure_error)
{
	launcher->docker_installed = false;

	BOOST_CHECK_THROW(run("python", "print(1)"), InfrastructureException);
	BOOST_CHECK(launcher->calls.empty());
}

BOOST_AUTO_TEST_CASE(configured_image_overrides_default)
{
	container_settings.images["python"] = "registry.local/python-sandbox:3.12";

	run("python", "print(1)");

	BOOST_CHECK(contains_arg(launcher->calls_of("run")[0].args, "registry.local/python-sandbox:3.12"));

	ContainerBackend backend(container_settings, launcher);
	BOOST_CHECK_EQUAL(backend.image_for(LanguageRegistry::builtin().lookup("python")), "registry.local/python-sandbox:3.12");
	BOOST_CHECK_EQUAL(backend.image_for(LanguageRegistry::builtin().lookup("go")), "golang:1.22-alpine");
}

BOOST_AUTO_TEST_SUITE_END()
