/*
 * ProtectedProcessTest.cpp
 *
 *  Created on: 2026年10月18日
 */

#define BOOST_TEST_MODULE ProtectedProcessTest
#include <boost/test/unit_test.hpp>

#include <atomic>
#include <thread>

#include <errno.h>
#include <signal.h>
#include <sys/socket.h>
#include <sys/wait.h>
#include <unistd.h>

#include <kerbal/compatibility/chrono_suffix.hpp>

#include "ProtectedProcess.hpp"
#include "Watchdog.hpp"
#include "logger.hpp"
#include "process.hpp"
#include "runner_exceptions.hpp"
#include "seccomp_rules.hpp"

using namespace kerbal::compatibility::chrono_suffix;

namespace fs = boost::filesystem;

namespace
{
	const ExecuteArgs default_env = { "PATH=/usr/local/bin:/usr/bin:/bin" };

	ExecuteArgs shell(const std::string & script)
	{
		return ExecuteArgs { "/bin/sh", "-c", script };
	}

	struct ScratchDir
	{
			fs::path dir;

			ScratchDir() :
					dir(fs::temp_directory_path() / fs::unique_path("ts_runner_pp_test_%%%%%%%%"))
			{
				ts_runner::log::set_console_echo(false);
				fs::create_directories(dir);
			}

			~ScratchDir()
			{
				boost::system::error_code ec;
				fs::remove_all(dir, ec);
			}
	};

	/**
	 * @brief 在新进程组中执行 sleep, 供看门狗测试使用
	 */
	process spawn_sleep(const char * seconds)
	{
		return process([seconds]() noexcept {
			::execl("/bin/sleep", "sleep", seconds, static_cast<char *>(nullptr));
		});
	}

} /* namespace */

BOOST_AUTO_TEST_SUITE(protected_process_suite)

BOOST_AUTO_TEST_CASE(captures_streams_and_exit_code)
{
	ProtectedProcessConfig config;
	ProtectedProcessDetails details = protected_process(shell("echo hello; echo oops >&2; exit 3"), config, default_env);

	BOOST_CHECK(details.running_result == ProtectedProcessResult::EXITED);
	BOOST_CHECK_EQUAL(details.exit_code, 3);
	BOOST_CHECK_EQUAL(details.output, "hello\n");
	BOOST_CHECK_EQUAL(details.error, "oops\n");
	BOOST_CHECK(!details.truncated);
}

BOOST_AUTO_TEST_CASE(feeds_stdin_then_closes_it)
{
	ProtectedProcessConfig config;
	config.set_input_data("line one\nline two\n");

	ProtectedProcessDetails details = protected_process( { "/bin/cat" }, config, default_env);

	BOOST_CHECK_EQUAL(details.exit_code, 0);
	BOOST_CHECK_EQUAL(details.output, "line one\nline two\n");
}

BOOST_AUTO_TEST_CASE(empty_stdin_reads_eof)
{
	ProtectedProcessConfig config;
	ProtectedProcessDetails details = protected_process( { "/bin/cat" }, config, default_env);

	BOOST_CHECK(details.running_result == ProtectedProcessResult::EXITED);
	BOOST_CHECK_EQUAL(details.output, "");
}

BOOST_AUTO_TEST_CASE(environment_and_working_dir_are_explicit)
{
	ScratchDir scratch;
	ProtectedProcessConfig config(scratch.dir);
	ExecuteArgs env = default_env;
	env.push_back("GREETING=bonjour");

	ProtectedProcessDetails details = protected_process(shell("echo $GREETING; pwd"), config, env);

	BOOST_CHECK_EQUAL(details.output, "bonjour\n" + fs::canonical(scratch.dir).string() + "\n");
}

BOOST_AUTO_TEST_CASE(wall_clock_deadline_kills_process_group)
{
	ProtectedProcessConfig config;
	config.set_deadline(ProtectedProcessConfig::clock::now() + 500_ms);

	// 后台的 sleep 与前台的 sleep 属于同一进程组, 都应被杀死
	ProtectedProcessDetails details = protected_process(shell("sleep 30 & sleep 30"), config, default_env);

	BOOST_CHECK(details.running_result == ProtectedProcessResult::REAL_TIME_LIMIT_EXCEEDED);
	BOOST_CHECK(details.real_time < std::chrono::milliseconds(5000));
	BOOST_CHECK_EQUAL(details.term_signal, SIGKILL);
}

BOOST_AUTO_TEST_CASE(cancel_predicate_terminates_process)
{
	std::atomic<bool> canceled(false);
	ProtectedProcessConfig config;
	config.set_deadline(ProtectedProcessConfig::clock::now() + 20_s)
			.set_cancel_predicate([&canceled]() {
				return canceled.load();
			})
			.set_cancel_grace(200_ms);

	std::thread canceler([&canceled]() {
		std::this_thread::sleep_for(300_ms);
		canceled = true;
	});
	ProtectedProcessDetails details = protected_process(shell("echo started; sleep 30"), config, default_env);
	canceler.join();

	BOOST_CHECK(details.running_result == ProtectedProcessResult::CANCELED);
	BOOST_CHECK_EQUAL(details.output, "started\n");
	BOOST_CHECK(details.real_time < std::chrono::milliseconds(10000));
}

BOOST_AUTO_TEST_CASE(output_is_truncated_at_limit)
{
	ProtectedProcessConfig config;
	config.set_max_output_size(1000);

	ProtectedProcessDetails details = protected_process(shell("head -c 100000 /dev/zero | tr '\\0' 'a'"), config, default_env);

	BOOST_CHECK(details.truncated);
	BOOST_CHECK_EQUAL(details.output.size(), 1000u);
	BOOST_CHECK_EQUAL(details.exit_code, 0);
}

BOOST_AUTO_TEST_CASE(signal_death_is_reported)
{
	ProtectedProcessConfig config;
	ProtectedProcessDetails details = protected_process(shell("kill -9 $$"), config, default_env);

	BOOST_CHECK(details.running_result == ProtectedProcessResult::SIGNALED);
	BOOST_CHECK_EQUAL(details.term_signal, SIGKILL);
	BOOST_CHECK_EQUAL(details.exit_code, 128 + SIGKILL);
}

BOOST_AUTO_TEST_CASE(file_size_limit_applies)
{
	ScratchDir scratch;
	ProtectedProcessConfig config(scratch.dir);
	StepLimits limits;
	limits.max_file_size_bytes = StepLimits::optional<std::uint64_t>(4096);
	config.set_limits(limits);

	ProtectedProcessDetails details = protected_process(shell("exec head -c 1048576 /dev/zero > big"), config, default_env);

	BOOST_CHECK(details.running_result == ProtectedProcessResult::SIGNALED);
	BOOST_CHECK_EQUAL(details.term_signal, SIGXFSZ);
	BOOST_CHECK(fs::file_size(scratch.dir / "big") <= 4096u);
}

BOOST_AUTO_TEST_CASE(missing_executable_is_infrastructure_error)
{
	ProtectedProcessConfig config;
	BOOST_CHECK_THROW(protected_process( { "/nonexistent/ts_runner/interpreter" }, config, default_env), InfrastructureException);
	BOOST_CHECK_THROW(protected_process(ExecuteArgs(), config, default_env), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(missing_working_dir_is_setup_error)
{
	ProtectedProcessConfig config("/nonexistent/ts_runner/workdir");
	BOOST_CHECK_THROW(protected_process(shell("true"), config, default_env), ChildSetupException);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(watchdog_suite)

BOOST_AUTO_TEST_CASE(fires_at_deadline)
{
	process child = spawn_sleep("30");
	Watchdog watchdog(child.get_child_id(), Watchdog::clock::now() + 200_ms, nullptr, 100_ms);

	int status = 0;
	BOOST_REQUIRE_EQUAL(child.join(&status, 0, nullptr), child.get_child_id());
	watchdog.disarm();

	BOOST_CHECK(WIFSIGNALED(status));
	BOOST_CHECK_EQUAL(WTERMSIG(status), SIGKILL);
	BOOST_CHECK(watchdog.fired() == Termination::TIMED_OUT);
}

BOOST_AUTO_TEST_CASE(cancel_sends_sigterm_first)
{
	process child = spawn_sleep("30");
	Watchdog watchdog(child.get_child_id(), Watchdog::clock::now() + 20_s, []() {
		return true;
	}, 2_s, 50_ms);

	int status = 0;
	BOOST_REQUIRE_EQUAL(child.join(&status, 0, nullptr), child.get_child_id());
	watchdog.disarm();

	BOOST_CHECK(WIFSIGNALED(status));
	BOOST_CHECK_EQUAL(WTERMSIG(status), SIGTERM);
	BOOST_CHECK(watchdog.fired() == Termination::CANCELED);
}

BOOST_AUTO_TEST_CASE(failing_cancel_predicate_does_not_cancel)
{
	process child = spawn_sleep("30");
	Watchdog watchdog(child.get_child_id(), Watchdog::clock::now() + 300_ms, []() -> bool {
		throw std::runtime_error("store unreachable");
	}, 100_ms, 50_ms);

	int status = 0;
	BOOST_REQUIRE_EQUAL(child.join(&status, 0, nullptr), child.get_child_id());
	watchdog.disarm();

	BOOST_CHECK(watchdog.fired() == Termination::TIMED_OUT);
}

BOOST_AUTO_TEST_CASE(disarmed_watchdog_never_fires)
{
	process child = spawn_sleep("1");
	{
		Watchdog watchdog(child.get_child_id(), Watchdog::clock::now() + 100_ms, nullptr, 100_ms);
		watchdog.disarm();
		BOOST_CHECK(watchdog.fired() == Termination::COMPLETED);
	}

	int status = 0;
	BOOST_REQUIRE_EQUAL(child.join(&status, 0, nullptr), child.get_child_id());
	BOOST_CHECK(WIFEXITED(status));
	BOOST_CHECK_EQUAL(WEXITSTATUS(status), 0);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(seccomp_suite)

BOOST_AUTO_TEST_CASE(programs_are_built_once_per_policy)
{
	BOOST_CHECK(SeccompProgram::for_policy(SeccompPolicy::NONE).empty());

	const SeccompProgram & no_network = SeccompProgram::for_policy(SeccompPolicy::NO_NETWORK);
	BOOST_CHECK(!no_network.empty());
	BOOST_CHECK(&no_network == &SeccompProgram::for_policy(SeccompPolicy::NO_NETWORK));
}

BOOST_AUTO_TEST_CASE(loaded_program_blocks_inet_sockets_only)
{
	const SeccompProgram & program = SeccompProgram::for_policy(SeccompPolicy::NO_NETWORK);

	// 子进程中只调用 load 与 socket, 用退出码报告每一步的结果
	process child([&program]() noexcept {
		if (program.load() != 0) {
			_exit(2);
		}
		if (::socket(AF_UNIX, SOCK_STREAM, 0) < 0) {
			_exit(3);
		}
		if (::socket(AF_INET, SOCK_STREAM, 0) >= 0 || errno != EACCES) {
			_exit(4);
		}
		_exit(0);
	});

	int status = 0;
	BOOST_REQUIRE_EQUAL(child.join(&status, 0, nullptr), child.get_child_id());
	BOOST_REQUIRE(WIFEXITED(status));
	BOOST_CHECK_EQUAL(WEXITSTATUS(status), 0);
}

BOOST_AUTO_TEST_CASE(protected_child_runs_under_filter)
{
	ProtectedProcessConfig config;
	config.set_seccomp_policy(SeccompPolicy::NO_NETWORK);

	ProtectedProcessDetails details = protected_process(shell("echo filtered"), config, default_env);

	BOOST_CHECK(details.running_result == ProtectedProcessResult::EXITED);
	BOOST_CHECK_EQUAL(details.exit_code, 0);
	BOOST_CHECK_EQUAL(details.output, "filtered\n");
}

BOOST_AUTO_TEST_SUITE_END()
