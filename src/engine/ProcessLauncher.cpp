/*
 * ProcessLauncher.cpp
 *
 *  Created on: 2026年10月14日
 */

#include "ProcessLauncher.hpp"

#include <unistd.h>

#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <boost/filesystem.hpp>

namespace
{
	bool is_executable_file(const boost::filesystem::path & p)
	{
		boost::system::error_code ec;
		return boost::filesystem::is_regular_file(p, ec) && ::access(p.c_str(), X_OK) == 0;
	}

} /* namespace */

ProtectedProcessDetails PosixProcessLauncher::launch(const ExecuteArgs & args, const ProtectedProcessConfig & config, const ExecuteArgs & env)
{
	return protected_process(args, config, env);
}

PosixProcessLauncher::optional<std::string>
PosixProcessLauncher::resolve_executable(const std::string & program, const std::string & search_path) const
{
	if (program.find('/') != std::string::npos) {
		if (is_executable_file(program)) {
			return program;
		}
		return optional<std::string>();
	}

	std::vector<std::string> dirs;
	boost::algorithm::split(dirs, search_path, boost::algorithm::is_any_of(":"));
	for (const std::string & dir : dirs) {
		if (dir.empty()) {
			continue;
		}
		boost::filesystem::path candidate = boost::filesystem::path(dir) / program;
		if (is_executable_file(candidate)) {
			return candidate.string();
		}
	}
	return optional<std::string>();
}
